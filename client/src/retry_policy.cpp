#include "chunkvault/client/retry_policy.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace chunkvault::client
{

    void ThreadSleeper::sleep_for(std::chrono::milliseconds delay)
    {
        std::this_thread::sleep_for(delay);
    }

    RetryPolicy::RetryPolicy(std::vector<std::chrono::milliseconds> schedule) : schedule_(std::move(schedule))
    {
        if (schedule_.empty())
        {
            throw std::invalid_argument("retry schedule must not be empty");
        }
        if (std::any_of(schedule_.begin(), schedule_.end(), [](auto delay)
                        { return delay.count() < 0; }))
        {
            throw std::invalid_argument("retry delays must not be negative");
        }
    }

    RetryPolicy RetryPolicy::standard()
    {
        using namespace std::chrono_literals;
        return RetryPolicy({1s, 2s, 5s, 10s});
    }

    std::chrono::milliseconds RetryPolicy::backoff_after(std::size_t attempt) const
    {
        if (attempt == 0 || attempt > schedule_.size())
        {
            throw std::out_of_range("attempt outside retry schedule");
        }
        return schedule_[attempt - 1];
    }

} // namespace chunkvault::client
