#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

namespace chunkvault::client
{

    // Blocking pause between attempts; tests substitute a fake.
    class Sleeper
    {
    public:
        virtual ~Sleeper() = default;
        virtual void sleep_for(std::chrono::milliseconds delay) = 0;
    };

    class ThreadSleeper : public Sleeper
    {
    public:
        void sleep_for(std::chrono::milliseconds delay) override;
    };

    // An initial attempt plus one retry per schedule entry. Retry n waits
    // schedule[n-1] first; a failure once the schedule is used up is final.
    class RetryPolicy
    {
    public:
        explicit RetryPolicy(std::vector<std::chrono::milliseconds> schedule);

        static RetryPolicy standard();

        std::size_t max_attempts() const noexcept { return schedule_.size() + 1; }

        // Delay to wait after attempt `attempt` (1-based) failed.
        std::chrono::milliseconds backoff_after(std::size_t attempt) const;

        bool should_retry(std::size_t attempt) const noexcept { return attempt <= schedule_.size(); }

    private:
        std::vector<std::chrono::milliseconds> schedule_;
    };

} // namespace chunkvault::client
