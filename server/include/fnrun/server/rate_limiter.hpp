#ifndef FNRUN_SERVER_RATE_LIMITER_HPP
#define FNRUN_SERVER_RATE_LIMITER_HPP

#include <fnrun/server/config.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace fnrun::server::rate_limiter {

  enum class Rule { DEPLOY = 0, EXECUTE, READ };

  std::string_view rule_to_string(Rule rule);

  struct Decision {

    using clock_t = std::chrono::system_clock;

    bool allowed;

    // Zero when the rule is unlimited.
    int limit;
    int remaining;
    clock_t::time_point reset;

    std::string message;

    // Seconds until the window resets, at least one.
    int64_t retry_after(clock_t::time_point now) const;

    // Unix timestamp of the reset.
    int64_t reset_epoch() const;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Fixed-window request counters per client and per rule.
  ///
  /// Counters live in memory only. A background thread purges expired windows
  /// every cleanup interval.
  ////////////////////////////////////////////////////////////////////////////////
  class RateLimiter {
  public:
    using clock_t = Decision::clock_t;

    RateLimiter(const config::RateLimit& cfg);

    ~RateLimiter()
    {
      shutdown();
      wait();
    }

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter(RateLimiter&&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;
    RateLimiter& operator=(RateLimiter&&) = delete;

    void run();

    void shutdown();

    void wait();

    bool enabled() const
    {
      return _enabled;
    }

    // Counts the request and tells whether it may proceed.
    Decision check(Rule rule, const std::string& client, clock_t::time_point now = clock_t::now());

    // Removes all windows that ended before now.
    size_t purge(clock_t::time_point now = clock_t::now());

    size_t size() const;

  private:
    struct Window {
      int count;
      clock_t::time_point reset;
    };

    const config::RateLimitRule& _rule(Rule rule) const;

    void _cleanup();

    bool _enabled;
    std::chrono::seconds _cleanup_interval;
    std::array<config::RateLimitRule, 3> _rules;

    mutable std::mutex _mutex;
    std::unordered_map<std::string, Window> _windows;

    std::mutex _ending_mutex;
    std::condition_variable _ending_cv;
    std::atomic<bool> _ending{false};

    std::thread _worker;
  };

} // namespace fnrun::server::rate_limiter

#endif
