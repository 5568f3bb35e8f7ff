#include <fnrun/server/rate_limiter.hpp>

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fnrun::server::rate_limiter {

  std::string_view rule_to_string(Rule rule)
  {
    switch (rule) {
    case Rule::DEPLOY:
      return "deploy";
    case Rule::EXECUTE:
      return "execute";
    case Rule::READ:
      return "read";
    }
    return "";
  }

  namespace {

    std::string rule_message(Rule rule)
    {
      switch (rule) {
      case Rule::DEPLOY:
        return "Too many deployment attempts. Please wait before trying again.";
      case Rule::READ:
        return "Too many requests. Please wait a moment.";
      default:
        return "Too many requests. Please try again later.";
      }
    }

  } // namespace

  int64_t Decision::retry_after(clock_t::time_point now) const
  {
    auto secs = std::chrono::ceil<std::chrono::seconds>(reset - now).count();
    return std::max<int64_t>(secs, 1);
  }

  int64_t Decision::reset_epoch() const
  {
    return std::chrono::duration_cast<std::chrono::seconds>(reset.time_since_epoch()).count();
  }

  RateLimiter::RateLimiter(const config::RateLimit& cfg)
      : _enabled(cfg.enabled), _cleanup_interval(cfg.cleanup_interval),
        _rules{cfg.deploy, cfg.execute, cfg.read}
  {
  }

  void RateLimiter::run()
  {
    if (!_enabled) {
      return;
    }

    if (_worker.joinable()) {
      spdlog::error("Rate limiter thread is already running!");
      return;
    }
    _worker = std::thread(&RateLimiter::_cleanup, this);
  }

  void RateLimiter::shutdown()
  {
    {
      std::lock_guard<std::mutex> lock{_ending_mutex};
      _ending = true;
    }
    _ending_cv.notify_all();
  }

  void RateLimiter::wait()
  {
    if (_worker.joinable()) {
      _worker.join();
    }
  }

  const config::RateLimitRule& RateLimiter::_rule(Rule rule) const
  {
    return _rules[static_cast<int>(rule)];
  }

  Decision RateLimiter::check(Rule rule, const std::string& client, clock_t::time_point now)
  {
    const config::RateLimitRule& cfg = _rule(rule);
    if (!_enabled || cfg.max == 0) {
      return Decision{true, 0, 0, now, ""};
    }

    std::string key = fmt::format("{}:{}", rule_to_string(rule), client);

    std::lock_guard<std::mutex> lock{_mutex};

    auto it = _windows.find(key);
    if (it == _windows.end() || it->second.reset < now) {
      Window window{1, now + std::chrono::seconds{cfg.window}};
      _windows.insert_or_assign(key, window);
      return Decision{true, cfg.max, cfg.max - 1, window.reset, ""};
    }

    Window& window = it->second;
    window.count++;
    if (window.count > cfg.max) {
      spdlog::debug("Rate limit {} exceeded by client {}", rule_to_string(rule), client);
      return Decision{false, cfg.max, 0, window.reset, rule_message(rule)};
    }

    return Decision{true, cfg.max, cfg.max - window.count, window.reset, ""};
  }

  size_t RateLimiter::purge(clock_t::time_point now)
  {
    std::lock_guard<std::mutex> lock{_mutex};

    size_t removed = std::erase_if(_windows, [now](const auto& item) {
      return item.second.reset < now;
    });
    return removed;
  }

  size_t RateLimiter::size() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _windows.size();
  }

  void RateLimiter::_cleanup()
  {
    while (true) {

      {
        std::unique_lock<std::mutex> lock{_ending_mutex};
        if (_ending_cv.wait_for(lock, _cleanup_interval, [this]() { return _ending.load(); })) {
          break;
        }
      }

      size_t removed = purge();
      spdlog::debug("[RateLimiter] Removed {} expired windows", removed);
    }
  }

} // namespace fnrun::server::rate_limiter
