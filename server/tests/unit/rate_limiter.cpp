#include <fnrun/server/config.hpp>
#include <fnrun/server/rate_limiter.hpp>

#include <chrono>
#include <thread>

#include <gtest/gtest.h>

using namespace fnrun::server;
using namespace fnrun::server::rate_limiter;

class RateLimiterTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    cfg.enabled = true;
    cfg.deploy = config::RateLimitRule{2, 900};
    cfg.execute = config::RateLimitRule{0, 60};
    cfg.read = config::RateLimitRule{3, 60};
  }

  config::RateLimit cfg;
  RateLimiter::clock_t::time_point now = RateLimiter::clock_t::now();
};

TEST_F(RateLimiterTest, Disabled)
{
  cfg.enabled = false;
  RateLimiter limiter{cfg};
  EXPECT_FALSE(limiter.enabled());

  for (int i = 0; i < 10; ++i) {
    Decision decision = limiter.check(Rule::READ, "client", now);
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.limit, 0);
  }
  EXPECT_EQ(limiter.size(), 0u);
}

TEST_F(RateLimiterTest, Limit)
{
  RateLimiter limiter{cfg};

  for (int i = 0; i < 3; ++i) {
    Decision decision = limiter.check(Rule::READ, "client", now + std::chrono::seconds{i});
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.limit, 3);
    EXPECT_EQ(decision.remaining, 2 - i);
    EXPECT_EQ(decision.reset, now + std::chrono::seconds{60});
  }

  Decision decision = limiter.check(Rule::READ, "client", now + std::chrono::seconds{10});
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.remaining, 0);
  EXPECT_EQ(decision.message, "Too many requests. Please wait a moment.");
  EXPECT_EQ(decision.retry_after(now + std::chrono::seconds{10}), 50);

  decision = limiter.check(Rule::DEPLOY, "client", now);
  EXPECT_TRUE(decision.allowed);
  decision = limiter.check(Rule::DEPLOY, "client", now);
  EXPECT_TRUE(decision.allowed);
  decision = limiter.check(Rule::DEPLOY, "client", now);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.message, "Too many deployment attempts. Please wait before trying again.");
}

TEST_F(RateLimiterTest, WindowReset)
{
  RateLimiter limiter{cfg};

  for (int i = 0; i < 4; ++i) {
    limiter.check(Rule::READ, "client", now);
  }
  EXPECT_FALSE(limiter.check(Rule::READ, "client", now + std::chrono::seconds{59}).allowed);

  Decision decision = limiter.check(Rule::READ, "client", now + std::chrono::seconds{61});
  EXPECT_TRUE(decision.allowed);
  EXPECT_EQ(decision.remaining, 2);
  EXPECT_EQ(decision.reset, now + std::chrono::seconds{121});
}

TEST_F(RateLimiterTest, UnlimitedRule)
{
  RateLimiter limiter{cfg};

  for (int i = 0; i < 100; ++i) {
    EXPECT_TRUE(limiter.check(Rule::EXECUTE, "client", now).allowed);
  }
  EXPECT_EQ(limiter.size(), 0u);
}

TEST_F(RateLimiterTest, SeparateCounters)
{
  RateLimiter limiter{cfg};

  for (int i = 0; i < 3; ++i) {
    limiter.check(Rule::READ, "first", now);
  }
  EXPECT_FALSE(limiter.check(Rule::READ, "first", now).allowed);
  EXPECT_TRUE(limiter.check(Rule::READ, "second", now).allowed);

  // Rules are counted independently for the same client.
  EXPECT_TRUE(limiter.check(Rule::DEPLOY, "first", now).allowed);
  EXPECT_EQ(limiter.size(), 3u);
}

TEST_F(RateLimiterTest, Purge)
{
  RateLimiter limiter{cfg};

  limiter.check(Rule::READ, "first", now);
  limiter.check(Rule::READ, "second", now);
  limiter.check(Rule::DEPLOY, "first", now);
  EXPECT_EQ(limiter.size(), 3u);

  EXPECT_EQ(limiter.purge(now + std::chrono::seconds{30}), 0u);
  EXPECT_EQ(limiter.purge(now + std::chrono::seconds{61}), 2u);
  EXPECT_EQ(limiter.size(), 1u);
  EXPECT_EQ(limiter.purge(now + std::chrono::seconds{901}), 1u);
  EXPECT_EQ(limiter.size(), 0u);
}

TEST_F(RateLimiterTest, RetryAfter)
{
  Decision decision{false, 3, 0, now + std::chrono::milliseconds{1500}, ""};
  EXPECT_EQ(decision.retry_after(now), 2);
  EXPECT_EQ(decision.retry_after(now + std::chrono::seconds{5}), 1);
}

TEST_F(RateLimiterTest, Cleanup)
{
  cfg.cleanup_interval = 1;
  RateLimiter limiter{cfg};

  limiter.check(Rule::READ, "client", now - std::chrono::seconds{120});
  EXPECT_EQ(limiter.size(), 1u);

  limiter.run();
  std::this_thread::sleep_for(std::chrono::milliseconds{1500});
  EXPECT_EQ(limiter.size(), 0u);

  auto start = std::chrono::steady_clock::now();
  limiter.shutdown();
  limiter.wait();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{1});
}
