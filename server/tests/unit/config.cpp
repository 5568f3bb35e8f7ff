#include <fnrun/common/exceptions.hpp>
#include <fnrun/server/config.hpp>

#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace fnrun::server::config;

TEST(Config, BasicConfig)
{
  std::string config = R"(
    {
      "verbose": true
    }
  )";

  std::stringstream stream{config};
  Config cfg = Config::deserialize(stream);

  EXPECT_EQ(cfg.verbose, true);
  EXPECT_EQ(cfg.public_url, Config::DEFAULT_PUBLIC_URL);

  EXPECT_EQ(cfg.http.port, HTTPServer::DEFAULT_PORT);
  EXPECT_EQ(cfg.http.threads, HTTPServer::DEFAULT_THREADS_NUMBER);
  EXPECT_EQ(cfg.http.max_payload_size, HTTPServer::DEFAULT_MAX_PAYLOAD_SIZE);

  EXPECT_EQ(cfg.workers.threads, Workers::DEFAULT_THREADS_NUMBER);

  EXPECT_EQ(cfg.sandbox.executable, "");
  EXPECT_EQ(cfg.sandbox.wall_time_ms, fnrun::sandbox::Limits::DEFAULT_WALL_TIME_MS);
  EXPECT_EQ(cfg.sandbox.memory_mb, fnrun::sandbox::Limits::DEFAULT_MEMORY_MB);
  EXPECT_EQ(cfg.sandbox.environment, Sandbox::default_environment());
  EXPECT_EQ(cfg.sandbox.allowed_modules, Sandbox::default_allowed_modules());
  for (const std::string leaks_sys : {"collections", "typing", "dataclasses", "enum", "datetime"}) {
    EXPECT_THAT(cfg.sandbox.allowed_modules, testing::Not(testing::Contains(leaks_sys)));
  }

  EXPECT_FALSE(cfg.rate_limit.enabled);
  EXPECT_EQ(cfg.rate_limit.deploy.max, 10);
  EXPECT_EQ(cfg.rate_limit.deploy.window, 900);
  EXPECT_EQ(cfg.rate_limit.execute.max, 0);
}

TEST(Config, HTTPConfig)
{
  std::string config = R"(
    {
      "public-url": "https://functions.example.com//",
      "http": {
        "threads": 2,
        "port": 1000
      }
    }
  )";

  std::stringstream stream{config};
  Config cfg = Config::deserialize(stream);

  EXPECT_EQ(cfg.http.port, 1000);
  EXPECT_EQ(cfg.http.threads, 2);
  EXPECT_EQ(cfg.http.max_payload_size, HTTPServer::DEFAULT_MAX_PAYLOAD_SIZE);
  EXPECT_EQ(cfg.public_url, "https://functions.example.com");
}

TEST(Config, SandboxConfig)
{
  std::string config = R"(
    {
      "workers": {
        "threads": 8
      },
      "sandbox": {
        "wall_time_ms": 2500,
        "cpu_time_s": 2,
        "memory_mb": 128,
        "environment": ["PATH=/bin"],
        "allowed_modules": ["math"]
      }
    }
  )";

  std::stringstream stream{config};
  Config cfg = Config::deserialize(stream);

  EXPECT_EQ(cfg.workers.threads, 8);
  EXPECT_EQ(cfg.sandbox.environment, std::vector<std::string>{"PATH=/bin"});
  EXPECT_EQ(cfg.sandbox.allowed_modules, std::vector<std::string>{"math"});
  EXPECT_EQ(cfg.sandbox.max_open_files, fnrun::sandbox::Limits::DEFAULT_MAX_OPEN_FILES);

  fnrun::sandbox::Limits limits = cfg.sandbox.limits();
  EXPECT_EQ(limits.wall_time, std::chrono::milliseconds{2500});
  EXPECT_EQ(limits.cpu_time_s, 2);
  EXPECT_EQ(limits.memory_mb, 128u);
  EXPECT_EQ(limits.max_result_bytes, fnrun::sandbox::Limits::DEFAULT_MAX_RESULT_BYTES);
}

TEST(Config, RateLimitConfig)
{
  std::string config = R"(
    {
      "rate-limit": {
        "enabled": true,
        "execute": {
          "max": 100
        },
        "read": {
          "max": 5,
          "window": 10
        }
      }
    }
  )";

  std::stringstream stream{config};
  Config cfg = Config::deserialize(stream);

  EXPECT_TRUE(cfg.rate_limit.enabled);
  EXPECT_EQ(cfg.rate_limit.cleanup_interval, RateLimit::DEFAULT_CLEANUP_INTERVAL);
  EXPECT_EQ(cfg.rate_limit.deploy.max, 10);
  EXPECT_EQ(cfg.rate_limit.execute.max, 100);
  EXPECT_EQ(cfg.rate_limit.execute.window, 60);
  EXPECT_EQ(cfg.rate_limit.read.max, 5);
  EXPECT_EQ(cfg.rate_limit.read.window, 10);
}

TEST(Config, InvalidValues)
{
  {
    std::string config = R"(
      {
        "workers": {
          "threads": 0
        }
      }
    )";
    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), fnrun::common::InvalidConfigurationError);
  }

  {
    std::string config = R"(
      {
        "sandbox": {
          "wall_time_ms": -1
        }
      }
    )";
    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), fnrun::common::InvalidConfigurationError);
  }

  {
    std::string config = R"(
      {
        "rate-limit": {
          "deploy": {
            "max": 5,
            "window": 0
          }
        }
      }
    )";
    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), fnrun::common::InvalidConfigurationError);
  }

  {
    std::string config = R"(
      {
        "http": {
          "port": "not a number"
        }
      }
    )";
    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), fnrun::common::InvalidConfigurationError);
  }
}
