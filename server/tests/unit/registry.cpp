#include <fnrun/common/exceptions.hpp>
#include <fnrun/server/registry.hpp>

#include <algorithm>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

using namespace fnrun::server;

TEST(DeploymentKey, Parse)
{
  DeploymentKey bare = DeploymentKey::parse("calculator");
  EXPECT_FALSE(bare.is_namespaced());
  EXPECT_EQ(bare.function_name, "calculator");
  EXPECT_EQ(bare.str(), "calculator");

  DeploymentKey key = DeploymentKey::parse("alice/tools/calculator");
  EXPECT_TRUE(key.is_namespaced());
  EXPECT_EQ(key.owner, "alice");
  EXPECT_EQ(key.repo, "tools");
  EXPECT_EQ(key.function_name, "calculator");
  EXPECT_EQ(key.str(), "alice/tools/calculator");
  EXPECT_EQ(key, DeploymentKey::namespaced("alice", "tools", "calculator"));

  EXPECT_THROW(DeploymentKey::parse(""), fnrun::common::InvalidArgument);
  EXPECT_THROW(DeploymentKey::parse("alice/calculator"), fnrun::common::InvalidArgument);
  EXPECT_THROW(DeploymentKey::parse("alice//calculator"), fnrun::common::InvalidArgument);
  EXPECT_THROW(DeploymentKey::parse("a/b/c/d"), fnrun::common::InvalidArgument);
  EXPECT_THROW(DeploymentKey::namespaced("", "tools", "f"), fnrun::common::InvalidArgument);
  EXPECT_THROW(DeploymentKey::bare(""), fnrun::common::InvalidArgument);
}

TEST(Registry, PutGet)
{
  Registry registry;
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(registry.get("calculator"), nullptr);

  auto record = registry.put(
      DeploymentKey::bare("calculator"), "def calculator():\n    return 1\n", {{"MODE", "test"}}
  );
  ASSERT_NE(record, nullptr);
  EXPECT_EQ(record->entry_point, "calculator");
  EXPECT_EQ(record->revision, 1);

  auto found = registry.get("calculator");
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->source, "def calculator():\n    return 1\n");
  EXPECT_EQ(found->env.at("MODE"), "test");
  EXPECT_EQ(registry.size(), 1u);

  // Lookups are exact on the key string.
  registry.put(DeploymentKey::namespaced("alice", "tools", "calculator"), "source", {});
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_NE(registry.get("alice/tools/calculator"), nullptr);
  EXPECT_EQ(registry.get("bob/tools/calculator"), nullptr);
  EXPECT_EQ(registry.get("Calculator"), nullptr);
}

TEST(Registry, Redeploy)
{
  Registry registry;
  auto first = registry.put(DeploymentKey::bare("f"), "def f():\n    return 1\n", {{"A", "1"}});
  auto second = registry.put(DeploymentKey::bare("f"), "def f():\n    return 2\n", {});

  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(second->revision, 2);

  auto found = registry.get("f");
  EXPECT_EQ(found->source, "def f():\n    return 2\n");
  EXPECT_TRUE(found->env.empty());

  // Records handed out before stay intact.
  EXPECT_EQ(first->source, "def f():\n    return 1\n");
  EXPECT_EQ(first->revision, 1);
}

TEST(Registry, List)
{
  Registry registry;
  registry.put(DeploymentKey::bare("a"), "", {});
  registry.put(DeploymentKey::bare("b"), "", {});
  registry.put(DeploymentKey::namespaced("o", "r", "a"), "", {});

  std::vector<std::string> keys = registry.list();
  std::sort(keys.begin(), keys.end());
  EXPECT_EQ(keys, (std::vector<std::string>{"a", "b", "o/r/a"}));
  EXPECT_EQ(registry.deployments().size(), 3u);
}

TEST(Registry, SchemaVersion)
{
  Registry registry;

  Deployment record;
  record.version = Deployment::SCHEMA_VERSION + 1;
  record.key = DeploymentKey::bare("future");
  record.entry_point = "future";
  registry.put(std::move(record));

  EXPECT_THROW(registry.get("future"), fnrun::common::FnRunException);
}

TEST(Registry, CreatedAt)
{
  Deployment record;
  record.created_at = std::chrono::system_clock::time_point{std::chrono::seconds{1714564800}};
  EXPECT_EQ(record.created_at_iso(), "2024-05-01T12:00:00Z");
}

TEST(Registry, Concurrent)
{
  Registry registry;

  constexpr int THREADS = 8;
  constexpr int PUTS = 100;
  std::vector<std::thread> threads;
  for (int i = 0; i < THREADS; ++i) {
    threads.emplace_back([&registry, i]() {
      for (int j = 0; j < PUTS; ++j) {
        registry.put(DeploymentKey::bare("shared"), std::to_string(j), {});
        registry.put(DeploymentKey::bare(fmt::format("f{}", i)), "", {});
        auto record = registry.get("shared");
        EXPECT_NE(record, nullptr);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(registry.size(), static_cast<size_t>(THREADS + 1));
  EXPECT_EQ(registry.get("shared")->revision, THREADS * PUTS);
  EXPECT_EQ(registry.get("f0")->revision, PUTS);
}
