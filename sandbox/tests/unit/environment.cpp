#include <fnrun/common/exceptions.hpp>
#include <fnrun/sandbox/environment.hpp>

#include <cstring>

#include <gtest/gtest.h>

using namespace fnrun::sandbox;

TEST(Environment, FromEntries)
{
  auto env = Environment::from_entries({"PATH=/usr/bin", "EMPTY=", "EXPR=a=b", "PATH=/bin"});

  EXPECT_EQ(env.values().size(), 3);
  EXPECT_EQ(env.get("PATH").value(), "/bin");
  EXPECT_EQ(env.get("EMPTY").value(), "");
  EXPECT_EQ(env.get("EXPR").value(), "a=b");
  EXPECT_FALSE(env.get("HOME").has_value());
}

TEST(Environment, MalformedEntry)
{
  EXPECT_THROW(Environment::from_entries({"PATH"}), fnrun::common::InvalidConfigurationError);
  EXPECT_THROW(Environment::from_entries({"=value"}), fnrun::common::InvalidArgument);
}

TEST(Environment, InvalidValues)
{
  Environment env;
  EXPECT_THROW(env.set("", "value"), fnrun::common::InvalidArgument);
  EXPECT_THROW(env.set("A=B", "value"), fnrun::common::InvalidArgument);
  EXPECT_THROW(env.set("NAME", std::string{"a\0b", 3}), fnrun::common::InvalidArgument);

  EXPECT_TRUE(env.values().empty());
}

TEST(Environment, OverlayReplaces)
{
  auto base = Environment::from_entries({"LANG=C.UTF-8", "MODE=base"});

  Environment env = base;
  env.overlay({{"MODE", "overlay"}, {"API_KEY", "secret"}});

  EXPECT_EQ(env.get("MODE").value(), "overlay");
  EXPECT_EQ(env.get("API_KEY").value(), "secret");
  EXPECT_EQ(env.get("LANG").value(), "C.UTF-8");

  // The base set is a separate copy.
  EXPECT_EQ(base.get("MODE").value(), "base");
  EXPECT_FALSE(base.get("API_KEY").has_value());
}

TEST(Environment, Block)
{
  auto env = Environment::from_entries({"B=2", "A=1"});
  auto block = env.block();

  ASSERT_EQ(block.size(), 2);
  char** envp = block.envp();
  EXPECT_STREQ(envp[0], "A=1");
  EXPECT_STREQ(envp[1], "B=2");
  EXPECT_EQ(envp[2], nullptr);

  // Pointers stay valid after a move.
  auto moved = std::move(block);
  EXPECT_STREQ(moved.envp()[0], "A=1");
}

TEST(Environment, EmptyBlock)
{
  Environment env;
  auto block = env.block();

  EXPECT_EQ(block.size(), 0);
  EXPECT_EQ(block.envp()[0], nullptr);
}
