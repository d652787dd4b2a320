#include "../mocks.hpp"

#include <localfn/common/exceptions.hpp>
#include <localfn/common/shutdown.hpp>
#include <localfn/scheduler/supervisor.hpp>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>
#include <gtest/gtest.h>

class SupervisorTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    commands = std::make_shared<testing::NiceMock<MockCommandBuilder>>();
    metadata = std::make_shared<testing::NiceMock<MockMetadataSource>>();
    exits = std::make_shared<exit_channel_t>();

    setup_mocks(*metadata);
  }

  ProcessSupervisor supervisor(const std::string& function_name)
  {
    return ProcessSupervisor{
        function_name,
        fmt::format("127.0.0.1:9000/.rt/{}", function_name),
        "Cargo.toml",
        commands,
        metadata,
        exits,
        shutdown};
  }

  std::shared_ptr<testing::NiceMock<MockCommandBuilder>> commands;
  std::shared_ptr<testing::NiceMock<MockMetadataSource>> metadata;
  std::shared_ptr<exit_channel_t> exits;
  localfn::common::ShutdownSignal shutdown;
};

TEST_F(SupervisorTest, Command)
{
  EXPECT_CALL(*commands, build(testing::Eq(std::optional<std::string>{"orders"})))
      .WillOnce(testing::Return(shell_command("exit 0")));
  supervisor("orders").command();

  // Default package function lets the build tool select the binary.
  EXPECT_CALL(*commands, build(testing::Eq(std::nullopt)))
      .WillOnce(testing::Return(shell_command("exit 0")));
  supervisor(DEFAULT_PACKAGE_FUNCTION).command();
}

TEST_F(SupervisorTest, Environment)
{
  EXPECT_CALL(*metadata, environment("Cargo.toml", testing::Eq(std::optional<std::string>{"orders"})))
      .WillOnce(testing::Return(env_t{
          {"FUNCTION_VERSION", "7"},
          {"TABLE_NAME", "orders"},
          {"RUNTIME_API", "localhost:1/.rt/other"},
          {"FUNCTION_NAME", "other"}}));

  Environment base;
  base.set("HOME", "/home/user");
  base.set("FUNCTION_MEMORY_SIZE", "1");

  Environment env = supervisor("orders").environment(base);

  EXPECT_EQ(env.get("HOME"), "/home/user");
  EXPECT_TRUE(env.get(env::LOG_LEVEL).has_value());

  // Metadata can change the platform defaults, but not the routing variables.
  EXPECT_EQ(env.get(env::FUNCTION_VERSION), "7");
  EXPECT_EQ(env.get(env::FUNCTION_MEMORY_SIZE), env::DEFAULT_FUNCTION_MEMORY_SIZE);
  EXPECT_EQ(env.get("TABLE_NAME"), "orders");
  EXPECT_EQ(env.get(env::RUNTIME_API), "127.0.0.1:9000/.rt/orders");
  EXPECT_EQ(env.get(env::FUNCTION_NAME), "orders");
}

TEST_F(SupervisorTest, InvalidMetadata)
{
  EXPECT_CALL(*metadata, environment(testing::_, testing::_))
      .WillOnce(testing::Throw(localfn::common::InvalidConfigurationError{"incorrect manifest"}));

  Environment env = supervisor("orders").environment(Environment{});

  EXPECT_EQ(env.get(env::FUNCTION_VERSION), env::DEFAULT_FUNCTION_VERSION);
  EXPECT_EQ(env.get(env::FUNCTION_MEMORY_SIZE), env::DEFAULT_FUNCTION_MEMORY_SIZE);
  EXPECT_EQ(env.get(env::RUNTIME_API), "127.0.0.1:9000/.rt/orders");
}

TEST_F(SupervisorTest, ProcessExits)
{
  EXPECT_CALL(*commands, build(testing::_)).WillOnce(testing::Return(shell_command("exit 3")));

  supervisor("orders").run();

  auto exit = exits->try_receive();
  ASSERT_TRUE(exit.has_value());
  EXPECT_EQ(exit->function_name, "orders");
  EXPECT_EQ(exit->reason, FunctionExit::Reason::EXITED);
  EXPECT_EQ(exit->exit_code, 3);
  EXPECT_FALSE(exits->try_receive().has_value());
}

TEST_F(SupervisorTest, ProcessEnvironment)
{
  std::string path = testing::TempDir() + "localfn_supervisor_env";
  EXPECT_CALL(*commands, build(testing::_))
      .WillOnce(testing::Return(
          shell_command(fmt::format("echo -n \"$FUNCTION_NAME $RUNTIME_API\" > {}", path))
      ));

  supervisor("orders").run();

  std::ifstream in{path};
  std::string content;
  std::getline(in, content);
  EXPECT_EQ(content, "orders 127.0.0.1:9000/.rt/orders");

  std::remove(path.c_str());
}

TEST_F(SupervisorTest, SpawnFailure)
{
  EXPECT_CALL(*commands, build(testing::_))
      .WillOnce(testing::Return(Command{{"/nonexistent/localfn-function"}}));

  EXPECT_THROW(supervisor("orders").run(), localfn::common::SpawnError);

  auto exit = exits->try_receive();
  ASSERT_TRUE(exit.has_value());
  EXPECT_EQ(exit->function_name, "orders");
  EXPECT_EQ(exit->reason, FunctionExit::Reason::SPAWN_FAILED);
}

TEST_F(SupervisorTest, CommandFailure)
{
  EXPECT_CALL(*commands, build(testing::_))
      .WillOnce(testing::Throw(std::runtime_error("missing build tool")));

  EXPECT_THROW(supervisor("orders").run(), std::runtime_error);

  auto exit = exits->try_receive();
  ASSERT_TRUE(exit.has_value());
  EXPECT_EQ(exit->reason, FunctionExit::Reason::SPAWN_FAILED);
}

TEST_F(SupervisorTest, Shutdown)
{
  ON_CALL(*commands, build(testing::_)).WillByDefault(testing::Return(shell_command("sleep 30")));

  auto start = std::chrono::steady_clock::now();
  std::thread thread{[this]() { supervisor("orders").run(); }};

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  shutdown.trigger();
  thread.join();

  auto duration = std::chrono::steady_clock::now() - start;
  EXPECT_LT(duration, std::chrono::seconds(10));

  // Killed processes are not reported.
  EXPECT_FALSE(exits->try_receive().has_value());
}

TEST_F(SupervisorTest, ShutdownBeforeStart)
{
  EXPECT_CALL(*commands, build(testing::_)).Times(0);

  shutdown.trigger();
  supervisor("orders").run();

  EXPECT_FALSE(exits->try_receive().has_value());
}

TEST_F(SupervisorTest, ClosedChannel)
{
  EXPECT_CALL(*commands, build(testing::_)).WillOnce(testing::Return(shell_command("exit 0")));

  exits->close_channel();
  supervisor("orders").run();

  EXPECT_FALSE(exits->try_receive().has_value());
}
