#include "../mocks.hpp"

#include <localfn/common/shutdown.hpp>
#include <localfn/scheduler/scheduler.hpp>

#include <chrono>
#include <future>
#include <stdexcept>

#include <gtest/gtest.h>

class SchedulerTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    commands = std::make_shared<testing::NiceMock<MockCommandBuilder>>();
    metadata = std::make_shared<testing::NiceMock<MockMetadataSource>>();

    setup_mocks(*commands, "sleep 30");
    setup_mocks(*metadata);
  }

  static bool ready(std::future<response_t>& result)
  {
    return result.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
  }

  config::Scheduler cfg;
  std::shared_ptr<testing::NiceMock<MockCommandBuilder>> commands;
  std::shared_ptr<testing::NiceMock<MockMetadataSource>> metadata;
  localfn::common::ShutdownSignal shutdown;
};

TEST_F(SchedulerTest, DeliverInvocations)
{
  EXPECT_CALL(*commands, build(testing::_)).Times(1);

  Scheduler scheduler{cfg, commands, metadata, shutdown};
  scheduler.start();

  std::future<response_t> results[3];
  scheduler.submit(make_invocation("orders", "r1", results[0]));
  scheduler.submit(make_invocation("orders", "r2", results[1]));
  scheduler.submit(make_invocation("orders", "r3", results[2]));

  // Invocations are handed out in submission order.
  for (const auto& id : {"r1", "r2", "r3"}) {
    std::optional<Invocation> invoc;
    ASSERT_TRUE(wait_for([&]() {
      invoc = scheduler.next_invocation("orders");
      return invoc.has_value();
    }));
    EXPECT_EQ(invoc->request_id, id);
    EXPECT_EQ(invoc->function_name, "orders");
  }
  EXPECT_FALSE(scheduler.next_invocation("orders").has_value());

  EXPECT_EQ(scheduler.requests().size(), 1);
  EXPECT_EQ(scheduler.responses().size(), 3);
  EXPECT_EQ(scheduler.active_supervisors(), 1);

  scheduler.shutdown();
  scheduler.wait();

  EXPECT_EQ(scheduler.active_supervisors(), 0);
}

TEST_F(SchedulerTest, Resolve)
{
  Scheduler scheduler{cfg, commands, metadata, shutdown};
  scheduler.start();

  std::future<response_t> result;
  scheduler.submit(make_invocation("orders", "r1", result));

  std::optional<Invocation> invoc;
  ASSERT_TRUE(wait_for([&]() {
    invoc = scheduler.next_invocation("orders");
    return invoc.has_value();
  }));

  auto response = drogon::HttpResponse::newHttpResponse();
  response->setStatusCode(drogon::k200OK);
  response->setBody("processed");

  EXPECT_TRUE(scheduler.resolve("r1", response));
  ASSERT_TRUE(ready(result));
  EXPECT_EQ(result.get()->body(), "processed");

  // Each invocation is answered once.
  EXPECT_FALSE(scheduler.resolve("r1", response));
  EXPECT_FALSE(scheduler.resolve("unknown", response));
  EXPECT_EQ(scheduler.responses().size(), 0);
}

TEST_F(SchedulerTest, ProcessExit)
{
  EXPECT_CALL(*commands, build(testing::_))
      .Times(2)
      .WillRepeatedly(testing::Return(shell_command("exit 1")));

  Scheduler scheduler{cfg, commands, metadata, shutdown};
  scheduler.start();

  // Invocations left in the queue of an exited process are failed.
  std::future<response_t> first;
  scheduler.submit(make_invocation("orders", "r1", first));
  ASSERT_TRUE(ready(first));
  EXPECT_EQ(first.get()->getStatusCode(), drogon::k502BadGateway);
  EXPECT_FALSE(scheduler.requests().contains("orders"));

  // The next invocation starts the function again.
  std::future<response_t> second;
  scheduler.submit(make_invocation("orders", "r2", second));
  ASSERT_TRUE(ready(second));
  EXPECT_EQ(second.get()->getStatusCode(), drogon::k502BadGateway);
}

TEST_F(SchedulerTest, SpawnFailure)
{
  EXPECT_CALL(*commands, build(testing::_))
      .WillOnce(testing::Return(Command{{"/nonexistent/localfn-function"}}));

  Scheduler scheduler{cfg, commands, metadata, shutdown};
  scheduler.start();

  std::future<response_t> result;
  scheduler.submit(make_invocation("orders", "r1", result));

  ASSERT_TRUE(ready(result));
  auto response = result.get();
  EXPECT_EQ(response->getStatusCode(), drogon::k502BadGateway);

  auto json = response->getJsonObject();
  ASSERT_TRUE(json);
  EXPECT_THAT((*json)["reason"].asString(), testing::HasSubstr("could not be started"));

  EXPECT_TRUE(wait_for([&]() { return !scheduler.requests().contains("orders"); }));
}

TEST_F(SchedulerTest, Prestart)
{
  EXPECT_CALL(*commands, build(testing::Eq(std::optional<std::string>{"orders"}))).Times(1);

  Scheduler scheduler{cfg, commands, metadata, shutdown};
  scheduler.start();

  EXPECT_TRUE(scheduler.prestart("orders"));
  EXPECT_FALSE(scheduler.prestart("orders"));
  EXPECT_TRUE(wait_for([&]() { return scheduler.active_supervisors() == 1; }));

  // The function is already running, the invocation only waits in its queue.
  scheduler.submit(make_invocation("orders", "r1"));

  std::optional<Invocation> invoc;
  ASSERT_TRUE(wait_for([&]() {
    invoc = scheduler.next_invocation("orders");
    return invoc.has_value();
  }));
  EXPECT_EQ(invoc->request_id, "r1");
}

TEST_F(SchedulerTest, Shutdown)
{
  Scheduler scheduler{cfg, commands, metadata, shutdown};
  scheduler.start();

  // One invocation is handed to its process, the other one still waits in the queue.
  std::future<response_t> running;
  scheduler.submit(make_invocation("orders", "r1", running));
  ASSERT_TRUE(wait_for([&]() { return scheduler.next_invocation("orders").has_value(); }));

  std::future<response_t> queued;
  scheduler.submit(make_invocation("payments", "r2", queued));
  ASSERT_TRUE(wait_for([&]() { return scheduler.active_supervisors() == 2; }));
  EXPECT_TRUE(scheduler.requests().contains("payments"));

  auto start = std::chrono::steady_clock::now();
  scheduler.shutdown();
  scheduler.wait();

  // Processes are killed and not waited for.
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  EXPECT_EQ(scheduler.active_supervisors(), 0);

  // Every caller still waiting is answered.
  ASSERT_TRUE(ready(running));
  EXPECT_EQ(running.get()->getStatusCode(), drogon::k503ServiceUnavailable);
  ASSERT_TRUE(ready(queued));
  EXPECT_EQ(queued.get()->getStatusCode(), drogon::k503ServiceUnavailable);
  EXPECT_EQ(scheduler.requests().size(), 0);
  EXPECT_EQ(scheduler.responses().size(), 0);

  // Submissions after shutdown are rejected.
  std::future<response_t> result;
  scheduler.submit(make_invocation("orders", "r3", result));
  ASSERT_TRUE(ready(result));
  EXPECT_EQ(result.get()->getStatusCode(), drogon::k503ServiceUnavailable);
}

TEST_F(SchedulerTest, FailingCallback)
{
  EXPECT_CALL(*commands, build(testing::_))
      .Times(2)
      .WillRepeatedly(testing::Return(shell_command("exit 1")));

  std::promise<void> called;

  Scheduler scheduler{cfg, commands, metadata, shutdown};
  scheduler.start();

  auto invoc = make_invocation("orders", "r1");
  invoc.callback = [&called](const response_t&) {
    called.set_value();
    throw std::runtime_error("caller is gone");
  };
  scheduler.submit(std::move(invoc));

  auto result = called.get_future();
  ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);

  // The error of the callback does not stop the scheduler.
  ASSERT_TRUE(wait_for([&]() { return !scheduler.requests().contains("orders"); }));
  std::future<response_t> second;
  scheduler.submit(make_invocation("orders", "r2", second));
  ASSERT_TRUE(ready(second));
  EXPECT_EQ(second.get()->getStatusCode(), drogon::k502BadGateway);
}

TEST_F(SchedulerTest, CommandBuilderFailure)
{
  EXPECT_CALL(*commands, build(testing::_))
      .WillOnce(testing::Throw(std::runtime_error("missing build tool")))
      .WillRepeatedly(testing::Return(shell_command("sleep 30")));

  Scheduler scheduler{cfg, commands, metadata, shutdown};
  scheduler.start();

  std::future<response_t> first;
  scheduler.submit(make_invocation("orders", "r1", first));
  ASSERT_TRUE(ready(first));
  auto response = first.get();
  EXPECT_EQ(response->getStatusCode(), drogon::k502BadGateway);

  auto json = response->getJsonObject();
  ASSERT_TRUE(json);
  EXPECT_THAT((*json)["reason"].asString(), testing::HasSubstr("could not be started"));

  // The failed function is dropped and the next invocation starts it again.
  ASSERT_TRUE(wait_for([&]() { return !scheduler.requests().contains("orders"); }));
  scheduler.submit(make_invocation("orders", "r2"));

  std::optional<Invocation> invoc;
  ASSERT_TRUE(wait_for([&]() {
    invoc = scheduler.next_invocation("orders");
    return invoc.has_value();
  }));
  EXPECT_EQ(invoc->request_id, "r2");
}
