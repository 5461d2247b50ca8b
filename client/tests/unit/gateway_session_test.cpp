#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "cord/gateway_session.hpp"
#include "test_fakes.hpp"

namespace {

using namespace std::chrono_literals;
using cord::GatewayState;
using cord::testing::FakeGatewayTransport;
using cord::testing::WaitFor;

nlohmann::json Hello(long long interval_ms) { return {{"op", 10}, {"d", {{"heartbeat_interval", interval_ms}}}}; }

nlohmann::json Dispatch(const std::string& event, std::uint64_t seq, nlohmann::json data) {
  return {{"op", 0}, {"t", event}, {"s", seq}, {"d", std::move(data)}};
}

nlohmann::json ReadyPayload() {
  return {{"session_id", "abc"},
          {"resume_gateway_url", "wss://resume.example"},
          {"user", {{"id", "10"}, {"username", "me"}, {"discriminator", "0001"}}},
          {"guilds",
           {{{"id", "100"},
             {"name", "guild"},
             {"channels", {{{"id", "200"}, {"type", 0}, {"name", "general"}}}},
             {"threads", {{{"id", "300"}, {"parent_id", "200"}, {"type", 11}, {"name", "talk"}}}}}}}};
}

class GatewaySessionTest : public ::testing::Test {
 protected:
  GatewaySessionTest() : work_guard(boost::asio::make_work_guard(ioc)) {}

  void SetUp() override {
    config.token = "token";
    config.gateway_url = "wss://gateway.example/?v=9&encoding=json";
    config.reconnect_base_delay = 10ms;
    config.reconnect_max_delay = 20ms;
    config.invalid_session_delay = 10ms;
    config.heartbeat_miss_limit = 2;

    transport = std::make_shared<FakeGatewayTransport>();
    store = std::make_shared<cord::EntityStore>();
    observability = std::make_shared<cord::Observability>(cord::LogLevel::kError);
    dispatcher = std::make_shared<cord::Dispatcher>(store, std::make_shared<cord::PendingRequests>(), observability);
    session = std::make_shared<cord::GatewaySession>(ioc, transport, dispatcher, store, config, observability);
    session->SetStateObserver([this](GatewayState, GatewayState to) {
      std::lock_guard<std::mutex> lock(states_mutex);
      states.push_back(to);
    });
    loop = std::thread([this]() { ioc.run(); });
  }

  void TearDown() override {
    session->Close();
    WaitFor([this]() { return session->State() == GatewayState::kDisconnected; });
    work_guard.reset();
    loop.join();
  }

  void ConnectAndReady() {
    session->Start();
    ASSERT_TRUE(WaitFor([this]() { return transport->ConnectCount() == 1; }));
    transport->Deliver(Hello(45000));
    ASSERT_TRUE(WaitFor([this]() { return transport->SentWithOp(2).size() == 1; }));
    transport->Deliver(Dispatch("READY", 1, ReadyPayload()));
    ASSERT_TRUE(WaitFor([this]() { return session->State() == GatewayState::kReady; }));
  }

  bool SawState(GatewayState state) {
    std::lock_guard<std::mutex> lock(states_mutex);
    for (auto s : states) {
      if (s == state) {
        return true;
      }
    }
    return false;
  }

  boost::asio::io_context ioc;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard;
  std::thread loop;
  cord::ClientConfig config;
  std::shared_ptr<FakeGatewayTransport> transport;
  std::shared_ptr<cord::EntityStore> store;
  std::shared_ptr<cord::Observability> observability;
  std::shared_ptr<cord::Dispatcher> dispatcher;
  std::shared_ptr<cord::GatewaySession> session;
  std::mutex states_mutex;
  std::vector<GatewayState> states;
};

TEST_F(GatewaySessionTest, HelloLeadsToIdentify) {
  session->Start();
  ASSERT_TRUE(WaitFor([this]() { return transport->ConnectCount() == 1; }));
  EXPECT_EQ(transport->Urls()[0], config.gateway_url);

  transport->Deliver(Hello(45000));
  ASSERT_TRUE(WaitFor([this]() { return transport->SentWithOp(2).size() == 1; }));
  auto identify = transport->SentWithOp(2)[0];
  EXPECT_EQ(identify["d"]["token"], "token");
  EXPECT_TRUE(identify["d"].contains("properties"));
  EXPECT_EQ(session->State(), GatewayState::kIdentifying);
  EXPECT_EQ(observability->Snapshot().identifies, 1u);
}

TEST_F(GatewaySessionTest, ReadyPopulatesCache) {
  ConnectAndReady();
  EXPECT_EQ(session->SessionId().value(), "abc");
  EXPECT_EQ(session->Sequence().value(), 1u);
  EXPECT_EQ(store->SelfId(), cord::Snowflake{10});
  EXPECT_NE(store->Guilds().Get(100), nullptr);
  EXPECT_NE(store->Threads().Get(300), nullptr);
  EXPECT_TRUE(SawState(GatewayState::kConnecting));
  EXPECT_TRUE(SawState(GatewayState::kIdentifying));
}

TEST_F(GatewaySessionTest, ResumesAfterConnectionDrop) {
  ConnectAndReady();
  auto thread_before = store->Threads().Get(300);
  auto channel_before = store->Channels().Get(200);
  auto self_before = store->Users().Get(10);

  transport->ServerClose(1006, "abnormal");
  ASSERT_TRUE(WaitFor([this]() { return transport->ConnectCount() == 2; }));
  EXPECT_TRUE(SawState(GatewayState::kReconnecting));
  EXPECT_EQ(transport->Urls()[1], "wss://resume.example/?v=9&encoding=json");

  transport->Deliver(Hello(45000));
  ASSERT_TRUE(WaitFor([this]() { return transport->SentWithOp(6).size() == 1; }));
  auto resume = transport->SentWithOp(6)[0];
  EXPECT_EQ(resume["d"]["session_id"], "abc");
  EXPECT_EQ(resume["d"]["seq"], 1);
  EXPECT_EQ(session->State(), GatewayState::kResuming);
  // identify는 처음 한 번뿐이다.
  EXPECT_EQ(transport->SentWithOp(2).size(), 1u);

  // 끊긴 동안 놓친 이벤트가 RESUMED 전에 재전송된다.
  transport->Deliver(Dispatch("THREAD_UPDATE", 2,
                              {{"id", "300"}, {"guild_id", "100"}, {"parent_id", "200"}, {"type", 11}, {"name", "renamed"}}));
  transport->Deliver(Dispatch("RESUMED", 3, nlohmann::json::object()));
  ASSERT_TRUE(WaitFor([this]() { return session->State() == GatewayState::kReady; }));

  auto thread_after = store->Threads().Get(300);
  ASSERT_NE(thread_after, nullptr);
  EXPECT_EQ(thread_after->name, "renamed");
  EXPECT_EQ(thread_before->name, "talk");
  EXPECT_EQ(store->Channels().Get(200).get(), channel_before.get());
  EXPECT_EQ(store->Users().Get(10).get(), self_before.get());
  EXPECT_EQ(dispatcher->LastSequence().value(), 3u);
  EXPECT_EQ(session->Sequence().value(), 3u);
  EXPECT_EQ(observability->Snapshot().resumes, 1u);
  EXPECT_EQ(observability->Snapshot().reconnects, 1u);
}

TEST_F(GatewaySessionTest, ServerReconnectRequestKeepsSession) {
  ConnectAndReady();
  transport->Deliver({{"op", 7}, {"d", nullptr}});
  ASSERT_TRUE(WaitFor([this]() { return transport->ConnectCount() == 2; }));
  auto codes = transport->CloseCodes();
  ASSERT_FALSE(codes.empty());
  EXPECT_EQ(codes.back(), 4000);
  EXPECT_EQ(session->SessionId().value(), "abc");
}

TEST_F(GatewaySessionTest, NonResumableInvalidSessionReidentifies) {
  ConnectAndReady();
  transport->Deliver({{"op", 9}, {"d", false}});
  ASSERT_TRUE(WaitFor([this]() { return transport->SentWithOp(2).size() == 2; }));
  EXPECT_EQ(store->Guilds().Size(), 0u);
  EXPECT_FALSE(session->SessionId().has_value());
  EXPECT_EQ(transport->SentWithOp(6).size(), 0u);

  transport->Deliver(Dispatch("READY", 1, ReadyPayload()));
  ASSERT_TRUE(WaitFor([this]() { return session->State() == GatewayState::kReady; }));
  EXPECT_NE(store->Guilds().Get(100), nullptr);
}

TEST_F(GatewaySessionTest, ResumableInvalidSessionRetriesResume) {
  ConnectAndReady();
  transport->Deliver({{"op", 9}, {"d", true}});
  ASSERT_TRUE(WaitFor([this]() { return transport->SentWithOp(6).size() == 1; }));
  EXPECT_NE(store->Guilds().Get(100), nullptr);
  EXPECT_EQ(transport->SentWithOp(2).size(), 1u);
}

TEST_F(GatewaySessionTest, FatalCloseStopsReconnecting) {
  ConnectAndReady();
  transport->ServerClose(4004, "Authentication failed.");
  ASSERT_TRUE(WaitFor([this]() { return session->State() == GatewayState::kDisconnected; }));
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(transport->ConnectCount(), 1u);
  EXPECT_FALSE(session->SessionId().has_value());
}

TEST_F(GatewaySessionTest, InvalidatingCloseCodeForcesIdentify) {
  ConnectAndReady();
  transport->ServerClose(4009, "Session timed out.");
  ASSERT_TRUE(WaitFor([this]() { return transport->ConnectCount() == 2; }));
  EXPECT_EQ(transport->Urls()[1], config.gateway_url);
  transport->Deliver(Hello(45000));
  ASSERT_TRUE(WaitFor([this]() { return transport->SentWithOp(2).size() == 2; }));
  EXPECT_EQ(transport->SentWithOp(6).size(), 0u);
}

TEST_F(GatewaySessionTest, MissedAcksTriggerReconnect) {
  session->Start();
  ASSERT_TRUE(WaitFor([this]() { return transport->ConnectCount() == 1; }));
  transport->Deliver(Hello(20));
  ASSERT_TRUE(WaitFor([this]() { return transport->ConnectCount() == 2; }));
  EXPECT_GE(transport->SentWithOp(1).size(), 2u);
  auto codes = transport->CloseCodes();
  ASSERT_FALSE(codes.empty());
  EXPECT_EQ(codes.back(), 4000);
}

TEST_F(GatewaySessionTest, HeartbeatAckRecordsLatency) {
  session->Start();
  ASSERT_TRUE(WaitFor([this]() { return transport->ConnectCount() == 1; }));
  transport->Deliver(Hello(30));
  ASSERT_TRUE(WaitFor([this]() { return !transport->SentWithOp(1).empty(); }));
  EXPECT_FALSE(session->Latency().has_value());
  transport->Deliver({{"op", 11}});
  ASSERT_TRUE(WaitFor([this]() { return session->Latency().has_value(); }));
  EXPECT_GE(session->Latency()->count(), 0);
}

TEST_F(GatewaySessionTest, MalformedFramesAreIgnored) {
  session->Start();
  ASSERT_TRUE(WaitFor([this]() { return transport->ConnectCount() == 1; }));
  transport->DeliverRaw("{not json");
  transport->Deliver({{"d", 1}});
  transport->Deliver(Hello(45000));
  ASSERT_TRUE(WaitFor([this]() { return transport->SentWithOp(2).size() == 1; }));
  EXPECT_EQ(transport->ConnectCount(), 1u);
}

TEST_F(GatewaySessionTest, LazyRequestSendsOpcode14) {
  session->RequestLazyGuild(100, {300, 301});
  ASSERT_TRUE(WaitFor([this]() { return transport->SentWithOp(14).size() == 1; }));
  auto frame = transport->SentWithOp(14)[0];
  EXPECT_EQ(frame["d"]["guild_id"], "100");
  EXPECT_EQ(frame["d"]["thread_member_lists"], nlohmann::json::array({"300", "301"}));
}

TEST(BackoffTest, GrowsWithinJitterBounds) {
  cord::ExponentialBackoff backoff(100ms, 1000ms, 42);
  const std::vector<std::pair<long, long>> bounds = {{50, 100}, {100, 200}, {200, 400}, {400, 800}, {500, 1000}, {500, 1000}};
  for (const auto& [low, high] : bounds) {
    auto delay = backoff.Next().count();
    EXPECT_GE(delay, low);
    EXPECT_LE(delay, high);
  }
  EXPECT_EQ(backoff.Attempt(), 6u);
  backoff.Reset();
  auto first = backoff.Next().count();
  EXPECT_GE(first, 50);
  EXPECT_LE(first, 100);
}

TEST(CloseCodeTest, ClassifiesCodes) {
  EXPECT_TRUE(cord::IsFatalCloseCode(4004));
  EXPECT_TRUE(cord::IsFatalCloseCode(4014));
  EXPECT_FALSE(cord::IsFatalCloseCode(4000));
  EXPECT_FALSE(cord::IsFatalCloseCode(1006));
  EXPECT_TRUE(cord::InvalidatesSession(4007));
  EXPECT_TRUE(cord::InvalidatesSession(4009));
  EXPECT_FALSE(cord::InvalidatesSession(4000));
}

}  // namespace
