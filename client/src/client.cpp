/*
 * 설명: 구성 요소를 생성해 연결하고 이벤트 루프 스레드와 종료 절차를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/gateway_session_test.cpp
 */
#include "cord/client.hpp"

#include <csignal>

#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

namespace cord {

Client::Client(const ClientConfig& config, std::shared_ptr<HttpTransport> http,
               std::shared_ptr<GatewayTransport> gateway)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  store_ = std::make_shared<EntityStore>();
  pending_ = std::make_shared<PendingRequests>();
  limiter_ = std::make_shared<RateLimiter>(config_.default_bucket_limit, observability_);
  http_ = http ? std::move(http)
               : std::make_shared<BeastHttpTransport>(config_.api_host, config_.token, config_.user_agent,
                                                      observability_);
  rest_ = std::make_shared<RestClient>(http_, limiter_, config_, observability_);
  gateway_ = gateway ? std::move(gateway)
                     : std::make_shared<BeastGatewayTransport>(ioc_, config_.user_agent, observability_);
  dispatcher_ = std::make_shared<Dispatcher>(store_, pending_, observability_);
  session_ = std::make_shared<GatewaySession>(ioc_, gateway_, dispatcher_, store_, config_, observability_);
}

Client::~Client() { Stop(); }

void Client::Run() {
  if (running_.exchange(true)) {
    return;
  }
  boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
  signals.async_wait([this](const boost::system::error_code& ec, int signal) {
    if (ec) {
      return;
    }
    observability_->Log(LogLevel::kInfo, "client.signal", {{"signal", signal}});
    session_->Close();
    work_guard_.reset();
    boost::asio::post(ioc_, [this]() { ioc_.stop(); });
  });
  session_->Start();
  ioc_.run();
  running_ = false;
}

void Client::Start() {
  if (running_.exchange(true)) {
    return;
  }
  session_->Start();
  loop_thread_ = std::thread([this]() { ioc_.run(); });
}

void Client::Stop() {
  if (running_.exchange(false)) {
    session_->Close();
    work_guard_.reset();
    // Close 작업이 먼저 처리된 뒤 루프를 멈춘다.
    boost::asio::post(ioc_, [this]() { ioc_.stop(); });
  }
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
}

std::optional<ThreadHandle> Client::GetThread(Snowflake id) {
  if (!store_->Threads().Get(id)) {
    return std::nullopt;
  }
  std::weak_ptr<GatewaySession> session = session_;
  return ThreadHandle(
      id, store_, rest_, pending_,
      [session](Snowflake guild_id, std::vector<Snowflake> thread_ids) {
        if (auto locked = session.lock()) {
          locked->RequestLazyGuild(guild_id, std::move(thread_ids));
        }
      },
      config_.member_fetch_timeout);
}

std::optional<TextChannelHandle> Client::GetTextChannel(Snowflake id) {
  auto channel = store_->Channels().Get(id);
  if (!channel || (channel->type.kind != ChannelKind::kText && channel->type.kind != ChannelKind::kNews)) {
    return std::nullopt;
  }
  return TextChannelHandle(id, store_, rest_);
}

std::shared_ptr<const User> Client::Self() const {
  auto self_id = store_->SelfId();
  if (self_id.IsZero()) {
    return nullptr;
  }
  return store_->Users().Get(self_id);
}

}  // namespace cord
