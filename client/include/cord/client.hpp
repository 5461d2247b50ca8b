/*
 * 설명: 클라이언트 전체 수명주기와 구성 요소(캐시, 게이트웨이, REST, 디스패처) 연결을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/gateway_session_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "cord/config.hpp"
#include "cord/dispatcher.hpp"
#include "cord/entity_store.hpp"
#include "cord/gateway_session.hpp"
#include "cord/gateway_transport.hpp"
#include "cord/http_transport.hpp"
#include "cord/messageable.hpp"
#include "cord/notification.hpp"
#include "cord/observability.hpp"
#include "cord/pending_requests.hpp"
#include "cord/rate_limiter.hpp"
#include "cord/rest_client.hpp"
#include "cord/thread_handle.hpp"

namespace cord {

class Client {
 public:
  // 전송 계층을 넘기지 않으면 Beast TLS 구현을 만든다.
  explicit Client(const ClientConfig& config, std::shared_ptr<HttpTransport> http = nullptr,
                  std::shared_ptr<GatewayTransport> gateway = nullptr);
  ~Client();

  // 현재 스레드에서 이벤트 루프를 돌린다. SIGINT/SIGTERM에서 반환한다.
  void Run();
  // 이벤트 루프를 별도 스레드에서 시작한다.
  void Start();
  void Stop();

  void SetNotificationSink(std::shared_ptr<NotificationSink> sink) { dispatcher_->SetNotificationSink(std::move(sink)); }

  std::shared_ptr<EntityStore> Store() { return store_; }
  std::shared_ptr<GatewaySession> Session() { return session_; }
  std::shared_ptr<Dispatcher> GetDispatcher() { return dispatcher_; }
  std::shared_ptr<RestClient> Rest() { return rest_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  const ClientConfig& GetConfig() const { return config_; }

  std::optional<ThreadHandle> GetThread(Snowflake id);
  std::optional<TextChannelHandle> GetTextChannel(Snowflake id);
  std::shared_ptr<const User> Self() const;
  std::optional<std::chrono::milliseconds> Latency() const { return session_->Latency(); }
  GatewayState State() const { return session_->State(); }

 private:
  ClientConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<EntityStore> store_;
  std::shared_ptr<PendingRequests> pending_;
  std::shared_ptr<RateLimiter> limiter_;
  std::shared_ptr<HttpTransport> http_;
  std::shared_ptr<RestClient> rest_;
  std::shared_ptr<GatewayTransport> gateway_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::shared_ptr<GatewaySession> session_;
  std::thread loop_thread_;
  std::atomic<bool> running_{false};
};

}  // namespace cord
