/*
 * 설명: 게이트웨이 세션 상태 기계. hello/identify/resume, 하트비트 생존 확인, 재연결 백오프, 세션 무효화를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/gateway_session_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>

#include "cord/backoff.hpp"
#include "cord/config.hpp"
#include "cord/dispatcher.hpp"
#include "cord/entity_store.hpp"
#include "cord/gateway_transport.hpp"
#include "cord/observability.hpp"

namespace cord {

enum class GatewayState { kDisconnected, kConnecting, kIdentifying, kReady, kResuming, kReconnecting };

std::string_view ToString(GatewayState state);

enum class GatewayOpcode : int {
  kDispatch = 0,
  kHeartbeat = 1,
  kIdentify = 2,
  kResume = 6,
  kReconnect = 7,
  kInvalidSession = 9,
  kHello = 10,
  kHeartbeatAck = 11,
  kLazyRequest = 14,
};

// 재시도해도 소용없는 종료 코드(인증 실패, 잘못된 샤드/인텐트 등).
bool IsFatalCloseCode(int code);
// 세션을 이어 붙일 수 없게 만드는 종료 코드.
bool InvalidatesSession(int code);

class GatewaySession : public std::enable_shared_from_this<GatewaySession> {
 public:
  using StateObserver = std::function<void(GatewayState from, GatewayState to)>;

  GatewaySession(boost::asio::io_context& ioc, std::shared_ptr<GatewayTransport> transport,
                 std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<EntityStore> store, ClientConfig config,
                 std::shared_ptr<Observability> observability);

  void Start();
  // 명시적 종료. 이후 재연결하지 않는다.
  void Close();

  void Send(GatewayOpcode op, nlohmann::json data);
  void RequestLazyGuild(Snowflake guild_id, std::vector<Snowflake> thread_ids);

  void SetStateObserver(StateObserver observer);

  GatewayState State() const { return state_.load(); }
  std::optional<std::chrono::milliseconds> Latency() const;
  std::optional<std::string> SessionId() const;
  std::optional<std::uint64_t> Sequence() const;

 private:
  void Connect();
  void HandleFrame(std::uint64_t generation, const std::string& text);
  void HandleClose(std::uint64_t generation, int code, const std::string& reason);
  void HandleHello(const nlohmann::json& data);
  void HandleDispatch(const nlohmann::json& frame);
  void HandleInvalidSession(bool resumable);
  void HandleHeartbeatAck();

  void ScheduleHeartbeat();
  void OnHeartbeatTick();
  void SendHeartbeat();
  void SendIdentify();
  void SendResume();
  void SendFrame(GatewayOpcode op, const nlohmann::json& data);

  void Reconnect(const std::string& reason, int close_code);
  void InvalidateSession();
  bool CanResume() const;
  void Transition(GatewayState next);
  void StopTimers();

  boost::asio::io_context& ioc_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer heartbeat_timer_;
  boost::asio::steady_timer reconnect_timer_;
  boost::asio::steady_timer identify_timer_;
  std::shared_ptr<GatewayTransport> transport_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::shared_ptr<EntityStore> store_;
  ClientConfig config_;
  std::shared_ptr<Observability> observability_;
  ExponentialBackoff backoff_;

  std::atomic<GatewayState> state_{GatewayState::kDisconnected};
  StateObserver state_observer_;
  std::uint64_t generation_{0};
  bool closed_{false};

  std::chrono::milliseconds heartbeat_interval_{0};
  bool awaiting_ack_{false};
  std::size_t missed_acks_{0};
  std::chrono::steady_clock::time_point last_heartbeat_sent_{};

  mutable std::mutex mutex_;
  std::optional<std::string> session_id_;
  std::optional<std::uint64_t> sequence_;
  std::optional<std::string> resume_url_;
  std::optional<std::chrono::milliseconds> latency_;
};

}  // namespace cord
