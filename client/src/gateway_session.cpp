/*
 * 설명: 게이트웨이 프레임 처리, 하트비트 타이머, identify/resume 결정, 재연결과 세션 무효화 전이를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/gateway_session_test.cpp
 */
#include "cord/gateway_session.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

namespace cord {
namespace {
constexpr int kNormalClosure = 1000;
// 1000/1001 이외의 코드로 닫아야 서버가 세션을 유지한다.
constexpr int kResumableClosure = 4000;
}  // namespace

std::string_view ToString(GatewayState state) {
  switch (state) {
    case GatewayState::kDisconnected:
      return "disconnected";
    case GatewayState::kConnecting:
      return "connecting";
    case GatewayState::kIdentifying:
      return "identifying";
    case GatewayState::kReady:
      return "ready";
    case GatewayState::kResuming:
      return "resuming";
    case GatewayState::kReconnecting:
      return "reconnecting";
  }
  return "unknown";
}

bool IsFatalCloseCode(int code) {
  return code == 4004 || code == 4010 || code == 4011 || code == 4012 || code == 4013 || code == 4014;
}

bool InvalidatesSession(int code) { return code == 4007 || code == 4009; }

GatewaySession::GatewaySession(boost::asio::io_context& ioc, std::shared_ptr<GatewayTransport> transport,
                               std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<EntityStore> store,
                               ClientConfig config, std::shared_ptr<Observability> observability)
    : ioc_(ioc), strand_(boost::asio::make_strand(ioc)), heartbeat_timer_(strand_), reconnect_timer_(strand_),
      identify_timer_(strand_), transport_(std::move(transport)), dispatcher_(std::move(dispatcher)),
      store_(std::move(store)), config_(std::move(config)), observability_(std::move(observability)),
      backoff_(config_.reconnect_base_delay, config_.reconnect_max_delay) {}

void GatewaySession::Start() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->closed_ = false;
    self->Connect();
  });
}

void GatewaySession::Close() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    if (self->closed_) {
      return;
    }
    self->closed_ = true;
    ++self->generation_;
    self->StopTimers();
    self->transport_->Close(kNormalClosure);
    self->Transition(GatewayState::kDisconnected);
    self->observability_->Log(LogLevel::kInfo, "gateway.closed");
  });
}

void GatewaySession::Send(GatewayOpcode op, nlohmann::json data) {
  boost::asio::post(strand_, [self = shared_from_this(), op, data = std::move(data)]() {
    self->SendFrame(op, data);
  });
}

void GatewaySession::RequestLazyGuild(Snowflake guild_id, std::vector<Snowflake> thread_ids) {
  nlohmann::json lists = nlohmann::json::array();
  for (const auto& id : thread_ids) {
    lists.push_back(id.ToString());
  }
  Send(GatewayOpcode::kLazyRequest, {{"guild_id", guild_id.ToString()}, {"thread_member_lists", lists}});
}

void GatewaySession::SetStateObserver(StateObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_observer_ = std::move(observer);
}

std::optional<std::chrono::milliseconds> GatewaySession::Latency() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latency_;
}

std::optional<std::string> GatewaySession::SessionId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_id_;
}

std::optional<std::uint64_t> GatewaySession::Sequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sequence_;
}

void GatewaySession::Connect() {
  if (closed_) {
    return;
  }
  Transition(GatewayState::kConnecting);
  auto generation = ++generation_;
  std::string url = config_.gateway_url;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resume_url_ && session_id_ && sequence_) {
      url = *resume_url_;
      auto query = config_.gateway_url.find('?');
      if (url.find('?') == std::string::npos && query != std::string::npos) {
        url += (url.back() == '/' ? "" : "/") + config_.gateway_url.substr(query);
      }
    }
  }
  std::weak_ptr<GatewaySession> weak = weak_from_this();
  try {
    transport_->Connect(
        url,
        [weak, generation, strand = strand_](const std::string& text) {
          boost::asio::dispatch(strand, [weak, generation, text]() {
            if (auto self = weak.lock()) {
              self->HandleFrame(generation, text);
            }
          });
        },
        [weak, generation, strand = strand_](int code, const std::string& reason) {
          boost::asio::dispatch(strand, [weak, generation, code, reason]() {
            if (auto self = weak.lock()) {
              self->HandleClose(generation, code, reason);
            }
          });
        });
  } catch (const std::invalid_argument& e) {
    observability_->Log(LogLevel::kError, "gateway.bad_url", {{"url", url}, {"error", e.what()}});
    closed_ = true;
    Transition(GatewayState::kDisconnected);
  }
}

void GatewaySession::HandleFrame(std::uint64_t generation, const std::string& text) {
  if (generation != generation_ || closed_) {
    return;
  }
  nlohmann::json frame = nlohmann::json::parse(text, nullptr, false);
  if (frame.is_discarded() || !frame.is_object() || !frame.contains("op") || !frame["op"].is_number_integer()) {
    observability_->Log(LogLevel::kWarn, "gateway.malformed_frame", {{"size", text.size()}});
    return;
  }

  auto seq_it = frame.find("s");
  if (seq_it != frame.end() && seq_it->is_number_unsigned()) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto seq = seq_it->get<std::uint64_t>();
    if (!sequence_ || seq > *sequence_) {
      sequence_ = seq;
    }
  }

  const auto& data = frame.contains("d") ? frame["d"] : nlohmann::json();
  switch (static_cast<GatewayOpcode>(frame["op"].get<int>())) {
    case GatewayOpcode::kHello:
      HandleHello(data);
      break;
    case GatewayOpcode::kHeartbeatAck:
      HandleHeartbeatAck();
      break;
    case GatewayOpcode::kHeartbeat:
      SendHeartbeat();
      break;
    case GatewayOpcode::kReconnect:
      observability_->Log(LogLevel::kInfo, "gateway.reconnect_requested");
      Reconnect("server_requested", kResumableClosure);
      break;
    case GatewayOpcode::kInvalidSession:
      HandleInvalidSession(data.is_boolean() && data.get<bool>());
      break;
    case GatewayOpcode::kDispatch:
      HandleDispatch(frame);
      break;
    default:
      observability_->Log(LogLevel::kDebug, "gateway.unhandled_opcode", {{"op", frame["op"]}});
      break;
  }
}

void GatewaySession::HandleHello(const nlohmann::json& data) {
  if (!data.is_object() || !data.contains("heartbeat_interval") || !data["heartbeat_interval"].is_number() ||
      data["heartbeat_interval"].get<long long>() <= 0) {
    observability_->Log(LogLevel::kWarn, "gateway.malformed_hello");
    Reconnect("malformed_hello", kResumableClosure);
    return;
  }
  heartbeat_interval_ = std::chrono::milliseconds(data["heartbeat_interval"].get<long long>());
  awaiting_ack_ = false;
  missed_acks_ = 0;
  ScheduleHeartbeat();

  if (CanResume()) {
    Transition(GatewayState::kResuming);
    SendResume();
  } else {
    Transition(GatewayState::kIdentifying);
    SendIdentify();
  }
}

void GatewaySession::HandleDispatch(const nlohmann::json& frame) {
  if (!frame.contains("t") || !frame["t"].is_string()) {
    observability_->Log(LogLevel::kWarn, "gateway.malformed_dispatch");
    return;
  }
  const auto event_name = frame["t"].get<std::string>();
  std::optional<std::uint64_t> sequence;
  if (frame.contains("s") && frame["s"].is_number_unsigned()) {
    sequence = frame["s"].get<std::uint64_t>();
  }
  const auto& data = frame.contains("d") ? frame["d"] : nlohmann::json();

  if (event_name == "READY") {
    std::lock_guard<std::mutex> lock(mutex_);
    if (data.contains("session_id") && data["session_id"].is_string()) {
      session_id_ = data["session_id"].get<std::string>();
    }
    if (data.contains("resume_gateway_url") && data["resume_gateway_url"].is_string()) {
      resume_url_ = data["resume_gateway_url"].get<std::string>();
    }
  }

  dispatcher_->Dispatch(event_name, sequence, data);

  if (event_name == "READY") {
    backoff_.Reset();
    Transition(GatewayState::kReady);
  } else if (event_name == "RESUMED") {
    backoff_.Reset();
    observability_->IncrementResume();
    Transition(GatewayState::kReady);
  }
}

void GatewaySession::HandleInvalidSession(bool resumable) {
  observability_->Log(LogLevel::kWarn, "gateway.invalid_session", {{"resumable", resumable}});
  if (!resumable) {
    InvalidateSession();
  }
  identify_timer_.expires_after(config_.invalid_session_delay);
  auto generation = generation_;
  identify_timer_.async_wait([self = shared_from_this(), generation](const boost::system::error_code& ec) {
    if (ec || self->closed_ || generation != self->generation_) {
      return;
    }
    if (self->CanResume()) {
      self->Transition(GatewayState::kResuming);
      self->SendResume();
    } else {
      self->Transition(GatewayState::kIdentifying);
      self->SendIdentify();
    }
  });
}

void GatewaySession::HandleHeartbeatAck() {
  awaiting_ack_ = false;
  missed_acks_ = 0;
  auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                         last_heartbeat_sent_);
  std::lock_guard<std::mutex> lock(mutex_);
  latency_ = latency;
}

void GatewaySession::ScheduleHeartbeat() {
  heartbeat_timer_.expires_after(heartbeat_interval_);
  auto generation = generation_;
  heartbeat_timer_.async_wait([self = shared_from_this(), generation](const boost::system::error_code& ec) {
    if (ec || self->closed_ || generation != self->generation_) {
      return;
    }
    self->OnHeartbeatTick();
  });
}

void GatewaySession::OnHeartbeatTick() {
  if (awaiting_ack_) {
    ++missed_acks_;
    observability_->Log(LogLevel::kWarn, "gateway.heartbeat_missed", {{"missed", missed_acks_}});
    if (missed_acks_ >= config_.heartbeat_miss_limit) {
      Reconnect("heartbeat_timeout", kResumableClosure);
      return;
    }
  }
  SendHeartbeat();
  ScheduleHeartbeat();
}

void GatewaySession::SendHeartbeat() {
  nlohmann::json data = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sequence_) {
      data = *sequence_;
    }
  }
  last_heartbeat_sent_ = std::chrono::steady_clock::now();
  awaiting_ack_ = true;
  SendFrame(GatewayOpcode::kHeartbeat, data);
}

void GatewaySession::SendIdentify() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.reset();
  }
  dispatcher_->ResetSequence();
  observability_->IncrementIdentify();
  observability_->Log(LogLevel::kInfo, "gateway.identify");
  SendFrame(GatewayOpcode::kIdentify,
            {{"token", config_.token},
             {"properties", {{"$os", "linux"}, {"$browser", "cord"}, {"$device", "cord"}}},
             {"compress", false},
             {"large_threshold", 250}});
}

void GatewaySession::SendResume() {
  nlohmann::json data;
  LogContext ctx;
  ctx.name = "gateway.resume";
  {
    std::lock_guard<std::mutex> lock(mutex_);
    data = {{"token", config_.token}, {"session_id", session_id_.value_or("")}, {"seq", sequence_.value_or(0)}};
    ctx.session_id = session_id_;
    ctx.sequence = sequence_;
  }
  observability_->Log(ctx);
  SendFrame(GatewayOpcode::kResume, data);
}

void GatewaySession::SendFrame(GatewayOpcode op, const nlohmann::json& data) {
  nlohmann::json frame = {{"op", static_cast<int>(op)}, {"d", data}};
  transport_->Send(frame.dump());
}

void GatewaySession::HandleClose(std::uint64_t generation, int code, const std::string& reason) {
  if (generation != generation_ || closed_) {
    return;
  }
  if (IsFatalCloseCode(code)) {
    observability_->Log(LogLevel::kError, "gateway.fatal_close", {{"code", code}, {"reason", reason}});
    closed_ = true;
    ++generation_;
    StopTimers();
    InvalidateSession();
    Transition(GatewayState::kDisconnected);
    return;
  }
  if (InvalidatesSession(code)) {
    InvalidateSession();
  }
  observability_->Log(LogLevel::kWarn, "gateway.connection_lost", {{"code", code}, {"reason", reason}});
  Reconnect("connection_lost", kResumableClosure);
}

void GatewaySession::Reconnect(const std::string& reason, int close_code) {
  if (closed_) {
    return;
  }
  ++generation_;
  StopTimers();
  transport_->Close(close_code);
  Transition(GatewayState::kReconnecting);
  observability_->IncrementReconnect();
  auto delay = backoff_.Next();
  observability_->Log(LogLevel::kInfo, "gateway.reconnect_scheduled",
                      {{"reason", reason}, {"delayMs", delay.count()}, {"attempt", backoff_.Attempt()}});
  reconnect_timer_.expires_after(delay);
  auto generation = generation_;
  reconnect_timer_.async_wait([self = shared_from_this(), generation](const boost::system::error_code& ec) {
    if (ec || self->closed_ || generation != self->generation_) {
      return;
    }
    self->Connect();
  });
}

void GatewaySession::InvalidateSession() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session_id_.reset();
    sequence_.reset();
    resume_url_.reset();
  }
  dispatcher_->ResetSequence();
  store_->Clear();
}

bool GatewaySession::CanResume() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_id_.has_value() && sequence_.has_value();
}

void GatewaySession::Transition(GatewayState next) {
  auto previous = state_.exchange(next);
  if (previous == next) {
    return;
  }
  LogContext ctx;
  ctx.level = LogLevel::kDebug;
  ctx.name = "gateway.state";
  ctx.detail = {{"from", std::string(ToString(previous))}, {"to", std::string(ToString(next))}};
  StateObserver observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = state_observer_;
    ctx.session_id = session_id_;
    if (latency_) {
      ctx.latency_ms = static_cast<long>(latency_->count());
    }
  }
  observability_->Log(ctx);
  if (observer) {
    observer(previous, next);
  }
}

void GatewaySession::StopTimers() {
  heartbeat_timer_.cancel();
  reconnect_timer_.cancel();
  identify_timer_.cancel();
  awaiting_ack_ = false;
  missed_acks_ = 0;
}

}  // namespace cord
