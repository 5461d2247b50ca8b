/*
 * 설명: 구조화 로그와 게이트웨이/REST 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/dispatcher_test.cpp, client/tests/unit/gateway_session_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cord {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::optional<std::string> session_id;
  std::optional<std::uint64_t> sequence;
  long latency_ms{0};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t events_dispatched{0};
  std::uint64_t events_dropped{0};
  std::uint64_t reconnects{0};
  std::uint64_t resumes{0};
  std::uint64_t identifies{0};
  std::uint64_t rest_requests{0};
  std::uint64_t rest_errors{0};
  std::uint64_t rate_limit_hits{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  void IncrementDispatched() { events_dispatched_.fetch_add(1); }
  void IncrementDropped() { events_dropped_.fetch_add(1); }
  void IncrementReconnect() { reconnects_.fetch_add(1); }
  void IncrementResume() { resumes_.fetch_add(1); }
  void IncrementIdentify() { identifies_.fetch_add(1); }
  void IncrementRestRequest() { rest_requests_.fetch_add(1); }
  void IncrementRestError() { rest_errors_.fetch_add(1); }
  void IncrementRateLimitHit() { rate_limit_hits_.fetch_add(1); }
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  void Log(LogLevel level, std::string name, nlohmann::json detail = nullptr) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> events_dispatched_{0};
  std::atomic<std::uint64_t> events_dropped_{0};
  std::atomic<std::uint64_t> reconnects_{0};
  std::atomic<std::uint64_t> resumes_{0};
  std::atomic<std::uint64_t> identifies_{0};
  std::atomic<std::uint64_t> rest_requests_{0};
  std::atomic<std::uint64_t> rest_errors_{0};
  std::atomic<std::uint64_t> rate_limit_hits_{0};
};

}  // namespace cord
