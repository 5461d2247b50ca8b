/*
 * 설명: 구조화 로그를 한 줄 JSON으로 출력하고 메트릭 카운터 스냅샷을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/observability_test.cpp
 */
#include "cord/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace cord {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.events_dispatched = events_dispatched_.load();
  snapshot.events_dropped = events_dropped_.load();
  snapshot.reconnects = reconnects_.load();
  snapshot.resumes = resumes_.load();
  snapshot.identifies = identifies_.load();
  snapshot.rest_requests = rest_requests_.load();
  snapshot.rest_errors = rest_errors_.load();
  snapshot.rate_limit_hits = rate_limit_hits_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = CurrentTimestamp();
  log_json["level"] = LevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  if (ctx.latency_ms > 0) {
    log_json["latencyMs"] = ctx.latency_ms;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.sequence) {
    log_json["sequence"] = *ctx.sequence;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << log_json.dump() << std::endl;
}

void Observability::Log(LogLevel level, std::string name, nlohmann::json detail) const {
  LogContext ctx;
  ctx.level = level;
  ctx.name = std::move(name);
  ctx.detail = std::move(detail);
  Log(ctx);
}

}  // namespace cord
