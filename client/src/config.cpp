/*
 * 설명: config.json과 환경변수에서 클라이언트 설정을 읽는다. 환경변수가 파일 값보다 우선한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/config_test.cpp
 */
#include "cord/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace cord {
namespace {
const char* GetEnv(const char* key) {
  const char* val = std::getenv(key);
  if (val == nullptr || *val == '\0') {
    return nullptr;
  }
  return val;
}

void ApplyEnv(ClientConfig& cfg) {
  if (auto v = GetEnv("CORD_TOKEN")) {
    cfg.token = v;
  }
  if (auto v = GetEnv("CORD_PREFIX")) {
    cfg.prefix = v;
  }
  if (auto v = GetEnv("CORD_GATEWAY_URL")) {
    cfg.gateway_url = v;
  }
  if (auto v = GetEnv("CORD_API_HOST")) {
    cfg.api_host = v;
  }
  if (auto v = GetEnv("CORD_API_BASE")) {
    cfg.api_base = v;
  }
  if (auto v = GetEnv("CORD_LOG_LEVEL")) {
    cfg.log_level = v;
  }
  if (auto v = GetEnv("CORD_HEARTBEAT_MISS_LIMIT")) {
    cfg.heartbeat_miss_limit = static_cast<std::size_t>(std::stoul(v));
  }
  if (auto v = GetEnv("CORD_RECONNECT_BASE_MS")) {
    cfg.reconnect_base_delay = std::chrono::milliseconds(std::stoul(v));
  }
  if (auto v = GetEnv("CORD_RECONNECT_MAX_MS")) {
    cfg.reconnect_max_delay = std::chrono::milliseconds(std::stoul(v));
  }
  if (auto v = GetEnv("CORD_INVALID_SESSION_DELAY_MS")) {
    cfg.invalid_session_delay = std::chrono::milliseconds(std::stoul(v));
  }
  if (auto v = GetEnv("CORD_MEMBER_FETCH_TIMEOUT_SECONDS")) {
    cfg.member_fetch_timeout = std::chrono::seconds(std::stoul(v));
  }
  if (auto v = GetEnv("CORD_REST_MAX_RETRIES")) {
    cfg.rest_max_retries = static_cast<std::size_t>(std::stoul(v));
  }
}

void Validate(const ClientConfig& cfg) {
  if (cfg.token.empty()) {
    throw std::invalid_argument("token이 설정되지 않았습니다");
  }
  if (cfg.heartbeat_miss_limit == 0) {
    throw std::invalid_argument("heartbeat_miss_limit은 1 이상이어야 합니다");
  }
  if (cfg.reconnect_max_delay < cfg.reconnect_base_delay) {
    throw std::invalid_argument("reconnect_max_delay가 reconnect_base_delay보다 작습니다");
  }
}
}  // namespace

ClientConfig LoadConfigFromEnv() {
  ClientConfig cfg;
  ApplyEnv(cfg);
  Validate(cfg);
  return cfg;
}

ClientConfig LoadConfigFromFile(const std::string& path) {
  std::ifstream is{path};
  if (!is) {
    throw std::runtime_error("설정 파일을 열 수 없습니다: " + path);
  }
  nlohmann::json doc = nlohmann::json::parse(is);

  ClientConfig cfg;
  cfg.token = doc.value("token", cfg.token);
  cfg.prefix = doc.value("prefix", cfg.prefix);
  cfg.gateway_url = doc.value("gateway_url", cfg.gateway_url);
  cfg.api_host = doc.value("api_host", cfg.api_host);
  cfg.api_base = doc.value("api_base", cfg.api_base);
  cfg.log_level = doc.value("log_level", cfg.log_level);
  cfg.heartbeat_miss_limit = doc.value("heartbeat_miss_limit", cfg.heartbeat_miss_limit);
  cfg.reconnect_base_delay =
      std::chrono::milliseconds(doc.value("reconnect_base_ms", cfg.reconnect_base_delay.count()));
  cfg.reconnect_max_delay = std::chrono::milliseconds(doc.value("reconnect_max_ms", cfg.reconnect_max_delay.count()));
  cfg.invalid_session_delay =
      std::chrono::milliseconds(doc.value("invalid_session_delay_ms", cfg.invalid_session_delay.count()));
  cfg.member_fetch_timeout =
      std::chrono::seconds(doc.value("member_fetch_timeout_seconds", cfg.member_fetch_timeout.count()));
  cfg.rest_max_retries = doc.value("rest_max_retries", cfg.rest_max_retries);

  ApplyEnv(cfg);
  Validate(cfg);
  return cfg;
}

}  // namespace cord
