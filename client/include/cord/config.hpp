/*
 * 설명: 클라이언트 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/config_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace cord {

struct ClientConfig {
  std::string token;
  std::string prefix{"!"};
  std::string gateway_url{"wss://gateway.discord.gg/?v=9&encoding=json"};
  std::string api_host{"discord.com"};
  std::string api_base{"/api/v9"};
  std::string user_agent{"cord (https://github.com/cord-client/cord, 1.0)"};
  std::string log_level{"info"};
  std::size_t heartbeat_miss_limit{2};
  std::chrono::milliseconds reconnect_base_delay{std::chrono::milliseconds(1000)};
  std::chrono::milliseconds reconnect_max_delay{std::chrono::milliseconds(60000)};
  std::chrono::milliseconds invalid_session_delay{std::chrono::milliseconds(2000)};
  std::chrono::seconds member_fetch_timeout{std::chrono::seconds(15)};
  std::size_t rest_max_retries{5};
  std::size_t default_bucket_limit{50};
};

ClientConfig LoadConfigFromEnv();
ClientConfig LoadConfigFromFile(const std::string& path);

}  // namespace cord
