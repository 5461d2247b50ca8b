/*
 * 설명: 레이트리밋을 거쳐 REST 엔드포인트를 호출하고 HTTP 실패를 오류 타입으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/rest_client_test.cpp
 */
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cord/config.hpp"
#include "cord/http_transport.hpp"
#include "cord/observability.hpp"
#include "cord/rate_limiter.hpp"
#include "cord/snowflake.hpp"

namespace cord {

// 경로 템플릿과 파라미터. major 파라미터(channel_id/guild_id/webhook_id)가 버킷을 가른다.
struct Route {
  std::string method;
  std::string path_template;
  std::map<std::string, std::string> params;

  std::string Path() const;
  std::string Major() const;
  std::string BucketKey() const;
};

struct HistoryQuery {
  int limit{100};
  std::optional<Snowflake> before;
  std::optional<Snowflake> after;
  std::optional<Snowflake> around;
  bool oldest_first{false};
};

class RestClient {
 public:
  RestClient(std::shared_ptr<HttpTransport> transport, std::shared_ptr<RateLimiter> limiter,
             const ClientConfig& config, std::shared_ptr<Observability> observability);

  nlohmann::json Request(const Route& route, const nlohmann::json& body = nullptr, const std::string& query = "",
                         const std::optional<std::string>& reason = std::nullopt);

  nlohmann::json EditChannel(Snowflake channel_id, const nlohmann::json& payload,
                             const std::optional<std::string>& reason = std::nullopt);
  void DeleteChannel(Snowflake channel_id, const std::optional<std::string>& reason = std::nullopt);
  void JoinThread(Snowflake thread_id);
  void LeaveThread(Snowflake thread_id);
  void AddThreadMember(Snowflake thread_id, Snowflake user_id);
  void RemoveThreadMember(Snowflake thread_id, Snowflake user_id);

  // 한 번의 호출로 최대 100개까지 받는다.
  std::vector<nlohmann::json> GetMessages(Snowflake channel_id, int limit, std::optional<Snowflake> before,
                                          std::optional<Snowflake> after, std::optional<Snowflake> around);
  void DeleteMessage(Snowflake channel_id, Snowflake message_id);
  nlohmann::json SendMessage(Snowflake channel_id, const std::string& content);

 private:
  std::shared_ptr<HttpTransport> transport_;
  std::shared_ptr<RateLimiter> limiter_;
  std::shared_ptr<Observability> observability_;
  std::string api_base_;
  std::size_t max_retries_;
};

}  // namespace cord
