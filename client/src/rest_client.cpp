/*
 * 설명: REST 요청 재시도(429), 버킷 갱신, 상태 코드별 오류 변환과 채널/스레드/메시지 엔드포인트를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/rest_client_test.cpp
 */
#include "cord/rest_client.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <boost/system/system_error.hpp>

#include "cord/errors.hpp"

namespace cord {
namespace {
std::string PercentEncode(const std::string& text) {
  std::ostringstream out;
  out << std::hex << std::uppercase;
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out << c;
    } else {
      out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return out.str();
}

nlohmann::json ParseBody(const HttpResponse& response) {
  if (response.body.empty()) {
    return nullptr;
  }
  return nlohmann::json::parse(response.body, nullptr, false);
}

[[noreturn]] void ThrowHttpError(const HttpResponse& response, const nlohmann::json& body) {
  int code = 0;
  std::string message = "HTTP 요청 실패 (" + std::to_string(response.status) + ")";
  if (body.is_object()) {
    if (body.contains("code") && body["code"].is_number_integer()) {
      code = body["code"].get<int>();
    }
    if (body.contains("message") && body["message"].is_string()) {
      message += ": " + body["message"].get<std::string>();
    }
  }
  if (response.status == 403) {
    throw Forbidden(response.status, code, message);
  }
  if (response.status == 404) {
    throw NotFound(response.status, code, message);
  }
  throw HttpError(response.status, code, message);
}

std::chrono::milliseconds RetryAfterFrom(const nlohmann::json& body, const RateLimitHeaders& headers) {
  if (body.is_object() && body.contains("retry_after") && body["retry_after"].is_number()) {
    auto seconds = body["retry_after"].get<double>();
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
  }
  if (headers.retry_after) {
    return *headers.retry_after;
  }
  return std::chrono::milliseconds(1000);
}
}  // namespace

std::string Route::Path() const {
  std::string out;
  out.reserve(path_template.size());
  std::size_t pos = 0;
  while (pos < path_template.size()) {
    auto open = path_template.find('{', pos);
    if (open == std::string::npos) {
      out.append(path_template, pos, std::string::npos);
      break;
    }
    auto close = path_template.find('}', open);
    if (close == std::string::npos) {
      throw std::invalid_argument("경로 템플릿이 올바르지 않습니다: " + path_template);
    }
    out.append(path_template, pos, open - pos);
    auto name = path_template.substr(open + 1, close - open - 1);
    auto it = params.find(name);
    if (it == params.end()) {
      throw std::invalid_argument("경로 파라미터가 없습니다: " + name);
    }
    out += it->second;
    pos = close + 1;
  }
  return out;
}

std::string Route::Major() const {
  for (const char* name : {"channel_id", "guild_id", "webhook_id"}) {
    auto it = params.find(name);
    if (it != params.end()) {
      return it->second;
    }
  }
  return "";
}

std::string Route::BucketKey() const { return RateLimiter::MakeKey(method, path_template, Major()); }

RestClient::RestClient(std::shared_ptr<HttpTransport> transport, std::shared_ptr<RateLimiter> limiter,
                       const ClientConfig& config, std::shared_ptr<Observability> observability)
    : transport_(std::move(transport)), limiter_(std::move(limiter)), observability_(std::move(observability)),
      api_base_(config.api_base), max_retries_(config.rest_max_retries) {}

nlohmann::json RestClient::Request(const Route& route, const nlohmann::json& body, const std::string& query,
                                   const std::optional<std::string>& reason) {
  HttpRequest request;
  request.method = route.method;
  request.route = route.path_template;
  request.major = route.Major();
  request.path = api_base_ + route.Path() + (query.empty() ? "" : "?" + query);
  if (!body.is_null()) {
    request.body = body.dump();
  }
  if (reason) {
    request.headers["X-Audit-Log-Reason"] = PercentEncode(*reason);
  }
  const auto key = route.BucketKey();

  for (std::size_t attempt = 0;; ++attempt) {
    HttpResponse response;
    nlohmann::json parsed;
    std::chrono::milliseconds retry_after{0};
    bool global = false;
    {
      auto permit = limiter_->Acquire(key);
      observability_->IncrementRestRequest();
      try {
        response = transport_->Send(request);
      } catch (const boost::system::system_error& e) {
        observability_->IncrementRestError();
        observability_->Log(LogLevel::kError, "rest.transport_error",
                            {{"method", request.method}, {"path", request.path}, {"error", e.what()}});
        throw TransportError(std::string("REST 전송 실패: ") + e.what());
      }
      auto headers = RateLimitHeaders::FromHeaders(response.headers);
      permit.Update(headers);
      parsed = ParseBody(response);
      // 429 대기는 버킷 점유를 풀기 전에 건다.
      if (response.status == 429) {
        retry_after = RetryAfterFrom(parsed, headers);
        global = headers.global || (parsed.is_object() && parsed.value("global", false));
        limiter_->OnRateLimited(key, retry_after, global);
      }
    }

    if (response.status == 429) {
      if (attempt >= max_retries_) {
        observability_->IncrementRestError();
        throw RateLimited("레이트리밋 재시도 한도 초과: " + request.method + " " + request.route, retry_after, global);
      }
      continue;
    }
    if (response.status >= 200 && response.status < 300) {
      if (parsed.is_discarded()) {
        throw HttpError(response.status, 0, "응답 본문을 해석할 수 없습니다");
      }
      return parsed;
    }
    observability_->IncrementRestError();
    observability_->Log(LogLevel::kWarn, "rest.http_error",
                        {{"method", request.method}, {"path", request.path}, {"status", response.status}});
    ThrowHttpError(response, parsed.is_discarded() ? nlohmann::json() : parsed);
  }
}

nlohmann::json RestClient::EditChannel(Snowflake channel_id, const nlohmann::json& payload,
                                       const std::optional<std::string>& reason) {
  Route route{"PATCH", "/channels/{channel_id}", {{"channel_id", channel_id.ToString()}}};
  return Request(route, payload, "", reason);
}

void RestClient::DeleteChannel(Snowflake channel_id, const std::optional<std::string>& reason) {
  Route route{"DELETE", "/channels/{channel_id}", {{"channel_id", channel_id.ToString()}}};
  Request(route, nullptr, "", reason);
}

void RestClient::JoinThread(Snowflake thread_id) {
  Route route{"PUT", "/channels/{channel_id}/thread-members/@me", {{"channel_id", thread_id.ToString()}}};
  Request(route);
}

void RestClient::LeaveThread(Snowflake thread_id) {
  Route route{"DELETE", "/channels/{channel_id}/thread-members/@me", {{"channel_id", thread_id.ToString()}}};
  Request(route);
}

void RestClient::AddThreadMember(Snowflake thread_id, Snowflake user_id) {
  Route route{"PUT",
              "/channels/{channel_id}/thread-members/{user_id}",
              {{"channel_id", thread_id.ToString()}, {"user_id", user_id.ToString()}}};
  Request(route);
}

void RestClient::RemoveThreadMember(Snowflake thread_id, Snowflake user_id) {
  Route route{"DELETE",
              "/channels/{channel_id}/thread-members/{user_id}",
              {{"channel_id", thread_id.ToString()}, {"user_id", user_id.ToString()}}};
  Request(route);
}

std::vector<nlohmann::json> RestClient::GetMessages(Snowflake channel_id, int limit, std::optional<Snowflake> before,
                                                    std::optional<Snowflake> after,
                                                    std::optional<Snowflake> around) {
  Route route{"GET", "/channels/{channel_id}/messages", {{"channel_id", channel_id.ToString()}}};
  std::string query = "limit=" + std::to_string(limit);
  if (before) {
    query += "&before=" + before->ToString();
  }
  if (after) {
    query += "&after=" + after->ToString();
  }
  if (around) {
    query += "&around=" + around->ToString();
  }
  auto body = Request(route, nullptr, query);
  std::vector<nlohmann::json> out;
  if (body.is_array()) {
    out.reserve(body.size());
    for (auto& item : body) {
      out.push_back(std::move(item));
    }
  }
  return out;
}

void RestClient::DeleteMessage(Snowflake channel_id, Snowflake message_id) {
  Route route{"DELETE",
              "/channels/{channel_id}/messages/{message_id}",
              {{"channel_id", channel_id.ToString()}, {"message_id", message_id.ToString()}}};
  Request(route);
}

nlohmann::json RestClient::SendMessage(Snowflake channel_id, const std::string& content) {
  Route route{"POST", "/channels/{channel_id}/messages", {{"channel_id", channel_id.ToString()}}};
  return Request(route, {{"content", content}});
}

}  // namespace cord
