/*
 * 설명: REST 요청/응답 값 타입과 HTTP 전송 계층 인터페이스, Beast 기반 TLS 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/rest_client_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "cord/observability.hpp"
#include "cord/rate_limiter.hpp"

namespace cord {

struct HttpRequest {
  std::string method;
  // 버킷 키에 쓰이는 경로 템플릿(예: "/channels/{channel_id}").
  std::string route;
  std::string major;
  std::string path;
  std::string body;
  HeaderMap headers;
};

struct HttpResponse {
  int status{0};
  HeaderMap headers;
  std::string body;
};

class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  // 네트워크 실패는 boost::system::system_error로 던진다.
  virtual HttpResponse Send(const HttpRequest& request) = 0;
};

class BeastHttpTransport : public HttpTransport {
 public:
  BeastHttpTransport(std::string host, std::string token, std::string user_agent,
                     std::shared_ptr<Observability> observability = nullptr,
                     std::chrono::seconds timeout = std::chrono::seconds(30));

  HttpResponse Send(const HttpRequest& request) override;

 private:
  std::string host_;
  std::string token_;
  std::string user_agent_;
  std::shared_ptr<Observability> observability_;
  std::chrono::seconds timeout_;
  boost::asio::ssl::context ssl_ctx_;
};

}  // namespace cord
