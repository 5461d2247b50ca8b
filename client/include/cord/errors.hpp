/*
 * 설명: 클라이언트 오류 분류(전송/프로토콜 타임아웃/레이트리밋/HTTP/세션)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/rest_client_test.cpp, client/tests/unit/thread_handle_test.cpp
 */
#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace cord {

class ClientError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class TransportError : public ClientError {
 public:
  using ClientError::ClientError;
};

class ProtocolTimeout : public ClientError {
 public:
  using ClientError::ClientError;
};

class ThreadArchived : public ClientError {
 public:
  using ClientError::ClientError;
};

class RateLimited : public ClientError {
 public:
  RateLimited(const std::string& message, std::chrono::milliseconds retry_after, bool global)
      : ClientError(message), retry_after_(retry_after), global_(global) {}

  std::chrono::milliseconds RetryAfter() const { return retry_after_; }
  bool IsGlobal() const { return global_; }

 private:
  std::chrono::milliseconds retry_after_;
  bool global_;
};

class HttpError : public ClientError {
 public:
  HttpError(int status, int code, const std::string& message)
      : ClientError(message), status_(status), code_(code) {}

  int Status() const { return status_; }
  int Code() const { return code_; }

 private:
  int status_;
  int code_;
};

class Forbidden : public HttpError {
 public:
  using HttpError::HttpError;
};

class NotFound : public HttpError {
 public:
  using HttpError::HttpError;
};

}  // namespace cord
