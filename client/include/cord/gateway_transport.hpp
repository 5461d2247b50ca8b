/*
 * 설명: 게이트웨이 웹소켓 전송 계층 인터페이스와 Beast TLS 웹소켓 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/gateway_session_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "cord/observability.hpp"

namespace cord {

// 모든 콜백은 io_context 스레드에서 호출된다.
class GatewayTransport {
 public:
  using MessageHandler = std::function<void(const std::string& text)>;
  // 연결 실패는 code 1006으로 보고한다.
  using CloseHandler = std::function<void(int code, const std::string& reason)>;

  virtual ~GatewayTransport() = default;
  virtual void Connect(const std::string& url, MessageHandler on_message, CloseHandler on_close) = 0;
  virtual void Send(std::string text) = 0;
  // 직접 요청한 종료는 CloseHandler를 부르지 않는다.
  virtual void Close(int code) = 0;
};

struct GatewayUrl {
  std::string host;
  std::string port;
  std::string target;

  static GatewayUrl Parse(const std::string& url);
};

class BeastGatewayTransport : public GatewayTransport {
 public:
  BeastGatewayTransport(boost::asio::io_context& ioc, std::string user_agent,
                        std::shared_ptr<Observability> observability);
  ~BeastGatewayTransport() override;

  void Connect(const std::string& url, MessageHandler on_message, CloseHandler on_close) override;
  void Send(std::string text) override;
  void Close(int code) override;

 private:
  class Connection;

  boost::asio::io_context& ioc_;
  boost::asio::ssl::context ssl_ctx_;
  std::string user_agent_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<Connection> connection_;
};

}  // namespace cord
