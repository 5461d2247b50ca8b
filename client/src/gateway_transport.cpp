/*
 * 설명: TLS 웹소켓 연결(해석/연결/핸드셰이크), 읽기 루프, 쓰기 큐, 종료 코드 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/gateway_session_test.cpp
 */
#include "cord/gateway_transport.hpp"

#include <deque>
#include <stdexcept>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace cord {
namespace {
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

constexpr int kAbnormalClosure = 1006;
}  // namespace

GatewayUrl GatewayUrl::Parse(const std::string& url) {
  const std::string scheme = "wss://";
  if (url.rfind(scheme, 0) != 0) {
    throw std::invalid_argument("게이트웨이 URL은 wss://로 시작해야 합니다: " + url);
  }
  auto rest = url.substr(scheme.size());
  GatewayUrl out;
  auto slash = rest.find_first_of("/?");
  auto authority = rest.substr(0, slash);
  out.target = slash == std::string::npos ? "/" : rest.substr(slash);
  if (!out.target.empty() && out.target.front() == '?') {
    out.target = "/" + out.target;
  }
  auto colon = authority.find(':');
  out.host = authority.substr(0, colon);
  out.port = colon == std::string::npos ? "443" : authority.substr(colon + 1);
  if (out.host.empty()) {
    throw std::invalid_argument("게이트웨이 호스트가 비어 있습니다: " + url);
  }
  return out;
}

class BeastGatewayTransport::Connection : public std::enable_shared_from_this<Connection> {
 public:
  Connection(boost::asio::io_context& ioc, ssl::context& ctx, GatewayUrl url, std::string user_agent,
             std::shared_ptr<Observability> observability, MessageHandler on_message, CloseHandler on_close)
      : resolver_(boost::asio::make_strand(ioc)), ws_(resolver_.get_executor(), ctx), url_(std::move(url)),
        user_agent_(std::move(user_agent)), observability_(std::move(observability)),
        on_message_(std::move(on_message)), on_close_(std::move(on_close)) {}

  void Run() {
    resolver_.async_resolve(url_.host, url_.port, beast::bind_front_handler(&Connection::OnResolve, shared_from_this()));
  }

  void Send(std::string text) {
    boost::asio::post(ws_.get_executor(), [self = shared_from_this(), text = std::move(text)]() mutable {
      if (self->closed_ || !self->open_) {
        return;
      }
      self->write_queue_.push_back(std::move(text));
      if (!self->writing_) {
        self->WriteNext();
      }
    });
  }

  void Close(int code) {
    boost::asio::post(ws_.get_executor(), [self = shared_from_this(), code]() {
      if (self->closed_) {
        return;
      }
      self->closed_ = true;
      self->write_queue_.clear();
      if (!self->open_) {
        beast::get_lowest_layer(self->ws_).cancel();
        return;
      }
      websocket::close_reason reason{static_cast<websocket::close_code>(code)};
      self->ws_.async_close(reason, [self](beast::error_code ec) {
        if (ec && ec != ssl::error::stream_truncated && self->observability_) {
          self->observability_->Log(LogLevel::kDebug, "gateway.close_failed", {{"error", ec.message()}});
        }
      });
    });
  }

 private:
  void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      return Fail("resolve", ec, kAbnormalClosure);
    }
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).async_connect(results,
                                               beast::bind_front_handler(&Connection::OnConnect, shared_from_this()));
  }

  void OnConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) {
      return Fail("connect", ec, kAbnormalClosure);
    }
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
      ec = beast::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category());
      return Fail("sni", ec, kAbnormalClosure);
    }
    ws_.next_layer().async_handshake(ssl::stream_base::client,
                                     beast::bind_front_handler(&Connection::OnSslHandshake, shared_from_this()));
  }

  void OnSslHandshake(beast::error_code ec) {
    if (ec) {
      return Fail("ssl_handshake", ec, kAbnormalClosure);
    }
    beast::get_lowest_layer(ws_).expires_never();
    // 하트비트가 생존 확인을 담당하므로 웹소켓 ping 타임아웃은 끈다.
    auto timeout = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeout.idle_timeout = websocket::stream_base::none();
    ws_.set_option(timeout);
    ws_.set_option(websocket::stream_base::decorator(
        [agent = user_agent_](websocket::request_type& req) { req.set(beast::http::field::user_agent, agent); }));
    ws_.read_message_max(16 * 1024 * 1024);
    ws_.async_handshake(url_.host, url_.target,
                        beast::bind_front_handler(&Connection::OnHandshake, shared_from_this()));
  }

  void OnHandshake(beast::error_code ec) {
    if (ec) {
      return Fail("ws_handshake", ec, kAbnormalClosure);
    }
    open_ = true;
    if (closed_) {
      ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code) {});
      return;
    }
    DoRead();
  }

  void DoRead() {
    ws_.async_read(buffer_, beast::bind_front_handler(&Connection::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec) {
      int code = kAbnormalClosure;
      std::string reason = ec.message();
      if (ec == websocket::error::closed) {
        code = static_cast<int>(ws_.reason().code);
        reason = std::string(ws_.reason().reason.data(), ws_.reason().reason.size());
      }
      return Fail("read", ec, code, reason);
    }
    auto text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (!closed_ && on_message_) {
      on_message_(text);
    }
    if (!closed_) {
      DoRead();
    }
  }

  void WriteNext() {
    if (write_queue_.empty() || closed_) {
      writing_ = false;
      return;
    }
    writing_ = true;
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(write_queue_.front()),
                    beast::bind_front_handler(&Connection::OnWrite, shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    if (!write_queue_.empty()) {
      write_queue_.pop_front();
    }
    if (ec) {
      writing_ = false;
      return Fail("write", ec, kAbnormalClosure);
    }
    WriteNext();
  }

  void Fail(const char* stage, beast::error_code ec, int code, std::string reason = {}) {
    if (closed_) {
      return;
    }
    closed_ = true;
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "gateway.transport_closed",
                          {{"stage", stage}, {"error", ec.message()}, {"code", code}});
    }
    if (on_close_) {
      on_close_(code, reason.empty() ? ec.message() : reason);
    }
  }

  tcp::resolver resolver_;
  websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
  beast::flat_buffer buffer_;
  std::deque<std::string> write_queue_;
  GatewayUrl url_;
  std::string user_agent_;
  std::shared_ptr<Observability> observability_;
  MessageHandler on_message_;
  CloseHandler on_close_;
  bool writing_{false};
  bool open_{false};
  bool closed_{false};
};

BeastGatewayTransport::BeastGatewayTransport(boost::asio::io_context& ioc, std::string user_agent,
                                             std::shared_ptr<Observability> observability)
    : ioc_(ioc), ssl_ctx_(ssl::context::tlsv12_client), user_agent_(std::move(user_agent)),
      observability_(std::move(observability)) {
  ssl_ctx_.set_default_verify_paths();
  ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

BeastGatewayTransport::~BeastGatewayTransport() {
  if (connection_) {
    connection_->Close(1000);
  }
}

void BeastGatewayTransport::Connect(const std::string& url, MessageHandler on_message, CloseHandler on_close) {
  if (connection_) {
    connection_->Close(4000);
  }
  connection_ = std::make_shared<Connection>(ioc_, ssl_ctx_, GatewayUrl::Parse(url), user_agent_, observability_,
                                             std::move(on_message), std::move(on_close));
  connection_->Run();
}

void BeastGatewayTransport::Send(std::string text) {
  if (connection_) {
    connection_->Send(std::move(text));
  }
}

void BeastGatewayTransport::Close(int code) {
  if (connection_) {
    connection_->Close(code);
    connection_.reset();
  }
}

}  // namespace cord
