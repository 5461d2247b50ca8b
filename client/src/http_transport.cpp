/*
 * 설명: 요청마다 TLS 연결을 열어 동기 방식으로 HTTP 요청을 보내고 응답을 받는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/rest_client_test.cpp
 */
#include "cord/http_transport.hpp"

#include <algorithm>
#include <cctype>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace cord {
namespace {
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}
}  // namespace

BeastHttpTransport::BeastHttpTransport(std::string host, std::string token, std::string user_agent,
                                       std::shared_ptr<Observability> observability, std::chrono::seconds timeout)
    : host_(std::move(host)), token_(std::move(token)), user_agent_(std::move(user_agent)),
      observability_(std::move(observability)), timeout_(timeout),
      ssl_ctx_(ssl::context::tlsv12_client) {
  ssl_ctx_.set_default_verify_paths();
  ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

HttpResponse BeastHttpTransport::Send(const HttpRequest& request) {
  boost::asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);

  if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
    beast::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
    throw beast::system_error{ec};
  }

  auto results = resolver.resolve(host_, "443");
  beast::get_lowest_layer(stream).expires_after(timeout_);
  beast::get_lowest_layer(stream).connect(results);
  stream.handshake(ssl::stream_base::client);

  http::request<http::string_body> req;
  req.version(11);
  req.method(http::string_to_verb(request.method));
  req.target(request.path);
  req.set(http::field::host, host_);
  req.set(http::field::user_agent, user_agent_);
  req.set(http::field::authorization, token_);
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  if (!request.body.empty()) {
    req.set(http::field::content_type, "application/json");
    req.body() = request.body;
  }
  req.prepare_payload();

  http::write(stream, req);
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);

  HttpResponse out;
  out.status = static_cast<int>(res.result_int());
  out.body = res.body();
  for (const auto& field : res) {
    out.headers[Lowercase(std::string(field.name_string()))] = std::string(field.value());
  }

  beast::error_code ec;
  stream.shutdown(ec);
  // 응답은 이미 받았으므로 종료 실패는 기록만 한다.
  if (ec && ec != boost::asio::error::eof && ec != ssl::error::stream_truncated && observability_) {
    observability_->Log(LogLevel::kDebug, "rest.shutdown_failed", {{"error", ec.message()}});
  }
  return out;
}

}  // namespace cord
