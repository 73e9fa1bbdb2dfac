#include "test_client.hpp"
#include "string_utils.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

namespace weblib {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

std::optional<std::string> TestResponse::header(std::string_view name) const {
  auto it = headers.find(string_utils::to_lower(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

nlohmann::json TestResponse::json() const {
  return nlohmann::json::parse(body);
}

HttpTestClient::HttpTestClient(std::string host, unsigned short port)
    : host_(std::move(host)), port_(port) {}

std::string HttpTestClient::origin() const {
  return "http://" + host_ + ":" + std::to_string(port_);
}

TestResponse HttpTestClient::get(const std::string &path,
                                 const Headers &headers) {
  return request(http::verb::get, path, "", headers);
}

TestResponse HttpTestClient::post(const std::string &path,
                                  const std::string &body,
                                  const Headers &headers) {
  return request(http::verb::post, path, body, headers);
}

TestResponse HttpTestClient::put(const std::string &path,
                                 const std::string &body,
                                 const Headers &headers) {
  return request(http::verb::put, path, body, headers);
}

TestResponse HttpTestClient::patch(const std::string &path,
                                   const std::string &body,
                                   const Headers &headers) {
  return request(http::verb::patch, path, body, headers);
}

TestResponse HttpTestClient::del(const std::string &path,
                                 const Headers &headers) {
  return request(http::verb::delete_, path, "", headers);
}

TestResponse HttpTestClient::options(const std::string &path,
                                     const Headers &headers) {
  return request(http::verb::options, path, "", headers);
}

TestResponse HttpTestClient::request(http::verb method,
                                     const std::string &path,
                                     const std::string &body,
                                     const Headers &headers) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);

  stream.connect(resolver.resolve(host_, std::to_string(port_)));

  HttpRequest req{method, path, 11};
  req.set(http::field::host, host_ + ":" + std::to_string(port_));
  req.set(http::field::user_agent, "weblib-test-client");
  for (const auto &[name, value] : headers) {
    req.set(name, value);
  }
  if (!body.empty()) {
    if (req.find(http::field::content_type) == req.end()) {
      req.set(http::field::content_type, "application/json");
    }
    req.body() = body;
  }
  req.keep_alive(false);
  req.prepare_payload();

  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(64 * 1024 * 1024);
  if (method == http::verb::head) {
    parser.skip(true);
  }
  http::read(stream, buffer, parser);
  auto res = parser.release();

  TestResponse response;
  response.status = static_cast<int>(res.result_int());
  response.body = std::move(res.body());
  for (const auto &field : res) {
    auto name = string_utils::to_lower(
        std::string_view(field.name_string().data(), field.name_string().size()));
    std::string value(field.value());
    if (field.name() == http::field::set_cookie) {
      response.setCookieHeaders.push_back(value);
      auto nameValue = std::string_view(value).substr(0, value.find(';'));
      auto eq = nameValue.find('=');
      if (eq != std::string_view::npos) {
        response.cookies[std::string(string_utils::trim(nameValue.substr(0, eq)))] =
            std::string(string_utils::trim(nameValue.substr(eq + 1)));
      }
    }
    response.headers[name] = std::move(value);
  }

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    throw beast::system_error{ec};
  }
  return response;
}

} // namespace weblib
