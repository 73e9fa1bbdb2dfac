#pragma once

#include "http_server.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace weblib {

/**
 * One client connection. Reads requests with a body limit and a read
 * timeout, passes each to the request handler and writes the response,
 * looping while the client keeps the connection alive.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket &&socket, std::shared_ptr<RequestHandlerFunc> handler,
              const ServerConfig &config);

  void run();

private:
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<HttpResponse> response_;
  std::shared_ptr<RequestHandlerFunc> handler_;
  std::chrono::seconds requestTimeout_;
  size_t maxRequestBodySize_;
  std::string remoteAddress_;

  void doRead();
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  void sendResponse(HttpResponse &&response);
  void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
  void doClose();

  HttpResponse errorResponse(http::status status, const std::string &message,
                             unsigned version) const;
};

} // namespace weblib
