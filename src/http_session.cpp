#include "http_session.hpp"
#include "logger.hpp"
#include <boost/asio/dispatch.hpp>

namespace weblib {

HttpSession::HttpSession(tcp::socket &&socket,
                         std::shared_ptr<RequestHandlerFunc> handler,
                         const ServerConfig &config)
    : stream_(std::move(socket)), handler_(std::move(handler)),
      requestTimeout_(config.requestTimeout),
      maxRequestBodySize_(config.maxRequestBodySize) {
  beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (!ec) {
    remoteAddress_ =
        endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  }
}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead,
                                          shared_from_this()));
}

void HttpSession::doRead() {
  parser_.emplace();
  parser_->body_limit(maxRequestBodySize_);
  stream_.expires_after(requestTimeout_);

  http::async_read(
      stream_, buffer_, *parser_,
      beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream) {
    return doClose();
  }

  if (ec == http::error::body_limit) {
    HTTP_LOG_WARN("Request body from {} exceeds {} bytes", remoteAddress_,
                  maxRequestBodySize_);
    auto response = errorResponse(http::status::payload_too_large,
                                  "Request body too large", 11);
    return sendResponse(std::move(response));
  }

  if (ec == beast::error::timeout) {
    HTTP_LOG_DEBUG("Connection from {} timed out", remoteAddress_);
    return doClose();
  }

  if (ec) {
    HTTP_LOG_DEBUG("Read from {} failed: {}", remoteAddress_, ec.message());
    return;
  }

  HttpRequest request = parser_->release();
  HTTP_LOG_DEBUG("{} {} from {}", std::string(request.method_string()),
                 std::string(request.target()), remoteAddress_);

  // Handlers may block; the socket must not time out underneath them
  stream_.expires_never();

  try {
    sendResponse((*handler_)(request, remoteAddress_));
  } catch (const std::exception &e) {
    HTTP_LOG_ERROR("Request handler failed: {}", e.what());
    sendResponse(errorResponse(http::status::internal_server_error,
                               "Internal server error", request.version()));
  } catch (...) {
    HTTP_LOG_ERROR("Request handler failed with a non-standard exception");
    sendResponse(errorResponse(http::status::internal_server_error,
                               "Internal server error", request.version()));
  }
}

void HttpSession::sendResponse(HttpResponse &&response) {
  response_ = std::make_shared<HttpResponse>(std::move(response));
  stream_.expires_after(requestTimeout_);

  auto self = shared_from_this();
  http::async_write(stream_, *response_,
                    [self](beast::error_code ec, std::size_t bytes) {
                      self->onWrite(self->response_->need_eof(), ec, bytes);
                    });
}

void HttpSession::onWrite(bool close, beast::error_code ec,
                          std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    HTTP_LOG_DEBUG("Write to {} failed: {}", remoteAddress_, ec.message());
    return;
  }

  if (close) {
    return doClose();
  }

  response_.reset();
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec && ec != beast::errc::not_connected) {
    HTTP_LOG_DEBUG("Shutdown of {} failed: {}", remoteAddress_, ec.message());
  }
}

HttpResponse HttpSession::errorResponse(http::status status,
                                        const std::string &message,
                                        unsigned version) const {
  HttpResponse response{status, version};
  response.set(http::field::server, "weblib");
  response.set(http::field::content_type, "text/plain");
  response.keep_alive(false);
  response.body() = message;
  response.prepare_payload();
  return response;
}

} // namespace weblib
