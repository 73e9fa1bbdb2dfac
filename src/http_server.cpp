#include "http_server.hpp"
#include "http_session.hpp"
#include "logger.hpp"
#include <boost/asio/strand.hpp>
#include <thread>
#include <vector>

namespace weblib {

namespace {

class Listener : public std::enable_shared_from_this<Listener> {
public:
  Listener(net::io_context &ioc, tcp::endpoint endpoint,
           std::shared_ptr<RequestHandlerFunc> handler,
           const ServerConfig &config)
      : ioc_(ioc), acceptor_(net::make_strand(ioc)),
        handler_(std::move(handler)), config_(config) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      fail(ec, "open");
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      fail(ec, "set_option");
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      fail(ec, "bind");
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
      fail(ec, "listen");
    }
  }

  void run() { doAccept(); }

  unsigned short port() const { return acceptor_.local_endpoint().port(); }

  void close() {
    beast::error_code ec;
    acceptor_.close(ec);
  }

private:
  net::io_context &ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RequestHandlerFunc> handler_;
  ServerConfig config_;

  [[noreturn]] void fail(beast::error_code ec, const char *what) {
    HTTP_LOG_ERROR("Listener {} failed: {}", what, ec.message());
    throw SystemException(ErrorCode::NETWORK_ERROR,
                          std::string("Listener ") + what + " failed: " +
                              ec.message(),
                          "HttpServer");
  }

  void doAccept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
  }

  void onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted ||
          ec == net::error::bad_descriptor) {
        HTTP_LOG_DEBUG("Listener stopped accepting: {}", ec.message());
        return;
      }
      HTTP_LOG_WARN("Accept failed, continuing: {}", ec.message());
    } else {
      std::make_shared<HttpSession>(std::move(socket), handler_, config_)
          ->run();
    }

    doAccept();
  }
};

} // namespace

struct HttpServer::Impl {
  ServerConfig config;
  std::shared_ptr<RequestHandlerFunc> handler;
  std::unique_ptr<net::io_context> ioc;
  std::shared_ptr<Listener> listener;
  std::vector<std::thread> threadPool;
  unsigned short boundPort = 0;
  bool running = false;
};

HttpServer::HttpServer(const ServerConfig &config)
    : pImpl(std::make_unique<Impl>()) {
  pImpl->config = config;

  auto validation = pImpl->config.validate();
  if (!validation.isValid) {
    for (const auto &error : validation.errors) {
      HTTP_LOG_ERROR("Invalid server configuration: {}", error);
    }
    pImpl->config.applyDefaults();
    HTTP_LOG_INFO("Applied default values for invalid server configuration");
  }
  for (const auto &warning : validation.warnings) {
    HTTP_LOG_WARN("Server configuration: {}", warning);
  }
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setRequestHandler(RequestHandlerFunc handler) {
  pImpl->handler = std::make_shared<RequestHandlerFunc>(std::move(handler));
}

void HttpServer::start() {
  if (pImpl->running) {
    HTTP_LOG_WARN("HTTP server already running");
    return;
  }

  if (!pImpl->handler || !*pImpl->handler) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "No request handler set", "HttpServer");
  }

  const auto &config = pImpl->config;
  beast::error_code ec;
  auto address = net::ip::make_address(config.host, ec);
  if (ec) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "Invalid web.host '" + config.host +
                              "': " + ec.message(),
                          "HttpServer");
  }

  auto threads = static_cast<int>(config.threads);
  pImpl->ioc = std::make_unique<net::io_context>(threads);
  pImpl->listener =
      std::make_shared<Listener>(*pImpl->ioc, tcp::endpoint{address, config.port},
                                 pImpl->handler, config);
  pImpl->boundPort = pImpl->listener->port();
  pImpl->listener->run();

  pImpl->threadPool.reserve(config.threads);
  for (int i = 0; i < threads; ++i) {
    pImpl->threadPool.emplace_back([this, i]() {
      try {
        pImpl->ioc->run();
      } catch (const std::exception &e) {
        HTTP_LOG_ERROR("HTTP server thread {} failed: {}", i, e.what());
      } catch (...) {
        HTTP_LOG_ERROR("HTTP server thread {} failed", i);
      }
    });
  }

  pImpl->running = true;
  HTTP_LOG_INFO("HTTP server listening on {}:{} with {} threads", config.host,
                pImpl->boundPort, threads);
}

void HttpServer::stop() {
  if (!pImpl->running) {
    return;
  }

  pImpl->ioc->stop();

  for (auto &t : pImpl->threadPool) {
    if (t.joinable()) {
      t.join();
    }
  }
  pImpl->threadPool.clear();
  pImpl->listener->close();
  pImpl->listener.reset();
  pImpl->ioc.reset();

  pImpl->running = false;
  HTTP_LOG_INFO("HTTP server on port {} stopped", pImpl->boundPort);
}

bool HttpServer::isRunning() const { return pImpl->running; }

unsigned short HttpServer::local_port() const { return pImpl->boundPort; }

const ServerConfig &HttpServer::getServerConfig() const {
  return pImpl->config;
}

} // namespace weblib
