#pragma once

#include "context.hpp"
#include "server_config.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <memory>
#include <string>

namespace weblib {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Produces the response for one request; remoteAddress is "ip:port"
using RequestHandlerFunc = std::function<HttpResponse(
    const HttpRequest &request, const std::string &remoteAddress)>;

/**
 * Boost.Beast HTTP/1.1 server. A Listener accepts on a strand and hands each
 * connection to an HttpSession; a pool of threads runs the io_context.
 */
class HttpServer {
public:
  explicit HttpServer(const ServerConfig &config);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  void setRequestHandler(RequestHandlerFunc handler);

  // Binds and starts serving; throws SystemException when binding fails
  void start();
  void stop();
  bool isRunning() const;

  // Bound port, meaningful after start(); differs from the configured one
  // when that was 0
  unsigned short local_port() const;

  const ServerConfig &getServerConfig() const;

private:
  struct Impl;
  std::unique_ptr<Impl> pImpl;
};

} // namespace weblib
