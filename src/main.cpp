#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config_manager.hpp"
#include "environment.hpp"
#include "error_reporter.hpp"
#include "logger.hpp"
#include "web_server.hpp"

namespace {

volatile std::sig_atomic_t shutdownRequested = 0;

void signalHandler(int) { shutdownRequested = 1; }

} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = argc > 1 ? argv[1] : "config.json";

  try {
    auto &config = weblib::ConfigManager::getInstance();
    if (!config.loadConfig(configPath)) {
      std::cerr << "Failed to load configuration from " << configPath
                << std::endl;
      return 1;
    }

    auto &logger = weblib::Logger::getInstance();
    logger.configure(config.getLoggingConfig());

    weblib::ErrorReporting::setReporter(
        weblib::ErrorReporting::fromConfig(config));

    weblib::WebServer server(
        [&server](weblib::WebConfig &web) {
          web.routes([&server](weblib::RouteBuilder &routes) {
            routes.get(
                "/health",
                [](weblib::Context &ctx) {
                  ctx.json({{"status", "up"},
                            {"application", weblib::Application::name()},
                            {"version", weblib::Environment::version()}});
                },
                weblib::RouteDoc{"Health check", "", "health", {"system"}});

            for (auto &router : server.routers()) {
              router->route(routes);
            }
          });
        },
        "app.web");

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    server.start();
    LOG_INFO("Main", "Listening on port " + std::to_string(server.port()));

    while (!shutdownRequested && server.isRunning()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Main", "Shutting down");
    server.stop();
    logger.flush();
  } catch (const std::exception &e) {
    LOG_FATAL("Main", std::string("Startup failed: ") + e.what());
    std::cerr << "Startup failed: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
