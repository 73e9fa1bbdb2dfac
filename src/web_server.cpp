#include "web_server.hpp"
#include "config_manager.hpp"
#include "environment.hpp"
#include "logger.hpp"

namespace weblib {

WebServer::WebServer(WebSetup setup, std::string package)
    : setup_(std::move(setup)), package_(std::move(package)),
      options_(readOptions(ConfigManager::getInstance())) {}

WebServer::~WebServer() { stop(); }

WebAppOptions WebServer::readOptions(const ConfigManager &config) {
  WebAppOptions options;

  bool useOpenApi = config.getBool("web.openApi", true);
  bool allowOpenApiInProd = config.getBool("web.allowOpenApiInProd", false);
  options.openApi =
      useOpenApi && (allowOpenApiInProd || Environment::isNotProd());
  options.openApiInfo.title = Application::name();
  options.openApiInfo.version = Environment::version();
  options.openApiOptions.assetsDirectory =
      config.getString("web.swaggerUiDir", "swagger-ui");

  if (auto origins = config.getOptionalString("web.corsOrigins")) {
    auto cors = CorsConfig::fromOrigins(*origins);
    if (!cors.empty()) {
      options.cors = std::move(cors);
    }
  }

  options.traceExtraBuilder = TraceExtraBuilderRegistry::getInstance().resolve(
      config.getString("web.traceExtraBuilder"));
  options.accessManager = createAccessManager(config);
  options.serverConfig = ServerConfig::fromConfig(config);
  return options;
}

std::unique_ptr<WebApp> WebServer::create() const {
  return std::make_unique<WebApp>(options_, setup_);
}

WebApp &WebServer::app() {
  if (!currentApp_) {
    currentApp_ = create();
  }
  return *currentApp_;
}

void WebServer::start() {
  WEB_LOG_INFO("Starting {} {} ({} environment)", Application::name(),
               Environment::version(), Environment::name());
  app().start();
}

void WebServer::stop() {
  if (currentApp_) {
    currentApp_->stop();
  }
}

bool WebServer::isRunning() const {
  return currentApp_ && currentApp_->isRunning();
}

unsigned short WebServer::port() const {
  return currentApp_ ? currentApp_->port() : options_.serverConfig.port;
}

const std::vector<std::unique_ptr<Router>> &WebServer::routers() {
  if (!routers_) {
    routers_ = RouterRegistry::getInstance().discover(package_);
  }
  return *routers_;
}

void WebServer::test(const TestCase &testCase) {
  auto testApp = create();
  testApp->start(static_cast<unsigned short>(0));

  try {
    HttpTestClient client("127.0.0.1", testApp->port());
    testCase(*testApp, client);
  } catch (...) {
    testApp->stop();
    throw;
  }
  testApp->stop();
}

} // namespace weblib
