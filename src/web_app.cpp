#include "web_app.hpp"
#include "environment.hpp"
#include "error_reporter.hpp"
#include "logger.hpp"
#include "trace.hpp"
#include "uuid_utils.hpp"

namespace weblib {

WebApp::WebApp(WebAppOptions options, const WebSetup &setup)
    : cors_(std::move(options.cors)),
      accessManager_(std::move(options.accessManager)),
      traceExtraBuilder_(std::move(options.traceExtraBuilder)),
      serverConfig_(std::move(options.serverConfig)) {
  if (!traceExtraBuilder_) {
    traceExtraBuilder_ = std::make_shared<EmptyWebTraceExtraBuilder>();
  }

  if (options.openApi) {
    SwaggerUi::install(routes_, options.openApiInfo, options.openApiOptions);
    openApiEnabled_ = true;
  }

  if (setup) {
    WebConfig config(routes_, exceptions_, jsonMapper_, serverConfig_, cors_,
                     accessManager_, beforeHooks_, afterHooks_);
    setup(config);
  }

  if (!accessManager_) {
    for (const auto &route : routes_.routes()) {
      if (!route.roles.empty()) {
        WEB_LOG_WARN("Route {} {} declares roles but no access manager is "
                     "configured; it is served without a role check",
                     std::string(http::to_string(route.method)),
                     route.pattern);
      }
    }
  }

  registerDefaultHandlers(exceptions_);
  beforeHooks_.push_back([this](Context &ctx) { openSession(ctx); });
  afterHooks_.push_back([this](Context &ctx) { closeTrace(ctx); });

  WEB_LOG_INFO("Web application created with {} routes{}", routes_.size(),
               cors_ ? ", CORS enabled" : "");
}

WebApp::~WebApp() { stop(); }

HttpResponse WebApp::handle(const HttpRequest &request,
                            const std::string &remoteAddress) {
  Context ctx(request, jsonMapper_);
  ctx.attribute("remoteAddress", remoteAddress);

  if (cors_ && cors_->handlePreflight(ctx)) {
    return ctx.toResponse();
  }

  try {
    route(ctx);
  } catch (...) {
    mapException(std::current_exception(), ctx);
  }

  for (const auto &hook : afterHooks_) {
    try {
      hook(ctx);
    } catch (...) {
      mapException(std::current_exception(), ctx);
    }
  }

  if (cors_) {
    cors_->applyHeaders(ctx);
  }

  ErrorReporting::clearContext();
  return ctx.toResponse();
}

void WebApp::route(Context &ctx) {
  auto match = routes_.match(ctx.verb(), ctx.rawPath());
  if (match) {
    ctx.setMatchedRoute(match->route->pattern, std::move(match->pathParams));
  }

  for (const auto &hook : beforeHooks_) {
    hook(ctx);
  }

  if (!match) {
    ctx.status(404).result("Endpoint " + ctx.method() + " " + ctx.path() +
                           " not found");
    return;
  }

  const Route &route = *match->route;
  if (!route.roles.empty() && accessManager_) {
    accessManager_->manage(ctx, route.roles);
  }
  route.handler(ctx);
}

void WebApp::mapException(std::exception_ptr error, Context &ctx) {
  try {
    if (!exceptions_.handle(error, ctx)) {
      WEB_LOG_ERROR("No exception handler matched for {} {}", ctx.method(),
                    ctx.path());
      ctx.resetResult();
      ctx.status(500);
    }
  } catch (const std::exception &e) {
    WEB_LOG_ERROR("Exception handler failed for {} {}: {}", ctx.method(),
                  ctx.path(), e.what());
    ctx.resetResult();
    ctx.status(500);
  } catch (...) {
    WEB_LOG_ERROR("Exception handler failed for {} {} with a non-standard "
                  "exception",
                  ctx.method(), ctx.path());
    ctx.resetResult();
    ctx.status(500);
  }
}

void WebApp::openSession(Context &ctx) {
  RequestInfo info;
  info.method = ctx.method();
  info.url = std::string(ctx.request().target());
  info.userAgent = ctx.header("User-Agent").value_or("");
  info.remoteAddress = ctx.attributeAs<std::string>("remoteAddress").value_or("");
  ErrorReporting::setContext(info);

  Trace::clear();

  std::optional<Uuid> sessionId;
  if (auto raw = ctx.cookie(SESSION_COOKIE)) {
    sessionId = parseUuid(*raw);
  }
  if (!sessionId) {
    sessionId = newUuid4();
    Cookie cookie;
    cookie.name = SESSION_COOKIE;
    cookie.value = toString(*sessionId);
    cookie.httpOnly = true;
    cookie.secure = Environment::isNotLocal();
    ctx.cookie(cookie);
  }
  ctx.attribute("sessionId", *sessionId);

  Trace::sessionId(*sessionId);
  Trace::start("Web", ctx.path(), {{"url", ctx.path()}});
}

void WebApp::closeTrace(Context &ctx) {
  const auto &name = ctx.endpointHandlerPath().empty()
                         ? ctx.path()
                         : ctx.endpointHandlerPath();
  Trace::finish(name, traceExtraBuilder_->build(ctx));
}

void WebApp::start(std::optional<unsigned short> port) {
  if (server_ && server_->isRunning()) {
    WEB_LOG_WARN("Web application already running on port {}",
                 server_->local_port());
    return;
  }

  ServerConfig config = serverConfig_;
  if (port) {
    config.port = *port;
  }

  server_ = std::make_unique<HttpServer>(config);
  server_->setRequestHandler(
      [this](const HttpRequest &request, const std::string &remoteAddress) {
        return handle(request, remoteAddress);
      });
  server_->start();
}

void WebApp::stop() {
  if (server_) {
    server_->stop();
  }
}

bool WebApp::isRunning() const { return server_ && server_->isRunning(); }

unsigned short WebApp::port() const {
  return server_ ? server_->local_port() : serverConfig_.port;
}

} // namespace weblib
