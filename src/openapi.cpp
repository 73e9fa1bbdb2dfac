#include "openapi.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include "web_exceptions.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace weblib {

namespace {

std::string operationKey(http::verb method) {
  return string_utils::to_lower(std::string(http::to_string(method)));
}

} // namespace

std::string OpenApiGenerator::toOpenApiPath(const Route &route) {
  if (route.segments.empty()) {
    return "/";
  }

  std::string path;
  for (const auto &segment : route.segments) {
    path += "/";
    switch (segment.kind) {
    case RouteSegment::Kind::LITERAL:
      path += segment.text;
      break;
    case RouteSegment::Kind::PARAMETER:
    case RouteSegment::Kind::GREEDY_PARAMETER:
      path += "{" + segment.text + "}";
      break;
    case RouteSegment::Kind::WILDCARD:
      path += "*";
      break;
    }
  }
  return path;
}

nlohmann::json OpenApiGenerator::generate(const RouteTable &routes,
                                          const OpenApiInfo &info) {
  nlohmann::json document = {
      {"openapi", "3.0.3"},
      {"info", {{"title", info.title}, {"version", info.version}}},
      {"components",
       {{"securitySchemes",
         {{"BearerAuth",
           {{"type", "http"},
            {"scheme", "bearer"},
            {"bearerFormat", "JWT"}}}}}}},
      {"paths", nlohmann::json::object()}};

  if (!info.description.empty()) {
    document["info"]["description"] = info.description;
  }

  auto &paths = document["paths"];
  for (const auto &route : routes.routes()) {
    if (route.doc.ignore) {
      continue;
    }

    nlohmann::json operation = nlohmann::json::object();
    if (!route.doc.summary.empty()) {
      operation["summary"] = route.doc.summary;
    }
    if (!route.doc.description.empty()) {
      operation["description"] = route.doc.description;
    }
    if (!route.doc.operationId.empty()) {
      operation["operationId"] = route.doc.operationId;
    }
    if (!route.doc.tags.empty()) {
      operation["tags"] = route.doc.tags;
    }
    if (route.doc.deprecated) {
      operation["deprecated"] = true;
    }

    nlohmann::json parameters = nlohmann::json::array();
    for (const auto &segment : route.segments) {
      if (segment.kind == RouteSegment::Kind::PARAMETER ||
          segment.kind == RouteSegment::Kind::GREEDY_PARAMETER) {
        parameters.push_back({{"name", segment.text},
                              {"in", "path"},
                              {"required", true},
                              {"schema", {{"type", "string"}}}});
      }
    }
    if (!parameters.empty()) {
      operation["parameters"] = std::move(parameters);
    }

    if (!route.roles.empty()) {
      nlohmann::json requirement = nlohmann::json::object();
      requirement["BearerAuth"] = nlohmann::json::array();
      operation["security"] = nlohmann::json::array({requirement});
    }

    operation["responses"] = {{"200", {{"description", "OK"}}}};
    paths[toOpenApiPath(route)][operationKey(route.method)] =
        std::move(operation);
  }

  return document;
}

void SwaggerUi::install(RouteTable &routes, OpenApiInfo info,
                        OpenApiOptions options) {
  RouteDoc hidden;
  hidden.ignore = true;

  const RouteTable *table = &routes;
  routes.add(
      http::verb::get, options.documentPath,
      [table, info](Context &ctx) {
        ctx.contentType("application/json");
        ctx.result(OpenApiGenerator::generate(*table, info).dump());
      },
      hidden);

  auto pageHtml =
      page(info.title, options.documentPath, options.assetsPrefix);
  routes.add(
      http::verb::get, options.uiPath,
      [pageHtml](Context &ctx) { ctx.html(pageHtml); }, hidden);

  auto assetsDirectory = options.assetsDirectory;
  routes.add(
      http::verb::get, options.assetsPrefix + "/<asset>",
      [assetsDirectory](Context &ctx) {
        serveAsset(ctx, assetsDirectory, ctx.pathParam("asset"));
      },
      hidden);

  WEB_LOG_INFO("OpenAPI document at {}, Swagger UI at {}",
               options.documentPath, options.uiPath);
}

std::string SwaggerUi::page(const std::string &title,
                            const std::string &documentUrl,
                            const std::string &assetsPrefix) {
  std::ostringstream html;
  html << R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="utf-8">
    <title>)"
       << title << R"( - API Documentation</title>
    <link rel="stylesheet" href=")"
       << assetsPrefix << R"(/swagger-ui.css">
</head>
<body>
    <div id="swagger-ui"></div>
    <script src=")"
       << assetsPrefix << R"(/swagger-ui-bundle.js"></script>
    <script>
        window.ui = SwaggerUIBundle({
            url: ')"
       << documentUrl << R"(',
            dom_id: '#swagger-ui',
            deepLinking: true
        });
    </script>
</body>
</html>
)";
  return html.str();
}

std::string SwaggerUi::mimeType(const std::string &path) {
  if (string_utils::ends_with(path, ".html")) {
    return "text/html; charset=utf-8";
  }
  if (string_utils::ends_with(path, ".css")) {
    return "text/css";
  }
  if (string_utils::ends_with(path, ".js")) {
    return "application/javascript";
  }
  if (string_utils::ends_with(path, ".json") ||
      string_utils::ends_with(path, ".map")) {
    return "application/json";
  }
  if (string_utils::ends_with(path, ".png")) {
    return "image/png";
  }
  if (string_utils::ends_with(path, ".svg")) {
    return "image/svg+xml";
  }
  return "application/octet-stream";
}

void SwaggerUi::serveAsset(Context &ctx, const std::string &root,
                           const std::string &relativePath) {
  if (relativePath.empty() || string_utils::escapes_root(relativePath)) {
    throw NotFoundException("Asset not found", relativePath);
  }

  std::filesystem::path file = std::filesystem::path(root) / relativePath;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    throw NotFoundException("Asset not found", relativePath);
  }

  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    throw NotFoundException("Asset not found", relativePath);
  }
  std::ostringstream content;
  content << in.rdbuf();

  ctx.contentType(mimeType(relativePath));
  ctx.result(content.str());
}

} // namespace weblib
