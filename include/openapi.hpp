#pragma once

#include "route_table.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace weblib {

struct OpenApiInfo {
  std::string title;
  std::string version;
  std::string description;
};

struct OpenApiOptions {
  std::string documentPath = "/openapi";
  std::string uiPath = "/";
  std::string assetsPrefix = "/webjars/swagger-ui";
  std::string assetsDirectory = "swagger-ui";
};

/**
 * OpenAPI 3.0.3 document built from a route table. Path parameters come from
 * the route patterns; documented routes add summary, description, tags and
 * operationId. Routes with RouteDoc::ignore set are left out.
 */
class OpenApiGenerator {
public:
  static nlohmann::json generate(const RouteTable &routes,
                                 const OpenApiInfo &info);

  // "/users/<path>" -> "/users/{path}"
  static std::string toOpenApiPath(const Route &route);
};

/**
 * Swagger UI pages and the /openapi endpoint, registered as ordinary routes.
 */
class SwaggerUi {
public:
  static void install(RouteTable &routes, OpenApiInfo info,
                      OpenApiOptions options);

  static std::string page(const std::string &title,
                          const std::string &documentUrl,
                          const std::string &assetsPrefix);

  // Streams a file below root; missing files and escapes are NotFound
  static void serveAsset(Context &ctx, const std::string &root,
                         const std::string &relativePath);

  static std::string mimeType(const std::string &path);
};

} // namespace weblib
