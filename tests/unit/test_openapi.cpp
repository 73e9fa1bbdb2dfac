#include "logger.hpp"
#include "openapi.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace weblib;

class OpenApiTest : public ::testing::Test {
protected:
  void SetUp() override {
    Logger::getInstance().setLogLevel(LogLevel::FATAL);

    RouteDoc listDoc;
    listDoc.summary = "List notes";
    listDoc.tags = {"notes"};
    listDoc.operationId = "listNotes";
    routes_.add(http::verb::get, "/notes", noop, listDoc);
    routes_.add(http::verb::delete_, "/notes/{id}", noop, {}, {"admin"});
    routes_.add(http::verb::get, "/files/<path>", noop);

    RouteDoc hidden;
    hidden.ignore = true;
    routes_.add(http::verb::get, "/internal", noop, hidden);
  }

  void TearDown() override { Logger::getInstance().setLogLevel(LogLevel::INFO); }

  static void noop(Context &) {}

  RouteTable routes_;
  OpenApiInfo info_{"Notes", "1.0.0", ""};
};

TEST_F(OpenApiTest, DocumentDeclaresInfoAndBearerScheme) {
  auto document = OpenApiGenerator::generate(routes_, info_);

  EXPECT_EQ(document["openapi"], "3.0.3");
  EXPECT_EQ(document["info"]["title"], "Notes");
  EXPECT_EQ(document["info"]["version"], "1.0.0");
  EXPECT_FALSE(document["info"].contains("description"));
  EXPECT_EQ(document["components"]["securitySchemes"]["BearerAuth"]["scheme"],
            "bearer");
}

TEST_F(OpenApiTest, PathsCarryDocsParametersAndSecurity) {
  auto paths = OpenApiGenerator::generate(routes_, info_)["paths"];

  auto list = paths["/notes"]["get"];
  EXPECT_EQ(list["summary"], "List notes");
  EXPECT_EQ(list["operationId"], "listNotes");
  EXPECT_EQ(list["tags"][0], "notes");
  EXPECT_FALSE(list.contains("security"));

  auto remove = paths["/notes/{id}"]["delete"];
  ASSERT_EQ(remove["parameters"].size(), 1u);
  EXPECT_EQ(remove["parameters"][0]["name"], "id");
  EXPECT_EQ(remove["parameters"][0]["in"], "path");
  EXPECT_TRUE(remove["security"][0].contains("BearerAuth"));

  EXPECT_TRUE(paths.contains("/files/{path}"));
  EXPECT_FALSE(paths.contains("/internal"));
}

TEST_F(OpenApiTest, ConvertsPatternsToOpenApiPaths) {
  const auto &all = routes_.routes();
  EXPECT_EQ(OpenApiGenerator::toOpenApiPath(all[1]), "/notes/{id}");
  EXPECT_EQ(OpenApiGenerator::toOpenApiPath(all[2]), "/files/{path}");

  RouteTable root;
  root.add(http::verb::get, "/", noop);
  EXPECT_EQ(OpenApiGenerator::toOpenApiPath(root.routes()[0]), "/");
}

TEST_F(OpenApiTest, InstalledRoutesStayOutOfTheDocument) {
  OpenApiOptions options;
  SwaggerUi::install(routes_, info_, options);

  auto match = routes_.match(http::verb::get, "/openapi");
  ASSERT_TRUE(match.has_value());

  HttpRequest request{http::verb::get, "/openapi", 11};
  JsonMapper mapper;
  Context ctx(request, mapper);
  match->route->handler(ctx);

  auto document = nlohmann::json::parse(ctx.resultString());
  EXPECT_FALSE(document["paths"].contains("/openapi"));
  EXPECT_FALSE(document["paths"].contains("/"));
  EXPECT_TRUE(document["paths"].contains("/notes"));

  EXPECT_TRUE(routes_.match(http::verb::get, "/").has_value());
  EXPECT_TRUE(routes_.match(http::verb::get,
                            "/webjars/swagger-ui/swagger-ui.css")
                  .has_value());
}

TEST_F(OpenApiTest, PageReferencesDocumentAndAssets) {
  auto html = SwaggerUi::page("Notes", "/openapi", "/webjars/swagger-ui");
  EXPECT_NE(html.find("<title>Notes - API Documentation</title>"),
            std::string::npos);
  EXPECT_NE(html.find("url: '/openapi'"), std::string::npos);
  EXPECT_NE(html.find("/webjars/swagger-ui/swagger-ui-bundle.js"),
            std::string::npos);
}

TEST_F(OpenApiTest, ServesAssetsBelowRootOnly) {
  auto root = std::filesystem::temp_directory_path() /
              ("weblib_swagger_" + std::to_string(::getpid()));
  std::filesystem::create_directories(root);
  std::ofstream(root / "swagger-ui.css") << "body{}";

  HttpRequest request{http::verb::get, "/webjars/swagger-ui/swagger-ui.css",
                      11};
  JsonMapper mapper;
  Context ctx(request, mapper);

  SwaggerUi::serveAsset(ctx, root.string(), "swagger-ui.css");
  EXPECT_EQ(ctx.resultString(), "body{}");
  EXPECT_EQ(std::string(ctx.toResponse()[http::field::content_type]), "text/css");

  EXPECT_THROW(SwaggerUi::serveAsset(ctx, root.string(), "../etc/passwd"),
               NotFoundException);
  EXPECT_THROW(SwaggerUi::serveAsset(ctx, root.string(), "missing.js"),
               NotFoundException);

  std::filesystem::remove_all(root);
}

TEST_F(OpenApiTest, MimeTypesByExtension) {
  EXPECT_EQ(SwaggerUi::mimeType("index.html"), "text/html; charset=utf-8");
  EXPECT_EQ(SwaggerUi::mimeType("swagger-ui-bundle.js"),
            "application/javascript");
  EXPECT_EQ(SwaggerUi::mimeType("swagger-ui.js.map"), "application/json");
  EXPECT_EQ(SwaggerUi::mimeType("favicon-32x32.png"), "image/png");
  EXPECT_EQ(SwaggerUi::mimeType("LICENSE"), "application/octet-stream");
}
