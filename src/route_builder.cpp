#include "route_builder.hpp"
#include "string_utils.hpp"

namespace weblib {

RouteBuilder &RouteBuilder::get(const std::string &path, Handler handler,
                                RouteDoc doc, RoleSet roles) {
  return add(http::verb::get, path, std::move(handler), std::move(doc),
             std::move(roles));
}

RouteBuilder &RouteBuilder::post(const std::string &path, Handler handler,
                                 RouteDoc doc, RoleSet roles) {
  return add(http::verb::post, path, std::move(handler), std::move(doc),
             std::move(roles));
}

RouteBuilder &RouteBuilder::put(const std::string &path, Handler handler,
                                RouteDoc doc, RoleSet roles) {
  return add(http::verb::put, path, std::move(handler), std::move(doc),
             std::move(roles));
}

RouteBuilder &RouteBuilder::patch(const std::string &path, Handler handler,
                                  RouteDoc doc, RoleSet roles) {
  return add(http::verb::patch, path, std::move(handler), std::move(doc),
             std::move(roles));
}

RouteBuilder &RouteBuilder::del(const std::string &path, Handler handler,
                                RouteDoc doc, RoleSet roles) {
  return add(http::verb::delete_, path, std::move(handler), std::move(doc),
             std::move(roles));
}

RouteBuilder &RouteBuilder::head(const std::string &path, Handler handler,
                                 RouteDoc doc, RoleSet roles) {
  return add(http::verb::head, path, std::move(handler), std::move(doc),
             std::move(roles));
}

RouteBuilder &RouteBuilder::options(const std::string &path, Handler handler,
                                    RouteDoc doc, RoleSet roles) {
  return add(http::verb::options, path, std::move(handler), std::move(doc),
             std::move(roles));
}

RouteBuilder &RouteBuilder::add(http::verb method, const std::string &path,
                                Handler handler, RouteDoc doc, RoleSet roles) {
  table_.add(method, string_utils::join_paths(currentPrefix(), path),
             std::move(handler), std::move(doc), std::move(roles));
  return *this;
}

RouteBuilder &RouteBuilder::path(const std::string &prefix,
                                 const std::function<void()> &group) {
  prefixes_.push_back(prefix);
  try {
    group();
  } catch (...) {
    prefixes_.pop_back();
    throw;
  }
  prefixes_.pop_back();
  return *this;
}

std::string RouteBuilder::currentPrefix() const {
  std::string prefix;
  for (const auto &part : prefixes_) {
    prefix = string_utils::join_paths(prefix, part);
  }
  return prefix;
}

} // namespace weblib
