#include "router.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include <algorithm>

namespace weblib {

RouterRegistry &RouterRegistry::getInstance() {
  static RouterRegistry instance;
  return instance;
}

bool RouterRegistry::registerRouter(const std::string &package,
                                    const std::string &name,
                                    RouterFactory factory) {
  if (!factory) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(Entry{package, name, std::move(factory)});
  return true;
}

bool RouterRegistry::inPackage(const std::string &candidate,
                               const std::string &package) {
  if (package.empty() || candidate == package) {
    return true;
  }
  return candidate.size() > package.size() &&
         string_utils::starts_with(candidate, package) &&
         candidate[package.size()] == '.';
}

std::vector<const RouterRegistry::Entry *>
RouterRegistry::matching(const std::string &package) const {
  std::vector<const Entry *> found;
  for (const auto &entry : entries_) {
    if (inPackage(entry.package, package)) {
      found.push_back(&entry);
    }
  }
  std::stable_sort(found.begin(), found.end(),
                   [](const Entry *a, const Entry *b) {
                     return a->package < b->package;
                   });
  return found;
}

std::vector<std::unique_ptr<Router>>
RouterRegistry::discover(const std::string &package) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::unique_ptr<Router>> routers;
  for (const auto *entry : matching(package)) {
    auto router = entry->factory();
    if (!router) {
      ROUTER_LOG_WARN("Router factory for {} returned nothing", entry->name);
      continue;
    }
    ROUTER_LOG_DEBUG("Discovered router {} in {}", entry->name,
                     entry->package);
    routers.push_back(std::move(router));
  }

  ROUTER_LOG_INFO("Discovered {} router(s) under '{}'", routers.size(),
                  package);
  return routers;
}

std::vector<std::string>
RouterRegistry::registeredNames(const std::string &package) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto *entry : matching(package)) {
    names.push_back(entry->name);
  }
  return names;
}

} // namespace weblib
