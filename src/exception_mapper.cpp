#include "exception_mapper.hpp"
#include "error_reporter.hpp"
#include "logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace weblib {

namespace {

template <typename ExceptionType> int statusOf() {
  return static_cast<int>(ExceptionHttpStatus<ExceptionType>::value);
}

} // namespace

// ===== Default handlers =====

template <>
void DefaultExceptionHandler<ValidationException>::operator()(
    const ValidationException &error, Context &ctx) const {
  ctx.resetResult();
  ctx.json(error.errorsAsJson());
  ctx.status(statusOf<ValidationException>());
}

template <>
void DefaultExceptionHandler<UnauthorizedException>::operator()(
    const UnauthorizedException &, Context &ctx) const {
  ctx.resetResult();
  ctx.status(statusOf<UnauthorizedException>());
}

template <>
void DefaultExceptionHandler<NotFoundException>::operator()(
    const NotFoundException &, Context &ctx) const {
  ctx.resetResult();
  ctx.status(statusOf<NotFoundException>());
}

template <>
void DefaultExceptionHandler<std::exception>::operator()(
    const std::exception &error, Context &ctx) const {
  WebAppLogger::errorWithContext(
      std::string("Request failed: ") + error.what(),
      {{"method", ctx.method()},
       {"path", ctx.path()},
       {"type", ErrorReporting::typeName(error)}});
  ErrorReporting::report(error);
  ctx.resetResult();
  ctx.status(statusOf<std::exception>());
}

// ===== ExceptionMapper =====

bool ExceptionMapper::hasHandler(std::type_index type) const {
  return std::any_of(entries_.begin(), entries_.end(),
                     [type](const Entry &entry) { return entry.type == type; });
}

void ExceptionMapper::insert(Entry entry) {
  auto existing =
      std::find_if(entries_.begin(), entries_.end(),
                   [&entry](const Entry &e) { return e.type == entry.type; });
  if (existing != entries_.end()) {
    existing->invoke = std::move(entry.invoke);
    return;
  }

  // Keep every entry ahead of its base classes
  auto firstBase = std::find_if(
      entries_.begin(), entries_.end(),
      [&entry](const Entry &e) { return e.catchesProbe(entry.throwProbe); });
  entries_.insert(firstBase, std::move(entry));
}

bool ExceptionMapper::handle(const std::exception &error, Context &ctx) const {
  for (const auto &entry : entries_) {
    if (entry.invoke(error, ctx)) {
      return true;
    }
  }
  return false;
}

bool ExceptionMapper::handle(std::exception_ptr error, Context &ctx) const {
  if (!error) {
    return false;
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return handle(e, ctx);
  } catch (...) {
    const std::runtime_error unknown("Unknown non-standard exception");
    return handle(unknown, ctx);
  }
}

std::vector<std::type_index> ExceptionMapper::dispatchOrder() const {
  std::vector<std::type_index> order;
  order.reserve(entries_.size());
  for (const auto &entry : entries_) {
    order.push_back(entry.type);
  }
  return order;
}

void registerDefaultHandlers(ExceptionMapper &mapper) {
  boost::hana::for_each(DefaultExceptionTypes{}, [&mapper](auto type) {
    using ExceptionType = typename decltype(type)::type;
    if (!mapper.hasHandler<ExceptionType>()) {
      mapper.registerHandler<ExceptionType>(
          DefaultExceptionHandler<ExceptionType>{});
    }
  });
}

} // namespace weblib
