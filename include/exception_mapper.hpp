#pragma once

#include "context.hpp"
#include "web_exceptions.hpp"
#include <boost/beast/http.hpp>
#include <boost/hana.hpp>
#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>

namespace weblib {

// ============================================================================
// Compile-time registry of the exception types mapped by default
// ============================================================================

using DefaultExceptionTypes =
    boost::hana::tuple<boost::hana::type<ValidationException>,
                       boost::hana::type<UnauthorizedException>,
                       boost::hana::type<NotFoundException>,
                       boost::hana::type<std::exception>>;

template <typename ExceptionType> struct ExceptionHttpStatus;

template <> struct ExceptionHttpStatus<ValidationException> {
  static constexpr http::status value = http::status::bad_request;
};

template <> struct ExceptionHttpStatus<UnauthorizedException> {
  static constexpr http::status value = http::status::forbidden;
};

template <> struct ExceptionHttpStatus<NotFoundException> {
  static constexpr http::status value = http::status::not_found;
};

template <> struct ExceptionHttpStatus<std::exception> {
  static constexpr http::status value = http::status::internal_server_error;
};

template <typename ExceptionType>
constexpr bool is_default_exception =
    boost::hana::contains(DefaultExceptionTypes{},
                          boost::hana::type_c<ExceptionType>);

// Default response for each type in DefaultExceptionTypes
template <typename ExceptionType> struct DefaultExceptionHandler {
  static_assert(is_default_exception<ExceptionType>,
                "No default handler for this exception type");
  void operator()(const ExceptionType &error, Context &ctx) const;
};

template <>
void DefaultExceptionHandler<ValidationException>::operator()(
    const ValidationException &error, Context &ctx) const;
template <>
void DefaultExceptionHandler<UnauthorizedException>::operator()(
    const UnauthorizedException &error, Context &ctx) const;
template <>
void DefaultExceptionHandler<NotFoundException>::operator()(
    const NotFoundException &error, Context &ctx) const;
template <>
void DefaultExceptionHandler<std::exception>::operator()(
    const std::exception &error, Context &ctx) const;

// ============================================================================
// ExceptionMapper
// ============================================================================

template <typename ExceptionType>
using ExceptionHandlerFunc =
    std::function<void(const ExceptionType &, Context &)>;

/**
 * Maps exceptions escaping a handler to responses. Handlers are registered
 * per exception type; on dispatch the handler of the most derived registered
 * type the exception is an instance of wins, independent of registration
 * order. Registering a type again replaces its handler.
 */
class ExceptionMapper {
public:
  ExceptionMapper() = default;

  ExceptionMapper(const ExceptionMapper &) = delete;
  ExceptionMapper &operator=(const ExceptionMapper &) = delete;

  template <typename ExceptionType, typename Handler>
  void registerHandler(Handler &&handler) {
    static_assert(std::is_base_of_v<std::exception, ExceptionType>,
                  "Handled types must derive from std::exception");

    Entry entry;
    entry.type = std::type_index(typeid(ExceptionType));
    entry.typeName = typeid(ExceptionType).name();
    entry.throwProbe = [] { throw static_cast<const ExceptionType *>(nullptr); };
    entry.catchesProbe = [](const std::function<void()> &probe) {
      return catchesAs<ExceptionType>(probe);
    };
    entry.invoke = [fn = ExceptionHandlerFunc<ExceptionType>(
                        std::forward<Handler>(handler))](
                       const std::exception &error, Context &ctx) {
      if (const auto *typed = dynamic_cast<const ExceptionType *>(&error)) {
        fn(*typed, ctx);
        return true;
      }
      return false;
    };
    insert(std::move(entry));
  }

  template <typename ExceptionType> bool hasHandler() const {
    return hasHandler(std::type_index(typeid(ExceptionType)));
  }

  /**
   * Runs the best matching handler for the exception held by error.
   * Exceptions not derived from std::exception are dispatched as a
   * std::runtime_error. Returns false when no handler matched.
   */
  bool handle(std::exception_ptr error, Context &ctx) const;
  bool handle(const std::exception &error, Context &ctx) const;

  size_t size() const { return entries_.size(); }

  // Registration order after specificity sorting, most specific first
  std::vector<std::type_index> dispatchOrder() const;

private:
  struct Entry {
    std::type_index type = std::type_index(typeid(void));
    std::string typeName;
    std::function<void()> throwProbe;
    std::function<bool(const std::function<void()> &)> catchesProbe;
    std::function<bool(const std::exception &, Context &)> invoke;
  };

  // True when a pointer thrown by probe converts to const ExceptionType *,
  // i.e. the probed type is ExceptionType or derives from it
  template <typename ExceptionType>
  static bool catchesAs(const std::function<void()> &probe) {
    try {
      probe();
    } catch (const ExceptionType *) {
      return true;
    } catch (const volatile void *) {
      return false;
    }
    return false;
  }

  bool hasHandler(std::type_index type) const;
  void insert(Entry entry);

  std::vector<Entry> entries_;
};

// Registers DefaultExceptionHandler for every default type without a handler
void registerDefaultHandlers(ExceptionMapper &mapper);

} // namespace weblib
