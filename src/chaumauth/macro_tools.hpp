#pragma once

#ifndef CHAUMAUTH_MACRO_TOOLS_HPP
#define CHAUMAUTH_MACRO_TOOLS_HPP

// NOLINTBEGIN(cppcoreguidelines-macro-usage, bugprone-macro-parentheses)

#define CONCAT(x, y) x##y
#define ASSIGN_OR_UNEXPECTED_NAME(x, y) CONCAT(x, y)

// std::expected<T, std::string> helpers, used by the arithmetic layer.

#define OSSL_CHECK_NULL_OR_UNEXPECTED(ptr, msg)                      \
  if ((ptr) == nullptr) [[unlikely]] {                               \
    return std::unexpected(std::format("{} {}", __FUNCTION__, msg)); \
  }

#define OSSL_CHECK_OR_UNEXPECTED(good, msg)                          \
  if ((good) not_eq 1) [[unlikely]] {                                \
    return std::unexpected(std::format("{} {}", __FUNCTION__, msg)); \
  }

#define UNEXPECTED_IF(condition, msg)                                     \
  if (condition) [[unlikely]] {                                           \
    return std::unexpected(std::format("({}): ({})", __FUNCTION__, msg)); \
  }

#define ASSIGN_OR_UNEXPECTED_IMPL(result_name, definition, expression) \
  auto &&result_name = (expression);                                   \
  if (not(result_name.has_value())) [[unlikely]] {                     \
    return std::unexpected(                                            \
        std::format("{}: {}", __FUNCTION__, result_name.error()));     \
  }                                                                    \
  definition = std::move(result_name.value());

#define ASSIGN_OR_UNEXPECTED(definition, expression)                        \
  ASSIGN_OR_UNEXPECTED_IMPL(                                                \
      ASSIGN_OR_UNEXPECTED_NAME(_error_or_value_, __COUNTER__), definition, \
      expression)

// Same as ASSIGN_OR_UNEXPECTED for std::expected<void, std::string>.
#define CHECK_OR_UNEXPECTED_IMPL(result_name, expression)          \
  if (auto &&result_name = (expression); not result_name.has_value()) \
      [[unlikely]] {                                                \
    return std::unexpected(                                         \
        std::format("{}: {}", __FUNCTION__, result_name.error()));  \
  }

#define CHECK_OR_UNEXPECTED(expression) \
  CHECK_OR_UNEXPECTED_IMPL(             \
      ASSIGN_OR_UNEXPECTED_NAME(_error_or_value_, __COUNTER__), expression)

// std::expected<T, chaumauth::AuthError> helpers, used by the protocol layer.

#define AUTH_UNEXPECTED_IF(condition, error_kind, msg)                     \
  if (condition) [[unlikely]] {                                            \
    return std::unexpected(chaumauth::AuthError{                           \
        .kind = (error_kind),                                              \
        .message = std::format("({}): ({})", __FUNCTION__, msg)});         \
  }

// Lifts a std::expected<T, std::string> into the protocol layer, tagging the
// failure with error_kind.
#define AUTH_ASSIGN_OR_UNEXPECTED_IMPL(result_name, definition, expression, \
                                       error_kind)                          \
  auto &&result_name = (expression);                                        \
  if (not(result_name.has_value())) [[unlikely]] {                          \
    return std::unexpected(chaumauth::AuthError{                            \
        .kind = (error_kind),                                               \
        .message = std::format("{}: {}", __FUNCTION__, result_name.error())}); \
  }                                                                         \
  definition = std::move(result_name.value());

#define AUTH_ASSIGN_OR_UNEXPECTED(definition, expression, error_kind)       \
  AUTH_ASSIGN_OR_UNEXPECTED_IMPL(                                           \
      ASSIGN_OR_UNEXPECTED_NAME(_error_or_value_, __COUNTER__), definition, \
      expression, error_kind)

// NOLINTEND(cppcoreguidelines-macro-usage, bugprone-macro-parentheses)

#endif /* CHAUMAUTH_MACRO_TOOLS_HPP */
