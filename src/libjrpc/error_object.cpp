#include "jrpc/error_object.hpp"

#include <fmt/format.h>

#include <type_traits>

#include "jrpc/errors.hpp"

namespace jrpc {

namespace {

// Codes from -32768 to -32000 are reserved by the protocol.
constexpr std::int64_t reserved_min{-32768};
constexpr std::int64_t reserved_max{-32000};

}  // namespace

server_error::server_error(std::int64_t value) : value_{value} {
  if (value < min_value || value > max_value) {
    throw envelope_error{
      errc::reserved_error_code,
      fmt::format("{} is outside the server error range", value)};
  }
}

std::int64_t error_code_value(const error_code& code) {
  return std::visit(
      [](auto&& w) -> std::int64_t {
        using T = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<T, parse_error>) {
          return -32700;
        } else if constexpr (std::is_same_v<T, invalid_request>) {
          return -32600;
        } else if constexpr (std::is_same_v<T, method_not_found>) {
          return -32601;
        } else if constexpr (std::is_same_v<T, invalid_params>) {
          return -32602;
        } else if constexpr (std::is_same_v<T, internal_error>) {
          return -32603;
        } else {
          static_assert(std::is_same_v<T, server_error>);
          return w.value();
        }
      },
      code);
}

error_code error_code_from_value(std::int64_t value) {
  switch (value) {
    case -32700:
      return parse_error{};
    case -32600:
      return invalid_request{};
    case -32601:
      return method_not_found{};
    case -32602:
      return invalid_params{};
    case -32603:
      return internal_error{};
    default:
      break;
  }
  if (value >= server_error::min_value && value <= server_error::max_value)
    return server_error{value};
  if (value >= reserved_min && value < reserved_max) {
    throw envelope_error{
      errc::reserved_error_code,
      fmt::format("error code {} is reserved", value)};
  }
  throw envelope_error{
    errc::invalid_error_code, fmt::format("invalid error code {}", value)};
}

json::value error_object::to_json(const json::storage_ptr& sp) const {
  json::object err(sp);
  err["code"] = error_code_value(code);
  err["message"] = message;
  if (data) err["data"] = *data;
  return err;
}

error_object error_object::from_json(const json::value& v) {
  auto* obj = v.if_object();
  if (!obj) throw envelope_error{errc::invalid_error_object};

  auto* code_v = obj->if_contains("code");
  if (!code_v) throw envelope_error{errc::missing_error_code};
  auto* code = code_v->if_int64();
  if (!code) throw envelope_error{errc::invalid_error_code};

  auto* message_v = obj->if_contains("message");
  if (!message_v) throw envelope_error{errc::missing_error_message};
  auto* message = message_v->if_string();
  if (!message) throw envelope_error{errc::invalid_error_message};

  error_object res{error_code_from_value(*code), std::string{*message}};
  if (auto* data = obj->if_contains("data")) res.data = *data;
  return res;
}

}  // namespace jrpc
