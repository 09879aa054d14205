#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include "jrpc/types.hpp"

namespace jrpc {

struct parse_error {
  bool operator==(const parse_error&) const = default;
};
struct invalid_request {
  bool operator==(const invalid_request&) const = default;
};
struct method_not_found {
  bool operator==(const method_not_found&) const = default;
};
struct invalid_params {
  bool operator==(const invalid_params&) const = default;
};
struct internal_error {
  bool operator==(const internal_error&) const = default;
};

/// Implementation-defined server error, -32099..-32000 inclusive.
class server_error {
 public:
  static constexpr std::int64_t min_value{-32099};
  static constexpr std::int64_t max_value{-32000};

  // Throws envelope_error(reserved_error_code) outside the server range.
  explicit server_error(std::int64_t value);

  std::int64_t value() const { return value_; }
  bool operator==(const server_error&) const = default;

 private:
  std::int64_t value_;
};

using error_code = std::variant<
    parse_error, invalid_request, method_not_found, invalid_params,
    internal_error, server_error>;

std::int64_t error_code_value(const error_code& code);

/// Decodes an integer into an error code.  Defined codes and the server
/// range are accepted.  Other values in [-32768, -32000) throw
/// reserved_error_code, everything else throws invalid_error_code.
error_code error_code_from_value(std::int64_t value);

struct error_object {
  error_code code;
  std::string message;
  std::optional<json::value> data{};

  json::value to_json(const json::storage_ptr& sp) const;
  static error_object from_json(const json::value& v);
};

/// Thrown by dispatch handlers to answer with a specific error response.
struct rpc_error : std::runtime_error {
  explicit rpc_error(error_object e)
      : std::runtime_error{e.message}, error{std::move(e)} {}
  rpc_error(error_code code, std::string message)
      : rpc_error{error_object{code, std::move(message)}} {}
  error_object error;
};

}  // namespace jrpc
