#pragma once

#include <boost/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "jrpc/error_object.hpp"
#include "jrpc/types.hpp"

namespace jrpc {

struct success_response {
  jrpc::version jsonrpc{version::v2};
  request_id id;
  json::value result;
};

struct error_response {
  jrpc::version jsonrpc{version::v2};
  std::optional<request_id> id;
  error_object error;
};

/// A JSON-RPC response: exactly one of success_response or error_response.
/// Allocation scope rules are the same as for request_object.
class response_object {
 public:
  using body_type = std::variant<success_response, error_response>;

  static response_object success(
      request_id id, json::value result, json::storage_ptr sp = make_arena());
  static response_object failure(
      std::optional<request_id> id, error_object error,
      json::storage_ptr sp = make_arena());

  response_object(const response_object&) = delete;
  response_object& operator=(const response_object&) = delete;
  response_object(response_object&&) = default;
  response_object& operator=(response_object&&) = default;
  ~response_object() = default;

  /// Parses and validates one response.  Throws envelope_error.
  static response_object from_json(
      std::string_view text, json::storage_ptr sp = make_arena());

  std::string to_json() const;

  bool is_success() const {
    return std::holds_alternative<success_response>(body_);
  }
  const success_response& as_success() const {
    return std::get<success_response>(body_);
  }
  const error_response& as_error() const {
    return std::get<error_response>(body_);
  }
  const body_type& body() const { return body_; }
  std::optional<request_id> id() const;
  const json::storage_ptr& storage() const { return sp_; }

 private:
  response_object(json::storage_ptr sp, body_type body)
      : sp_{std::move(sp)}, body_{std::move(body)} {}

  json::storage_ptr sp_;
  body_type body_;
};

}  // namespace jrpc
