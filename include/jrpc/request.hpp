#pragma once

#include <boost/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "jrpc/types.hpp"

namespace jrpc {

/// A JSON-RPC request or notification.
///
/// The object owns the allocation scope its JSON structures live in
/// (params as given to the constructor or parsed by from_json, and the
/// scratch objects built by to_json).  By default that scope is a private
/// arena released with the object; callers can instead pass a scope they
/// control, in which case the object must not outlive it.
class request_object {
 public:
  request_object(
      std::string method, std::optional<jrpc::params> params = std::nullopt,
      std::optional<request_id> id = std::nullopt,
      json::storage_ptr sp = make_arena());

  request_object(const request_object&) = delete;
  request_object& operator=(const request_object&) = delete;
  request_object(request_object&&) = default;
  request_object& operator=(request_object&&) = default;
  ~request_object() = default;

  /// Parses and validates one request.  Throws envelope_error.
  static request_object from_json(
      std::string_view text, json::storage_ptr sp = make_arena());

  /// Compact JSON, fields ordered jsonrpc, method, params, id.
  std::string to_json() const;

  jrpc::version jsonrpc() const { return jsonrpc_; }
  const std::string& method() const { return method_; }
  const std::optional<jrpc::params>& params() const { return params_; }
  const std::optional<request_id>& id() const { return id_; }
  bool is_notification() const { return !id_.has_value(); }
  const json::storage_ptr& storage() const { return sp_; }

 private:
  explicit request_object(json::storage_ptr sp) : sp_{std::move(sp)} {}

  json::storage_ptr sp_;
  jrpc::version jsonrpc_{version::v2};
  std::string method_;
  std::optional<jrpc::params> params_;
  std::optional<request_id> id_;
};

}  // namespace jrpc
