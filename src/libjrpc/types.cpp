#include "jrpc/types.hpp"

#include <fmt/format.h>

#include <system_error>
#include <type_traits>

#include "envelope_detail.hpp"
#include "jrpc/errors.hpp"

namespace jrpc {

std::string_view to_string(errc code) {
  // clang-format off
  switch (code) {
  case errc::parse_error:             return "parse error";
  case errc::not_an_object:           return "envelope is not a JSON object";
  case errc::missing_version:         return "missing \"jsonrpc\"";
  case errc::version_not_string:      return "\"jsonrpc\" should be a string";
  case errc::unsupported_version:     return "unsupported JSON-RPC version";
  case errc::missing_method:          return "missing \"method\"";
  case errc::method_should_be_string: return "\"method\" should be a string";
  case errc::empty_method:            return "\"method\" is empty";
  case errc::invalid_params:          return "\"params\" must be an array or object";
  case errc::invalid_id:              return "invalid \"id\"";
  case errc::missing_id:              return "missing \"id\"";
  case errc::missing_result:          return "missing \"result\"";
  case errc::invalid_error_object:    return "\"error\" must be an object";
  case errc::missing_error_code:      return "missing error \"code\"";
  case errc::invalid_error_code:      return "invalid error code";
  case errc::reserved_error_code:     return "reserved error code";
  case errc::missing_error_message:   return "missing error \"message\"";
  case errc::invalid_error_message:   return "error \"message\" should be a string";
  case errc::empty_batch:             return "empty batch";
  }
  // clang-format on
  return "unknown envelope error";
}

version version_from_string(std::string_view text) {
  if (text == "2.0") return version::v2;
  throw envelope_error{
    errc::unsupported_version,
    fmt::format("unsupported JSON-RPC version '{}'", text)};
}

std::string_view to_string(version v) {
  switch (v) {
    case version::v2:
      return "2.0";
  }
  return "2.0";
}

json::value id_to_json(const request_id& id, const json::storage_ptr& sp) {
  return std::visit(
      [&](auto&& w) -> json::value {
        using T = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<T, std::int64_t>) {
          return json::value(w, sp);
        } else {
          return json::value(json::string_view{w}, sp);
        }
      },
      id);
}

json::value params_to_json(const params& p, const json::storage_ptr& sp) {
  return std::visit(
      [&](auto&& w) -> json::value { return json::value(w, sp); }, p);
}

std::optional<request_id> id_from_json(const json::value& v, bool allow_null) {
  if (auto* i = v.if_int64()) return request_id{*i};
  if (auto* s = v.if_string()) return request_id{std::string{*s}};
  if (v.is_null() && allow_null) return std::nullopt;
  throw envelope_error{errc::invalid_id};
}

json::storage_ptr make_arena() {
  return json::make_shared_resource<json::monotonic_resource>();
}

namespace detail {

json::value parse_object(std::string_view text, const json::storage_ptr& sp) {
  std::error_code ec{};
  json::value root = json::parse(text, ec, sp);
  if (ec) {
    throw envelope_error{
      errc::parse_error, fmt::format("parse error: {}", ec.message())};
  }
  if (!root.is_object()) throw envelope_error{errc::not_an_object};
  return root;
}

version read_version(const json::object& obj) {
  auto* v = obj.if_contains("jsonrpc");
  if (!v) throw envelope_error{errc::missing_version};
  auto* s = v->if_string();
  if (!s) throw envelope_error{errc::version_not_string};
  return version_from_string(*s);
}

}  // namespace detail

}  // namespace jrpc
