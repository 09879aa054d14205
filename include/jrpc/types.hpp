#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace jrpc {

namespace json = boost::json;

/// JSON-RPC protocol version.  Only "2.0" exists.
enum class version { v2 };

version version_from_string(std::string_view text);
std::string_view to_string(version v);

/// Request identifier.  An absent id (std::nullopt at the use sites) marks
/// a notification.
using request_id = std::variant<std::int64_t, std::string>;

/// Positional or named parameters.
using params = std::variant<json::array, json::object>;

json::value id_to_json(const request_id& id, const json::storage_ptr& sp);
json::value params_to_json(const params& p, const json::storage_ptr& sp);

// Reads an "id" member.  Integers and strings yield an id, null yields
// std::nullopt when allow_null is set, anything else throws invalid_id.
std::optional<request_id> id_from_json(const json::value& v, bool allow_null);

/// Returns a fresh, ref-counted arena.  Every envelope allocates its JSON
/// structures from one of these unless the caller provides a scope.
json::storage_ptr make_arena();

}  // namespace jrpc
