#pragma once

#include <boost/json.hpp>
#include <string_view>

#include "jrpc/types.hpp"

namespace jrpc::detail {

// Parses one envelope into @p sp.  Throws envelope_error(parse_error) for
// malformed JSON and envelope_error(not_an_object) for any non-object.
json::value parse_object(std::string_view text, const json::storage_ptr& sp);

// Validates the "jsonrpc" member.
version read_version(const json::object& obj);

}  // namespace jrpc::detail
