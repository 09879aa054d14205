#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jrpc {

/// Envelope validation and usage faults.  Each one is a distinct condition
/// that decoding or encoding reports instead of coercing the input.
enum class errc : std::uint8_t {
  parse_error,
  not_an_object,
  missing_version,
  version_not_string,
  unsupported_version,
  missing_method,
  method_should_be_string,
  empty_method,
  invalid_params,
  invalid_id,
  missing_id,
  missing_result,
  invalid_error_object,
  missing_error_code,
  invalid_error_code,
  reserved_error_code,
  missing_error_message,
  invalid_error_message,
  empty_batch,
};

std::string_view to_string(errc code);

struct envelope_error : std::runtime_error {
  envelope_error(errc c, const std::string& what)
      : std::runtime_error{what}, code{c} {}
  explicit envelope_error(errc c)
      : std::runtime_error{std::string{to_string(c)}}, code{c} {}
  errc code;
};

/// The peer closed the connection before a complete frame arrived.
struct connection_closed : std::runtime_error {
  connection_closed() : std::runtime_error{"connection closed"} {}
};

/// A frame does not fit in the fixed-capacity read buffer.
struct buffer_too_small : std::runtime_error {
  buffer_too_small(
      const std::string& what, std::size_t needed, std::size_t capacity)
      : std::runtime_error{what}, needed{needed}, capacity{capacity} {}
  std::size_t needed;
  std::size_t capacity;
};

}  // namespace jrpc
