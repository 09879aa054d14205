#include "jrpc/frame.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <limits>
#include <span>
#include <stdexcept>

#include "utils.hpp"

namespace jrpc {

frame_stream::frame_stream(std::size_t capacity) : buf_(capacity) {}

std::optional<std::string_view> frame_stream::buffered_message() {
  std::size_t unread{pos_ - start_};

  if (unread < header_size) {
    ensure_space(header_size);
    return std::nullopt;
  }

  auto length = utils::read_u32_le(
      std::span<const char, header_size>{buf_.data() + start_, header_size});
  std::size_t total{std::size_t{length} + header_size};

  if (unread < total) {
    ensure_space(total);
    return std::nullopt;
  }

  std::string_view msg{buf_.data() + start_ + header_size, length};
  start_ += total;
  return msg;
}

void frame_stream::ensure_space(std::size_t space) {
  if (buf_.size() < space) {
    throw buffer_too_small{
      fmt::format(
          "frame needs {} bytes but the buffer holds {}", space, buf_.size()),
      space, buf_.size()};
  }

  if (buf_.size() - start_ >= space) return;

  // Destination precedes source, so a forward copy is safe.
  std::size_t unread{pos_ - start_};
  std::copy(
      buf_.begin() + static_cast<std::ptrdiff_t>(start_),
      buf_.begin() + static_cast<std::ptrdiff_t>(pos_), buf_.begin());
  start_ = 0;
  pos_ = unread;
}

void frame_stream::feed(std::string_view bytes) {
  ensure_space(pos_ - start_ + bytes.size());
  std::copy(
      bytes.begin(), bytes.end(),
      buf_.begin() + static_cast<std::ptrdiff_t>(pos_));
  pos_ += bytes.size();
}

void frame_stream::encode_header(
    std::size_t length, std::array<char, header_size>& out) {
  if (length > std::numeric_limits<std::uint32_t>::max()) {
    utils::throwf<std::length_error>(
        "payload of {} bytes does not fit a frame", length);
  }
  utils::write_u32_le(static_cast<std::uint32_t>(length), out);
}

}  // namespace jrpc
