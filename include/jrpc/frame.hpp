#pragma once

/**
 * @file frame.hpp
 * @brief Length-prefixed message framing over blocking byte streams.
 *
 * Each message on the wire is a 4-byte little-endian unsigned length
 * followed by exactly that many bytes of UTF-8 JSON text.  The stream-facing
 * members are templates over the Boost.ASIO @c SyncReadStream and
 * @c SyncWriteStream concepts, so a @c tcp::socket, a
 * @c posix::stream_descriptor or an in-memory test stream all work.
 */

#include <array>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "jrpc/errors.hpp"

namespace jrpc {

/** @brief Reassembles frames from a byte stream into a fixed buffer.
 *
 * The buffer holds unconsumed bytes between @c start() and @c pos().  It
 * never grows: a frame larger than @c capacity() fails with
 * @c buffer_too_small, so callers size it for the largest message they
 * expect.  A frame_stream belongs to exactly one connection direction.
 */
class frame_stream {
 public:
  static constexpr std::size_t header_size{4};

  explicit frame_stream(std::size_t capacity);

  /** @brief Read one framed message from @p stream.
   *
   * Blocks until a whole frame is buffered.  The returned view points into
   * this object's buffer and stays valid only until the next call to
   * @c read_message or @c reset.  Throws @c connection_closed when the
   * peer closes the stream, @c buffer_too_small when the frame cannot fit,
   * and @c boost::system::system_error for other transport errors.
   */
  template <typename SyncReadStream>
  std::string_view read_message(SyncReadStream& stream) {
    for (;;) {
      if (auto msg = buffered_message()) return *msg;

      boost::system::error_code ec;
      std::size_t n = stream.read_some(
          boost::asio::buffer(buf_.data() + pos_, buf_.size() - pos_), ec);
      if (ec == boost::asio::error::eof) throw connection_closed{};
      if (ec) throw boost::system::system_error{ec};
      if (n == 0) throw connection_closed{};
      pos_ += n;
    }
  }

  /** @brief Write @p payload to @p stream as one frame.
   *
   * The length prefix and the payload go out as a single gather write;
   * short writes are continued until both segments are flushed.
   */
  template <typename SyncWriteStream>
  static void write_message(SyncWriteStream& stream, std::string_view payload) {
    std::array<char, header_size> header{};
    encode_header(payload.size(), header);

    std::array<boost::asio::const_buffer, 2> segments{
      boost::asio::buffer(header),
      boost::asio::buffer(payload.data(), payload.size())};
    boost::asio::write(stream, segments);
  }

  /// Extracts a complete frame from already-buffered bytes, if any.  When
  /// none is complete, makes room for the rest of it and returns nullopt.
  std::optional<std::string_view> buffered_message();

  /// Guarantees @p space bytes of room counted from start(), compacting
  /// unconsumed bytes to the front when needed.
  void ensure_space(std::size_t space);

  /// Forgets all buffered bytes.
  void reset() { start_ = pos_ = 0; }

  std::size_t capacity() const { return buf_.size(); }
  std::size_t start() const { return start_; }
  std::size_t pos() const { return pos_; }
  std::string_view unprocessed() const {
    return {buf_.data() + start_, pos_ - start_};
  }

  /// Appends raw bytes as if they had been read from a stream.  Throws
  /// buffer_too_small when they do not fit behind pos().
  void feed(std::string_view bytes);

  static void encode_header(
      std::size_t length, std::array<char, header_size>& out);

 private:
  std::vector<char> buf_;
  std::size_t start_{0};
  std::size_t pos_{0};
};

}  // namespace jrpc
