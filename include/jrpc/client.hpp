#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

#include "jrpc/batch.hpp"
#include "jrpc/frame.hpp"
#include "jrpc/request.hpp"
#include "jrpc/response.hpp"

namespace jrpc {

struct client_options {
  std::string host{"127.0.0.1"};
  std::uint16_t port{7070};
  std::size_t buffer_size{64 * 1024};
};

/// Blocking JSON-RPC client.  Every call or cast opens its own TCP
/// connection and closes it before returning.  There is no timeout: a peer
/// that never answers blocks call() forever.
class client {
 public:
  explicit client(client_options opts);

  client(const client&) = delete;
  client(client&&) = delete;
  client& operator=(const client&) = delete;
  client& operator=(client&&) = delete;
  ~client() = default;

  /// Writes one frame with the request(s) and reads exactly one reply
  /// frame.  An empty batch throws envelope_error(empty_batch) before any
  /// I/O.  A peer that closes without replying yields connection_closed.
  maybe_batch<response_object> call(const maybe_batch<request_object>& request);

  /// Writes one frame and closes without reading.
  void cast(const request_object& request);

  const client_options& options() const { return opts_; }

 private:
  boost::asio::ip::tcp::socket connect();

  client_options opts_;
  boost::asio::io_context ioc_;
  frame_stream stream_;
};

}  // namespace jrpc
