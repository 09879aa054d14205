#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/json.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "jrpc/errors.hpp"
#include "jrpc/request.hpp"
#include "jrpc/response.hpp"

namespace jrpc {

/// Application handler.  Returns the result of a call, allocated from @p sp
/// where possible.  Throw rpc_error to answer with a specific error; any
/// other exception becomes internal_error.
using handler = std::function<json::value(
    const request_object& req, const json::storage_ptr& sp)>;

/// Routes requests to handlers by method name.
class dispatcher {
 public:
  void add(std::string method, handler h);
  /// Handles every method without an entry of its own.
  void set_fallback(handler h) { fallback_ = std::move(h); }

  /// Runs the handler for @p req.  Returns the response for an id-bearing
  /// request and std::nullopt for a notification.  Handler failures become
  /// error responses and never escape.
  std::optional<response_object> operator()(
      const request_object& req, const json::storage_ptr& sp) const;

 private:
  const handler* find(const std::string& method) const;

  std::unordered_map<std::string, handler> methods_;
  handler fallback_;
};

struct server_options {
  std::string host{"127.0.0.1"};
  std::uint16_t port{7070};
  std::size_t buffer_size{64 * 1024};
  std::size_t max_threads{4};
};

/// Blocking JSON-RPC server.  The listening socket is bound on
/// construction, so port() is valid before run().
class server {
 public:
  server(server_options opts, dispatcher dispatch);

  server(const server&) = delete;
  server(server&&) = delete;
  server& operator=(const server&) = delete;
  server& operator=(server&&) = delete;
  ~server() = default;

  /// Decodes one frame payload, dispatches every request in arrival order
  /// and returns the reply payload, or std::nullopt when the frame held
  /// only notifications.  All allocations for the frame come from one
  /// scope released before returning.  Throws envelope_error when the
  /// frame cannot be decoded.
  std::optional<std::string> handle_frame(std::string_view text) const;

  /// Reply sent for a frame that failed to decode: an error response
  /// without id, parse_error for malformed JSON and invalid_request
  /// otherwise.
  static std::string error_reply(const envelope_error& e);

  /// Processes frames from one connection until the peer closes it or a
  /// frame fails to decode.  Transport errors propagate.
  void serve_connection(boost::asio::ip::tcp::socket& socket) const;

  /// True for accept() failures that mean the acceptor itself is gone.
  /// run() logs and retries every other failure.
  static bool fatal_accept_error(const boost::system::error_code& ec);

  /// Accepts connections, one thread each, until stop().  Joins the
  /// connection threads still running before returning.
  void run();

  /// Makes run() return.  Open connections are shut down, so a peer
  /// that keeps its socket idle does not hold the server up.  Safe to call
  /// from any thread.
  void stop();

  std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

 private:
  // Returns false, leaving the socket untracked, once stop() has begun.
  bool track(boost::asio::ip::tcp::socket& socket);
  void untrack(boost::asio::ip::tcp::socket& socket);

  server_options opts_;
  dispatcher dispatch_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::atomic<bool> stopping_{false};
  std::mutex connections_mutex_;
  std::unordered_set<boost::asio::ip::tcp::socket*> connections_;
};

}  // namespace jrpc
