#include "jrpc/client.hpp"

#include <boost/asio/connect.hpp>
#include <string>

#include "jrpc/errors.hpp"
#include "jrpc/logger.hpp"

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace jrpc {

client::client(client_options opts)
    : opts_{std::move(opts)}, stream_{opts_.buffer_size} {}

tcp::socket client::connect() {
  tcp::resolver resolver{ioc_};
  auto endpoints = resolver.resolve(opts_.host, std::to_string(opts_.port));
  tcp::socket socket{ioc_};
  auto ep = asio::connect(socket, endpoints);
  LOG_DEBUG("connected to {}:{}", ep.address().to_string(), ep.port());
  return socket;
}

maybe_batch<response_object> client::call(
    const maybe_batch<request_object>& request) {
  if (request.empty()) throw envelope_error{errc::empty_batch};
  auto payload = request.to_payload();

  auto socket = connect();
  frame_stream::write_message(socket, payload);

  stream_.reset();
  auto reply = stream_.read_message(socket);
  LOG_DEBUG(
      "call: sent {} request(s) in {} bytes, got {} bytes back",
      request.size(), payload.size(), reply.size());

  // The reply view dies with the next read; responses copy it into their
  // own arenas.
  return maybe_batch<response_object>::from_payload(reply);
}

void client::cast(const request_object& request) {
  auto payload = request.to_json();
  auto socket = connect();
  frame_stream::write_message(socket, payload);
  LOG_DEBUG("cast: {} ({} bytes)", request.method(), payload.size());
}

}  // namespace jrpc
