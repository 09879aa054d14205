#include "jrpc/server.hpp"

#include <array>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "jrpc/batch.hpp"
#include "jrpc/frame.hpp"
#include "jrpc/logger.hpp"

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace jrpc {

/// Dispatcher

void dispatcher::add(std::string method, handler h) {
  methods_[std::move(method)] = std::move(h);
}

const handler* dispatcher::find(const std::string& method) const {
  if (auto it = methods_.find(method); it != methods_.end())
    return &it->second;
  if (fallback_) return &fallback_;
  return nullptr;
}

std::optional<response_object> dispatcher::operator()(
    const request_object& req, const json::storage_ptr& sp) const {
  const auto& id = req.id();

  auto fail = [&](error_object err) -> std::optional<response_object> {
    if (!id) return std::nullopt;
    return response_object::failure(id, std::move(err), sp);
  };

  const handler* h = find(req.method());
  if (!h) {
    LOG_DEBUG("no handler for '{}'", req.method());
    return fail(error_object{
      method_not_found{}, "Method not found", json::value(req.method(), sp)});
  }

  json::value result(sp);
  try {
    result = (*h)(req, sp);
  } catch (const rpc_error& e) {
    return fail(e.error);
  } catch (const std::exception& e) {
    LOG_WARN("handler for '{}' threw: {}", req.method(), e.what());
    return fail(error_object{
      internal_error{}, "Internal error", json::value(e.what(), sp)});
  }

  if (!id) return std::nullopt;
  return response_object::success(*id, std::move(result), sp);
}

/// Server

server::server(server_options opts, dispatcher dispatch)
    : opts_{std::move(opts)},
      dispatch_{std::move(dispatch)},
      acceptor_{ioc_} {
  tcp::endpoint ep{asio::ip::make_address(opts_.host), opts_.port};
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address{true});
  acceptor_.bind(ep);
  acceptor_.listen();
}

std::optional<std::string> server::handle_frame(std::string_view text) const {
  // Scope for everything this frame allocates.
  std::array<unsigned char, 4096> initial{};
  json::monotonic_resource frame_arena{initial.data(), initial.size()};
  json::storage_ptr sp{&frame_arena};

  auto requests = maybe_batch<request_object>::from_payload(text, sp);

  std::vector<response_object> responses;
  for (const auto& req : requests.items()) {
    LOG_DEBUG("rpc: {}{}", req.method(), req.is_notification() ? " (notification)" : "");
    if (auto res = dispatch_(req, sp)) responses.push_back(std::move(*res));
  }

  if (responses.empty()) return std::nullopt;
  return maybe_batch<response_object>{std::move(responses)}.to_payload();
}

std::string server::error_reply(const envelope_error& e) {
  bool syntax{e.code == errc::parse_error};
  error_object err{
    syntax ? error_code{parse_error{}} : error_code{invalid_request{}},
    syntax ? "Parse error" : "Invalid Request", json::value(e.what())};
  return response_object::failure(std::nullopt, std::move(err)).to_json();
}

void server::serve_connection(tcp::socket& socket) const {
  frame_stream frames{opts_.buffer_size};

  for (;;) {
    std::string_view text{};
    try {
      text = frames.read_message(socket);
    } catch (const connection_closed&) {
      LOG_DEBUG("peer closed the connection");
      return;
    }
    LOG_DEBUG("frame of {} bytes", text.size());
    LOG_TRACE("<- {}", text);

    std::optional<std::string> reply{};
    try {
      reply = handle_frame(text);
    } catch (const envelope_error& e) {
      LOG_ERROR("dropping connection, undecodable frame: {}", e.what());
      frame_stream::write_message(socket, error_reply(e));
      return;
    }

    if (reply) {
      LOG_TRACE("-> {}", *reply);
      frame_stream::write_message(socket, *reply);
    }
  }
}

bool server::fatal_accept_error(const boost::system::error_code& ec) {
  return ec == asio::error::bad_descriptor ||
         ec == asio::error::operation_aborted;
}

void server::run() {
  struct worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  std::vector<worker> workers;

  auto reap = [&workers]() {
    std::erase_if(workers, [](worker& w) {
      if (!w.done->load()) return false;
      w.thread.join();
      return true;
    });
  };

  LOG_INFO("jrpc: listening on {}:{}", opts_.host, port());

  for (;;) {
    tcp::socket socket{ioc_};
    boost::system::error_code ec;
    acceptor_.accept(socket, ec);
    if (stopping_.load()) break;
    if (ec && fatal_accept_error(ec)) {
      LOG_ERROR("acceptor closed: {}", ec.message());
      break;
    }
    if (ec) {
      LOG_ERROR("accept failed: {}", ec.message());
      std::this_thread::sleep_for(std::chrono::milliseconds{5});
      continue;
    }

    // Simple back-pressure: spin until a slot opens.
    reap();
    while (workers.size() >= opts_.max_threads && !stopping_.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds{5});
      reap();
    }
    if (stopping_.load()) break;

    boost::system::error_code ec2;
    auto remote = socket.remote_endpoint(ec2);
    LOG_INFO(
        "connection from {}:{}", ec2 ? "?" : remote.address().to_string(),
        ec2 ? 0 : remote.port());

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread t{[this, done, s = std::move(socket)]() mutable {
      if (track(s)) {
        try {
          serve_connection(s);
        } catch (const std::exception& e) {
          LOG_ERROR("connection aborted: {}", e.what());
        }
        untrack(s);
      }
      boost::system::error_code ignored;
      s.close(ignored);
      done->store(true);
    }};
    workers.push_back(worker{std::move(t), std::move(done)});
  }

  for (auto& w : workers) w.thread.join();
  LOG_INFO("jrpc: server stopped");
}

bool server::track(tcp::socket& socket) {
  std::lock_guard lock{connections_mutex_};
  if (stopping_.load()) return false;
  connections_.insert(&socket);
  return true;
}

void server::untrack(tcp::socket& socket) {
  std::lock_guard lock{connections_mutex_};
  connections_.erase(&socket);
}

void server::stop() {
  if (stopping_.exchange(true)) return;

  // Unblock connection threads waiting in read_some(): they see eof.
  {
    std::lock_guard lock{connections_mutex_};
    for (auto* socket : connections_) {
      boost::system::error_code ignored;
      socket->shutdown(tcp::socket::shutdown_both, ignored);
    }
  }

  // Wake the blocking accept() with a throwaway connection.
  boost::system::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  if (ec) return;
  if (ep.address().is_unspecified()) {
    ep.address(
        ep.address().is_v6() ? asio::ip::address{asio::ip::address_v6::loopback()}
                             : asio::ip::address{asio::ip::address_v4::loopback()});
  }
  asio::io_context ioc;
  tcp::socket waker{ioc};
  waker.connect(ep, ec);
  if (ec) LOG_WARN("could not wake the acceptor: {}", ec.message());
}

}  // namespace jrpc
