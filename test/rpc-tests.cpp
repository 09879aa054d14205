#include <doctest/doctest.h>

#include <atomic>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "jrpc/batch.hpp"
#include "jrpc/client.hpp"
#include "jrpc/error_object.hpp"
#include "jrpc/errors.hpp"
#include "jrpc/frame.hpp"
#include "jrpc/server.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
using tcp = asio::ip::tcp;

namespace {

std::atomic<int> notifications_seen{0};

jrpc::dispatcher make_dispatcher(bool with_fallback = true) {
  jrpc::dispatcher d;
  d.add("sum", [](const jrpc::request_object& req, const json::storage_ptr& sp) {
    std::int64_t total{0};
    if (req.params()) {
      if (auto* arr = std::get_if<json::array>(&*req.params()))
        for (const auto& v : *arr) total += v.as_int64();
    }
    return json::value(total, sp);
  });
  d.add("fail", [](const jrpc::request_object&, const json::storage_ptr&) -> json::value {
    throw jrpc::rpc_error{jrpc::server_error{-32001}, "not today"};
  });
  d.add("crash", [](const jrpc::request_object&, const json::storage_ptr&) -> json::value {
    throw std::runtime_error{"kaboom"};
  });
  d.add("note", [](const jrpc::request_object&, const json::storage_ptr&) {
    ++notifications_seen;
    return json::value(nullptr);
  });
  if (with_fallback) {
    d.set_fallback([](const jrpc::request_object& req, const json::storage_ptr& sp) {
      return json::value(req.method(), sp);
    });
  }
  return d;
}

struct running_server {
  jrpc::server srv;
  std::atomic<bool> returned{false};
  std::thread thread;

  explicit running_server(
      jrpc::dispatcher d, jrpc::server_options opts = {.port = 0})
      : srv{std::move(opts), std::move(d)},
        thread{[this] {
          srv.run();
          returned = true;
        }} {}

  running_server() : running_server(make_dispatcher()) {}
  explicit running_server(jrpc::server_options opts)
      : running_server(make_dispatcher(), std::move(opts)) {}

  ~running_server() {
    srv.stop();
    thread.join();
  }

  jrpc::client_options client_options() const {
    return jrpc::client_options{.port = srv.port()};
  }
};

// Polls @p flag for up to five seconds.
bool eventually(const std::atomic<bool>& flag) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
  while (!flag.load() && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  return flag.load();
}

tcp::socket connect_to(asio::io_context& ioc, std::uint16_t port) {
  tcp::socket socket{ioc};
  socket.connect(tcp::endpoint{asio::ip::address_v4::loopback(), port});
  return socket;
}

jrpc::server make_local_server(bool with_fallback = true) {
  return jrpc::server{jrpc::server_options{.port = 0}, make_dispatcher(with_fallback)};
}

}  // namespace

TEST_CASE("handle-frame-echo") {
  auto srv = make_local_server();
  auto reply = srv.handle_frame(R"({"jsonrpc":"2.0","method":"echo","id":1})");
  REQUIRE(reply.has_value());
  CHECK(*reply == R"({"jsonrpc":"2.0","id":1,"result":"echo"})");
}

TEST_CASE("handle-frame-positional-params") {
  auto srv = make_local_server();
  auto reply = srv.handle_frame(
      R"({"jsonrpc":"2.0","method":"sum","params":[1,2,39],"id":"s"})");
  REQUIRE(reply.has_value());
  CHECK(*reply == R"({"jsonrpc":"2.0","id":"s","result":42})");
}

TEST_CASE("handle-frame-notification-gets-no-reply") {
  auto srv = make_local_server();
  CHECK_FALSE(srv.handle_frame(R"({"jsonrpc":"2.0","method":"echo"})").has_value());
  CHECK_FALSE(
      srv.handle_frame(R"({"jsonrpc":"2.0","method":"crash","id":null})").has_value());
}

TEST_CASE("handle-frame-batch-keeps-order-and-skips-notifications") {
  auto srv = make_local_server();
  auto reply = srv.handle_frame(
      R"({"jsonrpc":"2.0","method":"first","id":1})"
      "\n"
      R"({"jsonrpc":"2.0","method":"quiet"})"
      "\n"
      R"({"jsonrpc":"2.0","method":"third","id":3})");
  REQUIRE(reply.has_value());
  CHECK(
      *reply ==
      R"({"jsonrpc":"2.0","id":1,"result":"first"})"
      "\n"
      R"({"jsonrpc":"2.0","id":3,"result":"third"})");
}

TEST_CASE("handle-frame-batch-of-notifications") {
  auto srv = make_local_server();
  CHECK_FALSE(srv.handle_frame(
                     R"({"jsonrpc":"2.0","method":"a"})"
                     "\n"
                     R"({"jsonrpc":"2.0","method":"b"})")
                  .has_value());
}

TEST_CASE("handle-frame-method-not-found") {
  auto srv = make_local_server(false);
  auto reply = srv.handle_frame(R"({"jsonrpc":"2.0","method":"nope","id":7})");
  REQUIRE(reply.has_value());
  CHECK(
      *reply ==
      R"({"jsonrpc":"2.0","id":7,"error":{"code":-32601,"message":"Method not found","data":"nope"}})");
}

TEST_CASE("handle-frame-handler-errors") {
  auto srv = make_local_server();

  auto failed = srv.handle_frame(R"({"jsonrpc":"2.0","method":"fail","id":1})");
  REQUIRE(failed.has_value());
  CHECK(
      *failed ==
      R"({"jsonrpc":"2.0","id":1,"error":{"code":-32001,"message":"not today"}})");

  auto crashed = srv.handle_frame(R"({"jsonrpc":"2.0","method":"crash","id":2})");
  REQUIRE(crashed.has_value());
  CHECK(
      *crashed ==
      R"({"jsonrpc":"2.0","id":2,"error":{"code":-32603,"message":"Internal error","data":"kaboom"}})");
}

TEST_CASE("handle-frame-undecodable") {
  auto srv = make_local_server();
  CHECK_THROWS_AS(srv.handle_frame("{not json"), jrpc::envelope_error);
  CHECK_THROWS_AS(srv.handle_frame(R"({"jsonrpc":"2.0","id":1})"), jrpc::envelope_error);
}

TEST_CASE("error-reply-format") {
  CHECK(
      jrpc::server::error_reply(jrpc::envelope_error{jrpc::errc::parse_error, "bad"}) ==
      R"({"jsonrpc":"2.0","error":{"code":-32700,"message":"Parse error","data":"bad"}})");
  CHECK(
      jrpc::server::error_reply(jrpc::envelope_error{jrpc::errc::missing_method}) ==
      R"({"jsonrpc":"2.0","error":{"code":-32600,"message":"Invalid Request","data":"missing \"method\""}})");
}

TEST_CASE("client-call-echo") {
  running_server rs;
  jrpc::client c{rs.client_options()};

  auto res = c.call(jrpc::request_object{"echo", std::nullopt, jrpc::request_id{1}});

  REQUIRE_FALSE(res.is_batch());
  CHECK(res[0].to_json() == R"({"jsonrpc":"2.0","id":1,"result":"echo"})");
}

TEST_CASE("client-call-error-response") {
  running_server rs{make_dispatcher(false)};
  jrpc::client c{rs.client_options()};

  auto res = c.call(jrpc::request_object{"missing", std::nullopt, jrpc::request_id{"m"}});

  REQUIRE_FALSE(res[0].is_success());
  CHECK(std::holds_alternative<jrpc::method_not_found>(res[0].as_error().error.code));
  CHECK(res[0].id() == jrpc::request_id{std::string{"m"}});
}

TEST_CASE("client-call-batch") {
  running_server rs;
  jrpc::client c{rs.client_options()};

  std::vector<jrpc::request_object> batch;
  batch.emplace_back("sum", jrpc::params{json::array{2, 3}}, jrpc::request_id{1});
  batch.emplace_back("note");
  batch.emplace_back("hello", std::nullopt, jrpc::request_id{2});

  auto res = c.call(std::move(batch));

  REQUIRE(res.is_batch());
  REQUIRE(res.size() == 2);
  CHECK(res[0].to_json() == R"({"jsonrpc":"2.0","id":1,"result":5})");
  CHECK(res[1].to_json() == R"({"jsonrpc":"2.0","id":2,"result":"hello"})");
}

TEST_CASE("client-empty-batch-fails-before-io") {
  // Nothing listens on the client's port: any connect attempt would fail
  // with a transport error instead.
  jrpc::client_options opts{};
  {
    auto srv = make_local_server();
    opts.port = srv.port();
  }
  jrpc::client c{opts};
  CHECK(c.options().port == opts.port);

  try {
    c.call(std::vector<jrpc::request_object>{});
    FAIL("expected envelope_error");
  } catch (const jrpc::envelope_error& e) {
    CHECK(e.code == jrpc::errc::empty_batch);
  }
}

TEST_CASE("client-cast") {
  running_server rs;
  jrpc::client c{rs.client_options()};
  int before{notifications_seen.load()};

  c.cast(jrpc::request_object{"note"});

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
  while (notifications_seen.load() == before &&
         std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  CHECK(notifications_seen.load() == before + 1);
}

TEST_CASE("connection-notification-then-request") {
  running_server rs;
  asio::io_context ioc;
  tcp::socket socket{ioc};
  socket.connect(tcp::endpoint{asio::ip::address_v4::loopback(), rs.srv.port()});

  jrpc::frame_stream::write_message(socket, R"({"jsonrpc":"2.0","method":"note"})");
  jrpc::frame_stream::write_message(
      socket, R"({"jsonrpc":"2.0","method":"ping","id":2})");

  // The first reply on the wire answers the second frame.
  jrpc::frame_stream frames{4096};
  CHECK(frames.read_message(socket) == R"({"jsonrpc":"2.0","id":2,"result":"ping"})");
}

TEST_CASE("connection-undecodable-frame") {
  running_server rs;
  asio::io_context ioc;
  tcp::socket socket{ioc};
  socket.connect(tcp::endpoint{asio::ip::address_v4::loopback(), rs.srv.port()});

  jrpc::frame_stream::write_message(socket, "this is not json");

  jrpc::frame_stream frames{4096};
  auto reply = jrpc::response_object::from_json(frames.read_message(socket));
  REQUIRE_FALSE(reply.is_success());
  CHECK_FALSE(reply.id().has_value());
  CHECK(std::holds_alternative<jrpc::parse_error>(reply.as_error().error.code));

  CHECK_THROWS_AS(frames.read_message(socket), jrpc::connection_closed);
}

TEST_CASE("server-stop-with-open-connection") {
  running_server rs;
  asio::io_context ioc;
  auto socket = connect_to(ioc, rs.srv.port());

  // A round trip guarantees a connection thread is serving this socket.
  jrpc::frame_stream frames{4096};
  jrpc::frame_stream::write_message(
      socket, R"({"jsonrpc":"2.0","method":"ping","id":1})");
  REQUIRE(frames.read_message(socket) == R"({"jsonrpc":"2.0","id":1,"result":"ping"})");

  rs.srv.stop();

  CHECK(eventually(rs.returned));
  CHECK_THROWS_AS(frames.read_message(socket), jrpc::connection_closed);
  socket.close();
}

TEST_CASE("server-stop-while-all-slots-busy") {
  running_server rs{jrpc::server_options{.port = 0, .max_threads = 1}};
  asio::io_context ioc;

  auto busy = connect_to(ioc, rs.srv.port());
  jrpc::frame_stream frames{4096};
  jrpc::frame_stream::write_message(
      busy, R"({"jsonrpc":"2.0","method":"ping","id":1})");
  REQUIRE(frames.read_message(busy) == R"({"jsonrpc":"2.0","id":1,"result":"ping"})");

  // Accepted, then left waiting for the only slot.
  auto waiting = connect_to(ioc, rs.srv.port());
  std::this_thread::sleep_for(std::chrono::milliseconds{50});

  rs.srv.stop();

  CHECK(eventually(rs.returned));
  busy.close();
  waiting.close();
}

TEST_CASE("server-oversize-frame-drops-only-that-connection") {
  running_server rs{jrpc::server_options{.port = 0, .buffer_size = 64}};
  asio::io_context ioc;

  auto greedy = connect_to(ioc, rs.srv.port());
  std::string big{R"({"jsonrpc":"2.0","method":")" + std::string(200, 'x') +
                  R"(","id":1})"};
  jrpc::frame_stream::write_message(greedy, big);

  // The server hangs up without replying.  Unread bytes may turn the close
  // into a reset, so any read failure counts.
  jrpc::frame_stream frames{4096};
  CHECK_THROWS(frames.read_message(greedy));

  jrpc::client c{rs.client_options()};
  auto res = c.call(jrpc::request_object{"still-here", std::nullopt, jrpc::request_id{2}});
  CHECK(res[0].to_json() == R"({"jsonrpc":"2.0","id":2,"result":"still-here"})");
}

TEST_CASE("server-accept-errors") {
  using jrpc::server;
  CHECK(server::fatal_accept_error(asio::error::bad_descriptor));
  CHECK(server::fatal_accept_error(asio::error::operation_aborted));
  CHECK_FALSE(server::fatal_accept_error(asio::error::no_descriptors));
  CHECK_FALSE(server::fatal_accept_error(asio::error::connection_aborted));
  CHECK_FALSE(server::fatal_accept_error(asio::error::no_buffer_space));
}
