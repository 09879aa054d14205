#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json.hpp>
#include <csignal>
#include <exception>
#include <thread>

#include "jrpc/logger.hpp"
#include "jrpc/server.hpp"

namespace asio = boost::asio;
namespace json = boost::json;

namespace {

// Answers every method with its own name.
json::value echo_method(
    const jrpc::request_object& req, const json::storage_ptr& sp) {
  return json::value(req.method(), sp);
}

int parse_options(
    int argc, char* argv[], jrpc::server_options& opts, int& loglevel) {
  CLI::App app{"JSON-RPC 2.0 echo server (length-prefixed frames over TCP)"};

  app.add_option("--host", opts.host, "Address to listen on")
      ->capture_default_str();
  app.add_option("-p,--port", opts.port, "TCP port to listen on")
      ->capture_default_str();
  app.add_option(
         "--buffer-size", opts.buffer_size,
         "Frame buffer capacity in bytes (largest accepted message)")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  app.add_option(
         "--max-threads", opts.max_threads,
         "Maximum number of connections served at once")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  app.add_option("-d,--debug", loglevel, "Debug log level (3=INFO)")
      ->capture_default_str();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }
  return -1;
}

}  // namespace

int main(int argc, char* argv[]) {
  jrpc::server_options opts{};
  int loglevel{3};

  if (auto done = parse_options(argc, argv, opts, loglevel); done >= 0)
    return done;
  jrpc::logger::set_level(loglevel);

  try {
    jrpc::dispatcher dispatch;
    dispatch.set_fallback(echo_method);

    jrpc::server srv{opts, std::move(dispatch)};

    asio::io_context signal_ctx;
    asio::signal_set signals{signal_ctx, SIGINT, SIGTERM};
    signals.async_wait([&srv](const boost::system::error_code& ec, int sig) {
      if (ec) return;
      LOG_INFO("caught signal {}, shutting down", sig);
      srv.stop();
    });
    std::thread signal_thread{[&signal_ctx]() { signal_ctx.run(); }};

    auto stop_signals = [&]() {
      signal_ctx.stop();
      signal_thread.join();
    };
    try {
      srv.run();
    } catch (...) {
      stop_signals();
      throw;
    }
    stop_signals();
    return 0;
  } catch (const std::exception& e) {
    LOG_FATAL("{}", e.what());
    return 1;
  }
}
