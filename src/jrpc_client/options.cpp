#include "options.hpp"

#include <CLI/CLI.hpp>
#include <optional>

namespace jrpc::cli {

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, jrpc::client_options& copts,
    request_options& ropts) {
  CLI::App app{"Send JSON-RPC 2.0 requests over length-prefixed TCP frames"};

  app.add_option("--host", copts.host, "Server host")->capture_default_str();
  app.add_option("-p,--port", copts.port, "Server port")
      ->capture_default_str();
  app.add_option(
         "--buffer-size", copts.buffer_size,
         "Frame buffer capacity in bytes (largest accepted reply)")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  app.add_option("-d,--debug", loglevel, "Debug log level (3=INFO)")
      ->capture_default_str();
  app.add_option(
      "--id", ropts.id,
      "Request id; digits make an integer id, anything else a string");
  auto* notify = app.add_flag(
      "-n,--notify", ropts.notify,
      "Send a notification (no id) and do not wait for a reply");
  auto* from_stdin = app.add_flag(
      "--stdin", ropts.from_stdin,
      "Read one request per line from stdin and send them as one batch");
  auto* method = app.add_option("method", ropts.method, "Method to call");
  app.add_option(
      "params", ropts.params, "Parameters as a JSON array or object");

  notify->excludes(from_stdin);
  method->excludes(from_stdin);

  try {
    app.parse(static_cast<int>(args.size()), args.data());
    if (!ropts.from_stdin && ropts.method.empty())
      throw CLI::RequiredError{"method"};
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  return std::nullopt;
}

}  // namespace jrpc::cli
