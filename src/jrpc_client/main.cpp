#include <boost/json.hpp>
#include <boost/system/system_error.hpp>
#include <charconv>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "jrpc/logger.hpp"
#include "jrpc/batch.hpp"
#include "jrpc/client.hpp"
#include "jrpc/errors.hpp"
#include "options.hpp"

namespace json = boost::json;

namespace {

jrpc::request_id parse_id(const std::string& text) {
  std::int64_t n{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
  if (ec == std::errc{} && end == text.data() + text.size()) return n;
  return text;
}

std::optional<jrpc::params> parse_params(const std::optional<std::string>& text) {
  if (!text) return std::nullopt;
  std::error_code ec{};
  json::value v = json::parse(*text, ec);
  if (ec) throw jrpc::envelope_error{jrpc::errc::parse_error, ec.message()};
  if (auto* arr = v.if_array()) return std::move(*arr);
  if (auto* obj = v.if_object()) return std::move(*obj);
  throw jrpc::envelope_error{jrpc::errc::invalid_params};
}

// Reads one request per non-empty line from stdin.
std::vector<jrpc::request_object> read_requests(std::istream& in) {
  std::vector<jrpc::request_object> requests;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    requests.push_back(jrpc::request_object::from_json(line));
  }
  return requests;
}

}  // namespace

int main(int argc, char* argv[]) {
  jrpc::client_options copts{};
  jrpc::cli::request_options ropts{};
  int loglevel{3};

  auto done =
      jrpc::cli::parse_options(std::span(argv, argc), loglevel, copts, ropts);
  if (done) return done.value();

  jrpc::logger::set_level(loglevel);
  LOG_DEBUG("loglevel={}", loglevel);

  try {
    jrpc::client client{copts};

    if (ropts.notify) {
      client.cast(jrpc::request_object{ropts.method, parse_params(ropts.params)});
      return 0;
    }

    auto request = [&]() -> jrpc::maybe_batch<jrpc::request_object> {
      if (ropts.from_stdin) return read_requests(std::cin);
      return jrpc::request_object{
        ropts.method, parse_params(ropts.params),
        ropts.id ? parse_id(*ropts.id) : jrpc::request_id{std::int64_t{1}}};
    }();

    auto response = client.call(request);

    int retval{0};
    for (const auto& r : response.items()) {
      std::cout << r.to_json() << "\n";
      if (!r.is_success()) retval = 1;
    }
    return retval;
  } catch (const jrpc::envelope_error& e) {
    LOG_ERROR("bad envelope: {}", e.what());
  } catch (const jrpc::connection_closed&) {
    LOG_ERROR("server closed the connection without replying");
  } catch (const boost::system::system_error& e) {
    LOG_ERROR("transport error: {}", e.what());
  } catch (const std::exception& e) {
    LOG_ERROR("{}", e.what());
  }
  return 2;
}
