#pragma once

#include <optional>
#include <span>
#include <string>

#include "jrpc/client.hpp"

namespace jrpc::cli {

struct request_options {
  std::string method{};
  std::optional<std::string> params{};  // JSON text
  std::optional<std::string> id{};
  bool notify{};
  bool from_stdin{};
};

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, jrpc::client_options& copts,
    request_options& ropts);

}  // namespace jrpc::cli
