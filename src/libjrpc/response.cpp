#include "jrpc/response.hpp"

#include <type_traits>
#include <utility>

#include "envelope_detail.hpp"
#include "jrpc/errors.hpp"

namespace jrpc {

response_object response_object::success(
    request_id id, json::value result, json::storage_ptr sp) {
  json::value owned(std::move(result), sp);
  return response_object{
    std::move(sp),
    success_response{version::v2, std::move(id), std::move(owned)}};
}

response_object response_object::failure(
    std::optional<request_id> id, error_object error, json::storage_ptr sp) {
  if (error.data) error.data = json::value(std::move(*error.data), sp);
  return response_object{
    std::move(sp),
    error_response{version::v2, std::move(id), std::move(error)}};
}

response_object response_object::from_json(
    std::string_view text, json::storage_ptr sp) {
  json::value root = detail::parse_object(text, sp);
  auto& obj = root.as_object();

  auto jsonrpc = detail::read_version(obj);

  if (auto* err = obj.if_contains("error")) {
    std::optional<request_id> id{};
    if (auto* id_v = obj.if_contains("id")) id = id_from_json(*id_v, true);
    auto error = error_object::from_json(*err);
    return response_object{
      std::move(sp), error_response{jsonrpc, std::move(id), std::move(error)}};
  }

  auto* id_v = obj.if_contains("id");
  if (!id_v) throw envelope_error{errc::missing_id};
  auto id = id_from_json(*id_v, false);

  auto* result = obj.if_contains("result");
  if (!result) throw envelope_error{errc::missing_result};

  json::value owned(std::move(*result));
  return response_object{
    std::move(sp), success_response{jsonrpc, std::move(*id), std::move(owned)}};
}

std::string response_object::to_json() const {
  json::object msg(sp_);
  std::visit(
      [&](auto&& w) {
        using T = std::decay_t<decltype(w)>;
        msg["jsonrpc"] = to_string(w.jsonrpc);
        if constexpr (std::is_same_v<T, success_response>) {
          msg["id"] = id_to_json(w.id, sp_);
          msg["result"] = w.result;
        } else {
          static_assert(std::is_same_v<T, error_response>);
          if (w.id) msg["id"] = id_to_json(*w.id, sp_);
          msg["error"] = w.error.to_json(sp_);
        }
      },
      body_);
  return json::serialize(msg);
}

std::optional<request_id> response_object::id() const {
  return std::visit(
      [](auto&& w) -> std::optional<request_id> { return w.id; }, body_);
}

}  // namespace jrpc
