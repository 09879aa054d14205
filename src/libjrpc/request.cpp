#include "jrpc/request.hpp"

#include <type_traits>
#include <utility>

#include "envelope_detail.hpp"
#include "jrpc/errors.hpp"

namespace jrpc {

request_object::request_object(
    std::string method, std::optional<jrpc::params> params,
    std::optional<request_id> id, json::storage_ptr sp)
    : sp_{std::move(sp)}, method_{std::move(method)}, id_{std::move(id)} {
  if (method_.empty()) throw envelope_error{errc::empty_method};
  if (params) {
    // Move the caller's params into our own scope.
    params_ = std::visit(
        [this](auto&& w) -> jrpc::params {
          using T = std::decay_t<decltype(w)>;
          return T(std::move(w), sp_);
        },
        *params);
  }
}

request_object request_object::from_json(
    std::string_view text, json::storage_ptr sp) {
  request_object req{std::move(sp)};
  json::value root = detail::parse_object(text, req.sp_);
  auto& obj = root.as_object();

  req.jsonrpc_ = detail::read_version(obj);

  auto* method = obj.if_contains("method");
  if (!method) throw envelope_error{errc::missing_method};
  auto* method_str = method->if_string();
  if (!method_str) throw envelope_error{errc::method_should_be_string};
  if (method_str->empty()) throw envelope_error{errc::empty_method};
  req.method_ = std::string{*method_str};

  if (auto* p = obj.if_contains("params")) {
    if (auto* arr = p->if_array()) {
      req.params_ = std::move(*arr);
    } else if (auto* o = p->if_object()) {
      req.params_ = std::move(*o);
    } else {
      throw envelope_error{errc::invalid_params};
    }
  }

  if (auto* id = obj.if_contains("id")) req.id_ = id_from_json(*id, true);

  return req;
}

std::string request_object::to_json() const {
  json::object msg(sp_);
  msg["jsonrpc"] = to_string(jsonrpc_);
  msg["method"] = method_;
  if (params_) msg["params"] = params_to_json(*params_, sp_);
  if (id_) msg["id"] = id_to_json(*id_, sp_);
  return json::serialize(msg);
}

}  // namespace jrpc
