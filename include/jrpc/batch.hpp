#pragma once

#include <boost/json.hpp>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "jrpc/errors.hpp"

namespace jrpc {

/// Either one envelope or an ordered batch of them.
///
/// On the wire a batch is NOT a JSON array: members are serialized one per
/// line and joined with a single '\n', without a trailing newline.  A
/// payload holding exactly one line decodes as a single envelope.
///
/// T is request_object or response_object.
template <typename T>
class maybe_batch {
 public:
  maybe_batch(T single) : body_{std::move(single)} {}  // NOLINT
  maybe_batch(std::vector<T> batch) : body_{std::move(batch)} {}  // NOLINT

  /// Decodes each line with its own private arena.
  static maybe_batch from_payload(std::string_view payload) {
    return decode(payload, [](std::string_view line) {
      return T::from_json(line);
    });
  }

  /// Decodes every line into the caller's allocation scope.
  static maybe_batch from_payload(
      std::string_view payload, const boost::json::storage_ptr& sp) {
    return decode(payload, [&sp](std::string_view line) {
      return T::from_json(line, sp);
    });
  }

  /// Throws envelope_error(empty_batch) for a batch without members.
  std::string to_payload() const {
    if (auto* single = std::get_if<T>(&body_)) return single->to_json();
    const auto& members = std::get<std::vector<T>>(body_);
    if (members.empty()) throw envelope_error{errc::empty_batch};
    std::string out;
    for (std::size_t i = 0; i < members.size(); ++i) {
      if (i > 0) out += '\n';
      out += members[i].to_json();
    }
    return out;
  }

  bool is_batch() const {
    return std::holds_alternative<std::vector<T>>(body_);
  }
  std::span<const T> items() const {
    if (auto* single = std::get_if<T>(&body_)) return {single, 1};
    return std::get<std::vector<T>>(body_);
  }
  std::size_t size() const { return items().size(); }
  bool empty() const { return items().empty(); }
  const T& operator[](std::size_t i) const { return items()[i]; }
  const T& at(std::size_t i) const {
    auto all = items();
    if (i >= all.size()) throw std::out_of_range{"maybe_batch::at"};
    return all[i];
  }

 private:
  template <typename Decoder>
  static maybe_batch decode(std::string_view payload, Decoder&& decode_line) {
    auto nl = payload.find('\n');
    if (nl == std::string_view::npos) return maybe_batch(decode_line(payload));

    std::vector<T> members;
    for (;;) {
      members.push_back(decode_line(payload.substr(0, nl)));
      if (nl == std::string_view::npos) break;
      payload.remove_prefix(nl + 1);
      nl = payload.find('\n');
    }
    return maybe_batch(std::move(members));
  }

  std::variant<T, std::vector<T>> body_;
};

}  // namespace jrpc
