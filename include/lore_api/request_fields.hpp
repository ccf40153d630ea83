#pragma once

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace lore_api {

// Optional "top_k" of a search or query body. Anything but an integer in [1, INT_MAX]
// is rejected with std::invalid_argument.
inline std::optional<int> top_k_from_body(const nlohmann::json &body) {
  if (!body.contains("top_k")) {
    return std::nullopt;
  }
  const nlohmann::json &value = body.at("top_k");
  if (!value.is_number_integer()) {
    throw std::invalid_argument("top_k must be an integer");
  }

  constexpr int64_t max_k = std::numeric_limits<int>::max();
  if (value.is_number_unsigned()) {
    const auto k = value.get<uint64_t>();
    if (k >= 1 && k <= static_cast<uint64_t>(max_k)) {
      return static_cast<int>(k);
    }
  } else {
    const auto k = value.get<int64_t>();
    if (k >= 1 && k <= max_k) {
      return static_cast<int>(k);
    }
  }
  throw std::invalid_argument("top_k must be between 1 and " + std::to_string(max_k));
}

}  // namespace lore_api
