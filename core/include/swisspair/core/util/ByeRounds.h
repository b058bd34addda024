#pragma once

#include <nlohmann/json.hpp>

#include <vector>

namespace swisspair::core::util {

// Accepts an array, a number, a JSON-encoded string or free text such as
// "2, 5" and returns the sorted, de-duplicated positive round numbers.
std::vector<int> NormalizeByeRounds(const nlohmann::json& value);

}  // namespace swisspair::core::util
