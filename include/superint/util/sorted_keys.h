#pragma once

#include <algorithm>
#include <vector>

namespace superint::util {

// Keys of an unordered container in sorted order, for code that must not
// depend on hash iteration order (event emission order, save output).
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace superint::util
