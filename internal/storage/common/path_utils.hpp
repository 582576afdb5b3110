#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace migrator::storage::common {

/*
  Object keys are hierarchical ('/' separated) and end up as paths on local
  filesystem stores, so they must never escape the container root.
*/
inline void ValidateObjectKey(const std::string& key) {
  if (key.empty()) {
    throw util::InvalidInput("object key must not be empty");
  }
  if (key.front() == '/') {
    throw util::InvalidInput("object key must be relative: " + key);
  }

  std::size_t start = 0;
  while (start <= key.size()) {
    const auto end = key.find('/', start);
    const auto component = key.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (component == "." || component == "..") {
      throw util::InvalidInput("object key contains a relative path component: " + key);
    }
    if (component.find('\0') != std::string::npos) {
      throw util::InvalidInput("object key contains a NUL character");
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
}

inline std::string JoinObjectPath(const std::string& root, const std::string& key) {
  if (root.empty()) {
    return key;
  }
  if (key.empty()) {
    return root;
  }
  if (root.back() == '/') {
    return root + key;
  }
  return root + "/" + key;
}

// "photos/2019/" style keys: zero-byte objects that stand for an empty folder.
inline bool IsDirectoryMarker(const std::string& key) {
  return !key.empty() && key.back() == '/';
}

// Filesystem path of a marker key, without the trailing separator.
inline std::string MarkerDirectory(const std::string& path) {
  std::string trimmed = path;
  while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
  return trimmed;
}

// Destination key keeps the source hierarchy, optionally under a prefix.
inline std::string DestinationKey(const std::string& prefix, const std::string& key) {
  ValidateObjectKey(key);
  std::string trimmed = prefix;
  while (!trimmed.empty() && trimmed.front() == '/') trimmed.erase(trimmed.begin());
  return JoinObjectPath(trimmed, key);
}

} // namespace migrator::storage::common
