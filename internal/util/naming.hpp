#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace relay::util {

inline void ValidateItemId(const std::string& item_id) {
  if (item_id.empty()) {
    throw std::invalid_argument("item id must not be empty");
  }
  for (char c : item_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("item id contains invalid character");
    }
  }
  if (item_id == "." || item_id == "..") {
    throw std::invalid_argument("item id must not be a relative path component");
  }
}

// Keeps alphanumerics, space, '-' and '_', capped at max_len characters.
inline std::string SanitizeTitle(const std::string& title, std::size_t max_len) {
  std::string out;
  out.reserve(std::min(title.size(), max_len));
  for (char c : title) {
    if (out.size() >= max_len) break;
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || c == ' ' || c == '-' || c == '_') {
      out.push_back(c);
    }
  }
  while (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

// <dir>/<id>_<title>; the fetcher appends the container extension.
inline std::filesystem::path LocalStem(const std::filesystem::path& dir, const std::string& item_id, const std::string& title) {
  ValidateItemId(item_id);
  const auto safe = SanitizeTitle(title, 100);
  return dir / (safe.empty() ? item_id : item_id + "_" + safe);
}

inline std::string RemoteName(const std::string& item_id, const std::string& title, const std::string& extension) {
  ValidateItemId(item_id);
  const auto safe = SanitizeTitle(title, 80);
  return (safe.empty() ? item_id : item_id + "_" + safe) + extension;
}

} // namespace relay::util
