#include "ingestvault/utilities/glob_filter.hpp"

#include <fnmatch.h>

namespace ingestvault {

static std::vector<std::string> splitPath(const std::string &path) {
  std::vector<std::string> parts;
  std::string current;
  for (char c : path) {
    if (c == '/') {
      if (!current.empty())
        parts.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  if (!current.empty())
    parts.push_back(current);
  return parts;
}

GlobFilter::GlobFilter(std::vector<std::string> includes,
                       std::vector<std::string> excludes)
    : includes_(std::move(includes)), excludes_(std::move(excludes)) {}

bool GlobFilter::matches(const std::string &pattern,
                         const std::string &relativePath) {
  if (pattern.empty())
    return false;
  bool anchored = pattern.front() == '/';
  auto patParts = splitPath(pattern);
  auto pathParts = splitPath(relativePath);
  if (patParts.empty() || patParts.size() > pathParts.size())
    return false;
  if (anchored && patParts.size() != pathParts.size())
    return false;

  size_t offset = pathParts.size() - patParts.size();
  for (size_t i = 0; i < patParts.size(); ++i) {
    if (fnmatch(patParts[i].c_str(), pathParts[offset + i].c_str(), 0) != 0)
      return false;
  }
  return true;
}

bool GlobFilter::admits(const std::string &relativePath) const {
  for (const auto &pattern : excludes_) {
    if (matches(pattern, relativePath))
      return false;
  }
  if (includes_.empty())
    return true;
  for (const auto &pattern : includes_) {
    if (matches(pattern, relativePath))
      return true;
  }
  return false;
}

} // namespace ingestvault
