#ifndef INGESTVAULT_GLOB_FILTER_HPP
#define INGESTVAULT_GLOB_FILTER_HPP

#include <string>
#include <vector>

namespace ingestvault {

/**
 * @brief Include/exclude filter over source-relative paths.
 *
 * Patterns are matched component-wise from the right, so "*.mov" matches
 * "A001/C0001.mov" and "CLIP/*.wav" matches "card1/CLIP/take.wav". A pattern
 * starting with '/' must match the whole relative path. Excludes win over
 * includes; an empty include list admits everything.
 */
class GlobFilter {
public:
  GlobFilter() = default;
  GlobFilter(std::vector<std::string> includes,
             std::vector<std::string> excludes);

  bool admits(const std::string &relativePath) const;

  /** Match a single pattern against a '/' separated relative path. */
  static bool matches(const std::string &pattern,
                      const std::string &relativePath);

private:
  std::vector<std::string> includes_;
  std::vector<std::string> excludes_;
};

} // namespace ingestvault

#endif // INGESTVAULT_GLOB_FILTER_HPP
