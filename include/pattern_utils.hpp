#ifndef PATTERN_UTILS_HPP
#define PATTERN_UTILS_HPP
#include <filesystem>
#include <string>
#include <vector>

namespace patterns {

/**
 * Check whether @p path matches any of the glob @p patterns.
 *
 * A pattern without '/' is matched against the file name only, a pattern
 * containing '/' against the whole generic path. Patterns without glob
 * characters must match exactly.
 */
bool matches(const std::filesystem::path& path, const std::vector<std::string>& patterns);

/**
 * Expand shell style globs relative to the current directory.
 *
 * Every argument is passed through glob(3). An argument that matches nothing
 * raises `std::runtime_error("No files matched <p>")` in @p strict mode and is
 * kept literally otherwise. The result is sorted per argument and keeps the
 * argument order.
 */
std::vector<std::string> expand_globs(const std::vector<std::string>& args, bool strict);

/**
 * Lexically clean a user supplied path: collapse "." and "..", drop a
 * trailing separator and use '/' separators. An empty path becomes ".".
 */
std::string clean_path(const std::string& p);

} // namespace patterns

#endif // PATTERN_UTILS_HPP
