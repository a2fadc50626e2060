#ifndef TOOL_VERSIONS_HPP
#define TOOL_VERSIONS_HPP
#include <string>
#include <vector>

#include "command_builder.hpp"

namespace versions {

/**
 * @brief Lax version parser.
 *
 * Splits on '.', '-' and '~' and converts components until the first one
 * that is not a number.
 *
 * @throws std::runtime_error "<v>: version string not understood" if the
 *         first component is not numeric.
 */
std::vector<int> parse_version(const std::string& v);

/** @brief `true` if @p have is at least @p need, component by component. */
bool at_least(const std::string& have, const std::string& need);

/**
 * @brief Version of the configured git binary without the "git version " prefix.
 *
 * @throws errors::OperationError (Environment) "git executable not found: ..."
 */
std::string git_version(const cmd::ToolConfig& tools);

/**
 * @brief Raw version of the configured git-annex binary.
 *
 * @throws errors::OperationError (Environment) if it cannot be run.
 */
std::string annex_version(const cmd::ToolConfig& tools);

/**
 * @brief Check that git runs and git-annex is recent enough.
 *
 * @throws errors::OperationError (Environment) describing the first problem.
 */
void check_tools(const cmd::ToolConfig& tools);

/** @brief Client and tool versions for `--version` and `tool-versions`. */
std::string describe(const cmd::ToolConfig& tools);

} // namespace versions

#endif // TOOL_VERSIONS_HPP
