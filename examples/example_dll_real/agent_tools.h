#pragma once

#include <string>
#include <vector>

#ifdef _WIN32
  #ifdef AGENT_TOOLS_EXPORTS
    #define AGENT_TOOLS_API __declspec(dllexport)
  #else
    #define AGENT_TOOLS_API __declspec(dllimport)
  #endif
#else
  #define AGENT_TOOLS_API
#endif

/**
 * @brief Tool implementations living in a shared library.
 *
 * Every function records its own tool_usage event through
 * activity::default_logger(). Built with ACTIVITY_LOG_SHARED, the library
 * and the executable see the same logger, so these events land in the
 * executable's session file and nest under its open scopes.
 */

/**
 * @brief Count the lines of a text buffer.
 * @param agent Agent using the tool
 * @param text Buffer to scan
 * @return Number of newline-terminated lines
 */
AGENT_TOOLS_API int count_lines(const std::string& agent, const std::string& text);

/**
 * @brief Find the lines containing a pattern.
 * @param agent Agent using the tool
 * @param lines Lines to search
 * @param pattern Substring to look for
 * @return Zero-based indexes of matching lines
 */
AGENT_TOOLS_API std::vector<size_t> grep_lines(const std::string& agent,
                                               const std::vector<std::string>& lines,
                                               const std::string& pattern);

/**
 * @brief Pretend to run a test suite; fails when @p failing is non-zero.
 * @return Number of failing tests
 */
AGENT_TOOLS_API int run_suite(const std::string& agent, const std::string& suite, int failing);
