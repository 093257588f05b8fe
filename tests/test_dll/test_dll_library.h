#pragma once

#include <string>

#ifdef _WIN32
  #ifdef TEST_DLL_EXPORTS
    #define TEST_DLL_API __declspec(dllexport)
  #else
    #define TEST_DLL_API __declspec(dllimport)
  #endif
#else
  #define TEST_DLL_API
#endif

/**
 * @brief Functions that log from inside the shared library.
 */

/// Record a tool_usage event; returns its id.
TEST_DLL_API std::string dll_log_tool(const std::string& agent);

/// Open a tool scope and log a file operation inside it; returns the file operation's id.
TEST_DLL_API std::string dll_nested_file_operation(const std::string& agent);

/// Session id as seen from inside the library.
TEST_DLL_API std::string dll_session_id();
