/**
 * @file activity_log_impl.cpp
 * @brief Single definition of the process-wide logger for shared-library use.
 *
 * activity-log is header-only by default, and every shared library or
 * executable that includes it gets its own default_logger(), with its own
 * session file. Build this file into exactly one module when several
 * modules must log into the same session.
 *
 * ## Usage
 *
 * 1. Compile this file into ONE module (the main executable or one shared
 *    library). It defines ACTIVITY_LOG_IMPLEMENTATION itself.
 * 2. Define ACTIVITY_LOG_SHARED for every translation unit that includes
 *    activity_log.hpp, this one included.
 *
 * ## Build Example (GCC/Clang)
 * @code{.sh}
 * g++ -std=c++17 -DACTIVITY_LOG_SHARED -fPIC -shared -Iinclude \
 *     src/activity_log_impl.cpp -lz -pthread -o libactivity_log.so
 * g++ -std=c++17 -DACTIVITY_LOG_SHARED -Iinclude app.cpp -L. -lactivity_log -lz -pthread -o app
 * @endcode
 *
 * The CMake target activity_log_shared does the same.
 */

#define ACTIVITY_LOG_IMPLEMENTATION
#include <activity-log/activity_log.hpp>
