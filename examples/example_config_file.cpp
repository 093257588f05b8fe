/**
 * @file example_config_file.cpp
 * @brief Example demonstrating INI configuration file loading.
 *
 * Shows how to configure activity-log from an external INI file and the
 * environment instead of hardcoding configuration in your source code.
 *
 * Load order: compiled-in defaults, then the INI file, then ACTIVITY_LOG_*
 * environment variables, then programmatic overrides.
 */

#include <activity-log/activity_log.hpp>
#include <thread>
#include <chrono>
#include <cstdio>

void review_agent(activity::Logger& log, int id) {
    activity::AgentScope agent(log, "reviewer-" + std::to_string(id), "orchestrator", "review change set");

    for (int i = 0; i < 3; ++i) {
        activity::ToolScope tool(log, "reviewer-" + std::to_string(id), "Read",
                                 "inspect file " + std::to_string(i));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    log.log_validation("reviewer-" + std::to_string(id), "code_review", "pass");
    agent.set_result("approved");
}

int main(int argc, char** argv) {
    std::printf("=== Configuration File Example ===\n\n");

    const char* path = argc > 1 ? argv[1] : "../examples/activity_log.ini";

    activity::Config cfg;
    std::printf("Loading configuration from %s...\n", path);
    if (cfg.load_from_file(path)) {
        std::printf("  Configuration loaded\n");
    } else {
        std::printf("  Could not load config file, using defaults\n");
    }

    int from_env = cfg.load_from_env();
    std::printf("  %d setting(s) taken from ACTIVITY_LOG_* variables\n", from_env);

    // Programmatic overrides still win
    cfg.register_exit_hook = false;

    std::vector<std::string> problems = cfg.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) std::fprintf(stderr, "config: %s\n", p.c_str());
        return 1;
    }

    std::printf("\nConfiguration applied:\n");
    std::printf("  - Log dir: %s\n", cfg.log_dir.c_str());
    std::printf("  - Compression: %s\n", cfg.compression ? "gzip" : "none");
    std::printf("  - Validation: %s\n", !cfg.validate_schemas ? "off"
                : cfg.validation_mode == activity::ValidationMode::Strict ? "strict" : "lenient");
    std::printf("  - Queue: %zu entries, %s on overflow\n", cfg.queue_capacity,
                cfg.overflow_policy == activity::OverflowPolicy::Block ? "block" : "drop");
    std::printf("  - Retention: %d session(s)\n", cfg.retention_count);
    std::printf("\n");

    activity::Logger log(cfg);
    try {
        log.initialize();
    } catch (const activity::Error& e) {
        std::fprintf(stderr, "initialize failed: %s\n", e.what());
        return 1;
    }

    {
        activity::AgentScope orchestrator(log, "orchestrator", "user", "parallel review");

        std::thread t1([&log]() { review_agent(log, 1); });
        std::thread t2([&log]() { review_agent(log, 2); });
        t1.join();
        t2.join();
    }

    std::string file = log.sink_path();
    try {
        log.shutdown(std::chrono::milliseconds(cfg.exit_shutdown_timeout_ms));
    } catch (const activity::ShutdownTimeoutError& e) {
        std::fprintf(stderr, "%s\n", e.what());
    }

    activity::LoggerStats stats = log.stats();
    std::printf("Session %s: %llu event(s), %llu written, %llu dropped\n",
                stats.session_id.c_str(),
                (unsigned long long)stats.events_created,
                (unsigned long long)stats.writer.written,
                (unsigned long long)stats.writer.dropped);
    if (!file.empty()) {
        std::printf("Output written to: %s\n", file.c_str());
    }

    std::printf("\n=== Example Complete ===\n");
    return 0;
}
