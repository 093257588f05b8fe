/**
 * @file example_session_summary.cpp
 * @brief Summarize recorded sessions: files on disk, event counts, hierarchy.
 *
 * Usage:
 *   example_session_summary [log_dir]          list sessions in log_dir
 *   example_session_summary <session file>     summarize one session
 *
 * Plain and gzip session files are both accepted.
 */

#include <activity-log/activity_log.hpp>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace {

int list_sessions(const std::string& dir) {
    std::vector<activity::LogFileInfo> files = activity::list_log_files(dir);
    activity::LogFileStats stats = activity::log_file_stats(dir);

    std::printf("%zu session file(s) in %s, %llu bytes\n", stats.total_files, dir.c_str(),
                (unsigned long long)stats.total_size_bytes);
    for (const auto& f : files) {
        std::printf("  %-32s %10llu bytes %s\n", f.session_id.c_str(),
                    (unsigned long long)f.size_bytes, f.compressed ? "(gzip)" : "");
    }
    if (stats.newest_session) {
        std::printf("newest: %s\noldest: %s\n", stats.newest_session->c_str(), stats.oldest_session->c_str());
    }
    return 0;
}

void print_tree(const std::map<std::string, std::vector<const nlohmann::json*>>& children,
                const std::string& parent, int depth) {
    auto it = children.find(parent);
    if (it == children.end()) return;
    for (const nlohmann::json* e : it->second) {
        std::string id = (*e)["event_id"].get<std::string>();
        std::string label = (*e)["event_type"].get<std::string>();
        if (e->contains("agent") && (*e)["agent"].is_string()) label += " " + (*e)["agent"].get<std::string>();
        if (e->contains("tool") && (*e)["tool"].is_string()) label += " [" + (*e)["tool"].get<std::string>() + "]";
        std::printf("%*s%s %s\n", depth * 2, "", id.c_str(), label.c_str());
        print_tree(children, id, depth + 1);
    }
}

int summarize(const std::string& path) {
    activity::ReadResult r;
    try {
        r = activity::read_session_file(path);
    } catch (const activity::Error& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    std::map<std::string, size_t> per_type;
    std::map<std::string, std::vector<const nlohmann::json*>> children;
    size_t annotated = 0;
    for (const auto& e : r.events) {
        ++per_type[e.value("event_type", std::string("?"))];
        if (e.contains("validation_warnings")) ++annotated;
        std::string parent = e["parent_event_id"].is_string() ? e["parent_event_id"].get<std::string>() : "";
        children[parent].push_back(&e);
    }

    std::printf("%s: %zu event(s), %zu malformed line(s), %zu with validation warnings\n",
                path.c_str(), r.events.size(), r.malformed_lines.size(), annotated);
    for (const auto& kv : per_type) {
        std::printf("  %-18s %zu\n", kv.first.c_str(), kv.second);
    }
    for (const auto& m : r.malformed_lines) {
        std::printf("  line %zu: %s\n", m.line_number, m.reason.c_str());
    }

    std::printf("\nHierarchy:\n");
    print_tree(children, "", 1);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string target = argc > 1 ? argv[1] : activity::Config().log_dir;

    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
        return list_sessions(target);
    }
    return summarize(target);
}
