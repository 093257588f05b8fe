#pragma once
/**
 * @file reader.hpp
 * @brief Read a session file back, plain or gzip.
 */

#include <activity-log/errors.hpp>
#include <activity-log/schema.hpp>

#include <nlohmann/json.hpp>

#include <zlib.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace activity {

/** @brief A line that did not parse or failed validation. */
struct MalformedLine {
    size_t line_number;     ///< 1-based
    std::string reason;
};

struct ReadResult {
    std::vector<nlohmann::json> events;         ///< Valid events in file order
    std::vector<MalformedLine> malformed_lines;
};

/**
 * @brief Load every event of a session file.
 *
 * zlib reads plain files unchanged, so .jsonl and .jsonl.gz go through the
 * same path. Blank lines are skipped; lines that are not JSON objects or
 * fail validate() land in malformed_lines (lenient-mode events carrying
 * validation_warnings are still returned as events).
 *
 * @throws Error if the file cannot be opened or decompressed
 */
inline ReadResult read_session_file(const std::string& path) {
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) {
        throw Error("cannot open " + path + ": " + std::strerror(errno));
    }

    ReadResult result;
    std::string line;
    char buf[8192];
    size_t line_number = 0;

    auto take_line = [&]() {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) return;

        nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            result.malformed_lines.push_back({line_number, "not a JSON object"});
            return;
        }
        if (!j.contains("validation_warnings")) {
            ValidationResult vr = validate(j);
            if (!vr.ok()) {
                result.malformed_lines.push_back({line_number, vr.problems.front()});
                return;
            }
        }
        result.events.push_back(std::move(j));
    };

    while (gzgets(gz, buf, sizeof(buf)) != nullptr) {
        size_t n = std::strlen(buf);
        if (n > 0 && buf[n - 1] == '\n') {
            line.append(buf, n - 1);
            take_line();
            line.clear();
        } else {
            line.append(buf, n);
        }
    }

    int errnum = 0;
    const char* msg = gzerror(gz, &errnum);
    std::string err = (errnum != Z_OK && errnum != Z_BUF_ERROR) ? std::string(msg ? msg : "zlib error") : std::string();
    gzclose(gz);

    if (!err.empty()) {
        throw Error("cannot read " + path + ": " + err);
    }
    if (!line.empty()) take_line();
    return result;
}

} // namespace activity
