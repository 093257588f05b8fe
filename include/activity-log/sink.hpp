#pragma once
/**
 * @file sink.hpp
 * @brief Append-only storage for serialized event lines.
 */

#include <activity-log/errors.hpp>

#include <zlib.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>

namespace activity {

/**
 * @brief Destination for newline-delimited JSON.
 *
 * Owned exclusively by the writer's consumer thread once started. Every
 * method reports failure by throwing SinkWriteError.
 */
class Sink {
public:
    virtual ~Sink() = default;

    virtual void open() = 0;
    /// Append @p line followed by '\n'.
    virtual void write_line(const std::string& line) = 0;
    virtual void flush() = 0;
    virtual void close() = 0;
    virtual const std::string& path() const = 0;
};

/**
 * @brief Plain file sink (<session>.jsonl).
 */
class FileSink : public Sink {
public:
    explicit FileSink(std::string path) : path_(std::move(path)) {}
    ~FileSink() override { close_quietly(); }

    void open() override {
        if (file_) return;
        file_ = std::fopen(path_.c_str(), "ab");
        if (!file_) {
            throw SinkWriteError("cannot open " + path_ + ": " + std::strerror(errno));
        }
    }

    void write_line(const std::string& line) override {
        if (!file_) throw SinkWriteError("write to closed sink " + path_);
        if (std::fwrite(line.data(), 1, line.size(), file_) != line.size() ||
            std::fputc('\n', file_) == EOF) {
            throw SinkWriteError("write failed on " + path_ + ": " + std::strerror(errno));
        }
    }

    void flush() override {
        if (file_ && std::fflush(file_) != 0) {
            throw SinkWriteError("flush failed on " + path_ + ": " + std::strerror(errno));
        }
    }

    void close() override {
        if (!file_) return;
        FILE* f = file_;
        file_ = nullptr;
        if (std::fclose(f) != 0) {
            throw SinkWriteError("close failed on " + path_ + ": " + std::strerror(errno));
        }
    }

    const std::string& path() const override { return path_; }

private:
    void close_quietly() {
        if (file_) {
            std::fclose(file_);
            file_ = nullptr;
        }
    }

    std::string path_;
    FILE* file_ = nullptr;
};

/**
 * @brief gzip sink (<session>.jsonl.gz) through zlib.
 *
 * Each flush() ends with Z_SYNC_FLUSH so everything written so far is
 * decodable even if the process dies before close().
 */
class GzipSink : public Sink {
public:
    explicit GzipSink(std::string path) : path_(std::move(path)) {}
    ~GzipSink() override {
        if (gz_) {
            gzclose(gz_);
            gz_ = nullptr;
        }
    }

    void open() override {
        if (gz_) return;
        gz_ = gzopen(path_.c_str(), "ab");
        if (!gz_) {
            throw SinkWriteError("cannot open " + path_ + ": " + std::strerror(errno));
        }
    }

    void write_line(const std::string& line) override {
        if (!gz_) throw SinkWriteError("write to closed sink " + path_);
        if (!line.empty() &&
            gzwrite(gz_, line.data(), (unsigned)line.size()) != (int)line.size()) {
            throw SinkWriteError("gzwrite failed on " + path_ + ": " + error_text());
        }
        if (gzputc(gz_, '\n') == -1) {
            throw SinkWriteError("gzwrite failed on " + path_ + ": " + error_text());
        }
    }

    void flush() override {
        if (gz_ && gzflush(gz_, Z_SYNC_FLUSH) != Z_OK) {
            throw SinkWriteError("gzflush failed on " + path_ + ": " + error_text());
        }
    }

    void close() override {
        if (!gz_) return;
        gzFile g = gz_;
        gz_ = nullptr;
        int rc = gzclose(g);
        if (rc != Z_OK) {
            throw SinkWriteError("gzclose failed on " + path_ + " (zlib error " + std::to_string(rc) + ")");
        }
    }

    const std::string& path() const override { return path_; }

private:
    std::string error_text() const {
        int errnum = 0;
        const char* msg = gz_ ? gzerror(gz_, &errnum) : nullptr;
        if (errnum == Z_ERRNO) return std::strerror(errno);
        return msg ? msg : "unknown zlib error";
    }

    std::string path_;
    gzFile gz_ = nullptr;
};

/**
 * @brief Sink file path for a session: <dir>/<session_id>.jsonl[.gz].
 */
inline std::string session_file_path(const std::string& dir, const std::string& session_id,
                                     bool compressed) {
    std::filesystem::path p = std::filesystem::path(dir) / (session_id + (compressed ? ".jsonl.gz" : ".jsonl"));
    return p.string();
}

/**
 * @brief Create the sink for a session, creating @p dir if needed.
 * @throws SinkWriteError if the directory cannot be created
 */
inline std::unique_ptr<Sink> make_session_sink(const std::string& dir, const std::string& session_id,
                                               bool compressed) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw SinkWriteError("cannot create log directory " + dir + ": " + ec.message());
    }
    std::string path = session_file_path(dir, session_id, compressed);
    if (compressed) return std::make_unique<GzipSink>(std::move(path));
    return std::make_unique<FileSink>(std::move(path));
}

} // namespace activity
