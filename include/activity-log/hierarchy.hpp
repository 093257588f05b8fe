#pragma once
/**
 * @file hierarchy.hpp
 * @brief Per-thread stacks of open scopes that supply parent_event_id.
 */

#include <activity-log/diag.hpp>
#include <activity-log/errors.hpp>

#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace activity {

/**
 * @brief Tracks the innermost open scope of every thread.
 *
 * Each thread owns an independent stack; a thread never sees another
 * thread's parent. Stacks live in a map keyed by std::thread::id so several
 * Logger instances in one process stay independent. Empty stacks are
 * erased, so threads that exit with balanced scopes leave nothing behind.
 *
 * Nesting is strictly LIFO: end(expected) on the wrong scope throws
 * ScopeOrderError rather than quietly corrupting the hierarchy.
 */
class HierarchyTracker {
public:
    /// Open a scope whose events will be parented to @p event_id.
    void begin(const std::string& event_id) {
        std::lock_guard<std::mutex> lock(mtx_);
        stacks_[std::this_thread::get_id()].push_back(event_id);
    }

    /**
     * @brief Close the innermost scope of the calling thread.
     * @throws ScopeOrderError if no scope is open
     */
    std::string end() {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = stacks_.find(std::this_thread::get_id());
        if (it == stacks_.end() || it->second.empty()) {
            throw ScopeOrderError("scope end with no open scope");
        }
        std::string top = std::move(it->second.back());
        it->second.pop_back();
        if (it->second.empty()) stacks_.erase(it);
        return top;
    }

    /**
     * @brief Close the innermost scope, verifying it is @p expected.
     * @throws ScopeOrderError on an empty stack or when another scope is innermost
     */
    void end(const std::string& expected) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = stacks_.find(std::this_thread::get_id());
        if (it == stacks_.end() || it->second.empty()) {
            throw ScopeOrderError("scope end for " + expected + " with no open scope");
        }
        if (it->second.back() != expected) {
            throw ScopeOrderError("scope end for " + expected + " while " +
                                  it->second.back() + " is innermost");
        }
        it->second.pop_back();
        if (it->second.empty()) stacks_.erase(it);
    }

    /**
     * @brief Pop scopes down to and including @p event_id.
     *
     * Recovery path for guards that find themselves out of order.
     * @return Number of scopes removed (0 if @p event_id is not open)
     */
    size_t unwind_to(const std::string& event_id) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = stacks_.find(std::this_thread::get_id());
        if (it == stacks_.end()) return 0;
        auto& stack = it->second;

        size_t pos = stack.size();
        while (pos > 0 && stack[pos - 1] != event_id) --pos;
        if (pos == 0) return 0;

        size_t removed = stack.size() - (pos - 1);
        stack.resize(pos - 1);
        if (stack.empty()) stacks_.erase(it);
        return removed;
    }

    /// Innermost open scope of the calling thread, if any.
    std::optional<std::string> current_parent() const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = stacks_.find(std::this_thread::get_id());
        if (it == stacks_.end() || it->second.empty()) return std::nullopt;
        return it->second.back();
    }

    size_t depth() const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = stacks_.find(std::this_thread::get_id());
        return it == stacks_.end() ? 0 : it->second.size();
    }

    /// Drop every thread's stack (new session).
    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        stacks_.clear();
    }

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::thread::id, std::vector<std::string>> stacks_;
};

/**
 * @brief RAII guard: begin() on construction, end() on every exit path.
 *
 * A destructor cannot throw, so if the guard is no longer the innermost
 * scope it reports the violation on the diagnostics channel and unwinds the
 * stack down to and including itself.
 */
class HierarchyScope {
public:
    HierarchyScope(HierarchyTracker& tracker, std::string event_id, FILE* diag_out = stderr)
        : tracker_(&tracker), event_id_(std::move(event_id)), diag_out_(diag_out) {
        tracker_->begin(event_id_);
    }

    ~HierarchyScope() {
        if (!tracker_) return;
        std::optional<std::string> top = tracker_->current_parent();
        if (top && *top == event_id_) {
            tracker_->unwind_to(event_id_);
            return;
        }
        size_t removed = tracker_->unwind_to(event_id_);
        diag::warn(diag_out_, "scope %s closed out of order (innermost was %s, unwound %zu)",
                   event_id_.c_str(), top ? top->c_str() : "none", removed);
    }

    HierarchyScope(const HierarchyScope&) = delete;
    HierarchyScope& operator=(const HierarchyScope&) = delete;

    const std::string& event_id() const { return event_id_; }

private:
    HierarchyTracker* tracker_;
    std::string event_id_;
    FILE* diag_out_;
};

} // namespace activity
