#pragma once

#include "result.hpp"
#include <deque>
#include <string>
#include <chrono>
#include <ctime>
#include <optional>
#include <spdlog/spdlog.h>

namespace ydispatch {

// Bounded ring buffer of Errors that are not returned to any caller,
// e.g. failures of scheduled subscriber tasks
class ErrorBuffer {
public:
    struct ErrorEntry {
        Error error;
        spdlog::level::level_enum level;
        std::string timestamp;
    };

    explicit ErrorBuffer(size_t max_size = 1000) : _max_size(max_size) {}

    // Add an error to the buffer and dump to spdlog
    void add(Error error, spdlog::level::level_enum level = spdlog::level::err) {
        spdlog::log(level, "{}", error.to_string());

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
#else
        localtime_r(&time_t, &tm_buf);
#endif

        char timestamp[32];
        std::strftime(timestamp, sizeof(timestamp), "%H:%M:%S", &tm_buf);
        std::string ms_str = std::to_string(ms.count());
        while (ms_str.size() < 3) ms_str = "0" + ms_str;

        _entries.push_back({std::move(error), level, std::string(timestamp) + "." + ms_str});

        while (_entries.size() > _max_size) {
            _entries.pop_front();
        }
    }

    template<typename T>
    void add_from_result(const Result<T>& result, spdlog::level::level_enum level = spdlog::level::err) {
        if (!result.has_value()) {
            add(result.error(), level);
        }
    }

    // Entries, newest last
    [[nodiscard]] const std::deque<ErrorEntry>& entries() const {
        return _entries;
    }

    [[nodiscard]] std::optional<Error> last() const {
        if (_entries.empty()) return std::nullopt;
        return _entries.back().error;
    }

    [[nodiscard]] size_t size() const {
        return _entries.size();
    }

    [[nodiscard]] bool empty() const {
        return _entries.empty();
    }

    void clear() {
        _entries.clear();
    }

    // Take all entries out of the buffer
    std::deque<ErrorEntry> drain() {
        std::deque<ErrorEntry> out;
        out.swap(_entries);
        return out;
    }

    [[nodiscard]] size_t max_size() const {
        return _max_size;
    }

    void set_max_size(size_t max_size) {
        _max_size = max_size;
        while (_entries.size() > _max_size) {
            _entries.pop_front();
        }
    }

    static const char* level_to_string(spdlog::level::level_enum level) {
        switch (level) {
            case spdlog::level::trace: return "TRACE";
            case spdlog::level::debug: return "DEBUG";
            case spdlog::level::info: return "INFO";
            case spdlog::level::warn: return "WARN";
            case spdlog::level::err: return "ERROR";
            case spdlog::level::critical: return "CRITICAL";
            default: return "UNKNOWN";
        }
    }

private:
    std::deque<ErrorEntry> _entries;
    size_t _max_size;
};

// Each thread gets its own buffer
inline ErrorBuffer& get_thread_error_buffer() {
    thread_local ErrorBuffer buffer;
    return buffer;
}

inline void add_error(Error error, spdlog::level::level_enum level = spdlog::level::err) {
    get_thread_error_buffer().add(std::move(error), level);
}

template<typename T>
inline void add_error_from_result(const Result<T>& result, spdlog::level::level_enum level = spdlog::level::err) {
    get_thread_error_buffer().add_from_result(result, level);
}

} // namespace ydispatch
