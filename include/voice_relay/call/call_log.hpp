#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "spdlog/logger.h"

namespace voice_relay {
namespace call {

// Handle to one call's log file. A default-constructed CallLog is not open and
// silently discards everything written to it. Copies share the same sink.
class CallLog {
public:
    CallLog() = default;
    CallLog(std::shared_ptr<spdlog::logger> logger, std::filesystem::path path);

    bool is_open() const;
    const std::filesystem::path& path() const;

    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void warn(const std::string& message) const;
    void error(const std::string& message) const;
    void flush() const;

private:
    void write(spdlog::level::level_enum level, const std::string& message) const;

    std::shared_ptr<spdlog::logger> logger_;
    std::filesystem::path path_;
};

class CallLogRegistry {
public:
    CallLogRegistry(std::filesystem::path logs_dir, spdlog::level::level_enum level);

    // Creates <logs_dir>/call_<YYYYmmdd_HHMMSS>_<stream_id>.log, adding a
    // numeric suffix when that name is already taken.
    CallLog open(const std::string& stream_id);

    const std::filesystem::path& logs_dir() const;

private:
    std::filesystem::path reserve_path(const std::string& stream_id) const;

    std::filesystem::path logs_dir_;
    spdlog::level::level_enum level_;
    std::mutex mutex_;
};

std::string sanitize_stream_id(const std::string& stream_id);

}
}
