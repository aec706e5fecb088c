#include "voice_relay/call/call_log.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include "spdlog/sinks/basic_file_sink.h"

namespace voice_relay {
namespace call {

namespace {

constexpr const char* kCallLogPattern = "%Y-%m-%d %H:%M:%S,%e - %l - %v";

std::string timestamp_now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

}

std::string sanitize_stream_id(const std::string& stream_id) {
    std::string result;
    result.reserve(stream_id.size());
    for (unsigned char ch : stream_id) {
        if (std::isalnum(ch) || ch == '-' || ch == '_') {
            result.push_back(static_cast<char>(ch));
        } else {
            result.push_back('_');
        }
    }
    if (result.empty()) {
        result = "unknown";
    }
    return result;
}

CallLog::CallLog(std::shared_ptr<spdlog::logger> logger, std::filesystem::path path)
    : logger_(std::move(logger)),
      path_(std::move(path)) {}

bool CallLog::is_open() const {
    return static_cast<bool>(logger_);
}

const std::filesystem::path& CallLog::path() const {
    return path_;
}

void CallLog::debug(const std::string& message) const {
    write(spdlog::level::debug, message);
}

void CallLog::info(const std::string& message) const {
    write(spdlog::level::info, message);
}

void CallLog::warn(const std::string& message) const {
    write(spdlog::level::warn, message);
}

void CallLog::error(const std::string& message) const {
    write(spdlog::level::err, message);
}

void CallLog::flush() const {
    if (logger_) {
        logger_->flush();
    }
}

void CallLog::write(spdlog::level::level_enum level, const std::string& message) const {
    if (logger_ && logger_->should_log(level)) {
        logger_->log(level, message);
    }
}

CallLogRegistry::CallLogRegistry(std::filesystem::path logs_dir,
                                 spdlog::level::level_enum level)
    : logs_dir_(std::move(logs_dir)),
      level_(level) {}

CallLog CallLogRegistry::open(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::filesystem::create_directories(logs_dir_);
    const auto path = reserve_path(stream_id);

    // Creating the sink creates the file, so the name is taken before the lock
    // is released.
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
    sink->set_pattern(kCallLogPattern);
    auto logger = std::make_shared<spdlog::logger>("call_" + sanitize_stream_id(stream_id),
                                                   std::move(sink));
    logger->set_level(level_);
    logger->flush_on(spdlog::level::err);
    return CallLog(std::move(logger), path);
}

const std::filesystem::path& CallLogRegistry::logs_dir() const {
    return logs_dir_;
}

std::filesystem::path CallLogRegistry::reserve_path(const std::string& stream_id) const {
    const auto base = "call_" + timestamp_now() + "_" + sanitize_stream_id(stream_id);
    auto path = logs_dir_ / (base + ".log");
    for (int suffix = 1; std::filesystem::exists(path); ++suffix) {
        path = logs_dir_ / (base + "_" + std::to_string(suffix) + ".log");
    }
    return path;
}

}
}
