#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "voice_relay/transport/connection.hpp"
#include "voice_relay/transport/message_channel.hpp"

namespace voice_relay::testing {

// In-memory connection. Messages injected by the test are returned from
// receive(); messages sent by the code under test are recorded.
class FakeConnection : public transport::Connection {
public:
    using SendHook = std::function<void(FakeConnection&, const std::string&)>;

    void inject(std::string message) {
        inbox_.push(std::move(message));
    }

    // The remote side hangs up.
    void peer_close() {
        open_ = false;
        inbox_.close();
    }

    void set_on_send(SendHook hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_send_ = std::move(hook);
    }

    std::optional<std::string> receive() override {
        return inbox_.pop();
    }

    bool send(const std::string& message) override {
        SendHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) {
                ++rejected_sends_;
                return false;
            }
            sent_.push_back(message);
            hook = on_send_;
        }
        if (hook) {
            hook(*this, message);
        }
        return true;
    }

    void close() override {
        open_ = false;
        closed_locally_ = true;
        inbox_.close();
    }

    bool is_open() const override {
        return open_;
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    size_t rejected_sends() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rejected_sends_;
    }

    bool closed_locally() const {
        return closed_locally_;
    }

private:
    transport::MessageChannel inbox_;
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
    size_t rejected_sends_ = 0;
    SendHook on_send_;
    std::atomic<bool> open_{true};
    std::atomic<bool> closed_locally_{false};
};

class TempDir {
public:
    TempDir() {
        std::random_device device;
        path_ = std::filesystem::temp_directory_path() /
                ("voice_relay_test_" + std::to_string(device()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const {
        return path_;
    }

    std::vector<std::filesystem::path> files() const {
        std::vector<std::filesystem::path> result;
        if (!std::filesystem::exists(path_)) {
            return result;
        }
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            result.push_back(entry.path());
        }
        return result;
    }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path);
    std::ostringstream out;
    out << stream.rdbuf();
    return out.str();
}

inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

}
