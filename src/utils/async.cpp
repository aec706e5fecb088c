#include "voice_relay/utils/async.hpp"

#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include "voice_relay/logging.hpp"

namespace voice_relay::utils {

void run_async(std::string name, std::function<void()> task) {
    std::thread worker([name = std::move(name), task = std::move(task)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Async task failed",
                {kv("task", name),
                 kv("error", ex.what())});
        }
    });
    worker.detach();
}

void AsyncGroup::run(std::string name, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++active_;
    }
    auto wrapped = [this, name, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Async task failed",
                {kv("task", name),
                 kv("error", ex.what())});
        }
        finish();
    };
    try {
        run_async(std::move(name), std::move(wrapped));
    } catch (const std::system_error&) {
        finish();
        throw;
    }
}

void AsyncGroup::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return active_ == 0; });
}

size_t AsyncGroup::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void AsyncGroup::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    --active_;
    idle_cv_.notify_all();
}

}
