#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

namespace voice_relay {
namespace utils {

// Runs task on a detached thread. Exceptions escaping task are logged.
void run_async(std::string name, std::function<void()> task);

// Detached tasks that can be waited for as a group. The group must outlive
// every task it started, so owners call wait() before destroying it.
class AsyncGroup {
public:
    AsyncGroup() = default;
    AsyncGroup(const AsyncGroup&) = delete;
    AsyncGroup& operator=(const AsyncGroup&) = delete;

    void run(std::string name, std::function<void()> task);
    // Blocks until every started task has returned.
    void wait();
    size_t active() const;

private:
    void finish();

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
};

}
}
