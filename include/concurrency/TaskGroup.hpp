#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/logger.h>

namespace fsnap::concurrency {

// Fan-out/join over a fixed set of tasks. wait() returns only once every task
// has finished, then rethrows the first failure in submission order.
class TaskGroup {
public:
    // parallel = false runs each task inline during wait(), in submission order
    TaskGroup(std::shared_ptr<spdlog::logger> log, bool parallel = true);

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void push(std::string name, std::function<void()> task);

    void wait();

    [[nodiscard]] size_t size() const { return futures_.size(); }

private:
    std::shared_ptr<spdlog::logger> log_;
    bool parallel_;
    std::vector<std::pair<std::string, std::future<void>>> futures_;
};

}
