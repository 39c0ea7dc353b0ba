#include "concurrency/TaskGroup.hpp"

#include <exception>

using namespace fsnap::concurrency;

TaskGroup::TaskGroup(std::shared_ptr<spdlog::logger> log, const bool parallel)
    : log_(std::move(log)), parallel_(parallel) {}

void TaskGroup::push(std::string name, std::function<void()> task) {
    const auto policy = parallel_ ? std::launch::async : std::launch::deferred;
    log_->debug("[TaskGroup] Submitting task '{}' ({})", name, parallel_ ? "async" : "deferred");
    futures_.emplace_back(std::move(name), std::async(policy, std::move(task)));
}

void TaskGroup::wait() {
    std::exception_ptr first;

    for (auto& [name, f] : futures_) {
        try {
            f.get();
            log_->debug("[TaskGroup] Task '{}' finished", name);
        } catch (const std::exception& e) {
            log_->error("[TaskGroup] Task '{}' failed: {}", name, e.what());
            if (!first) first = std::current_exception();
        }
    }

    futures_.clear();
    if (first) std::rethrow_exception(first);
}
