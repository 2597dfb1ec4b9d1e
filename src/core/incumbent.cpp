#include "edakari/incumbent.hpp"

namespace edakari {

Incumbent::Incumbent(ObjectiveSense sense)
    : sense_(sense)
    , objective_(worst_value(sense))
    , start_(std::chrono::steady_clock::now()) {}

bool Incumbent::try_update(std::vector<Domain::value_type> values, double objective,
                           std::vector<BranchStep> path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (has_value_.load(std::memory_order_relaxed) &&
        !is_better(objective, objective_.load(std::memory_order_relaxed), sense_)) {
        return false;
    }
    values_ = std::move(values);
    path_ = std::move(path);
    objective_.store(objective, std::memory_order_release);
    has_value_.store(true, std::memory_order_release);

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    history_.push_back(IncumbentEvent{objective, elapsed.count()});
    return true;
}

std::optional<IncumbentSnapshot> Incumbent::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_value_.load(std::memory_order_relaxed)) {
        return std::nullopt;
    }
    return IncumbentSnapshot{values_, objective_.load(std::memory_order_relaxed), path_};
}

std::vector<IncumbentEvent> Incumbent::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

void Incumbent::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
    path_.clear();
    history_.clear();
    has_value_.store(false, std::memory_order_release);
    objective_.store(worst_value(sense_), std::memory_order_release);
    start_ = std::chrono::steady_clock::now();
}

} // namespace edakari
