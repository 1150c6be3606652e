#include "FailedSet.hpp"
#include "WorkerContext.hpp"

bool FailedSet::insert(const WorkerContext& worker) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failed_.insert(&worker).second) {
        return false;
    }
    order_.push_back(&worker);
    return true;
}

bool FailedSet::contains(const WorkerContext& worker) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_.count(&worker) != 0;
}

std::size_t FailedSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_.size();
}

bool FailedSet::empty() const {
    return size() == 0;
}

std::vector<std::string> FailedSet::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(order_.size());
    for (const auto* worker : order_) {
        result.push_back(worker->name());
    }
    return result;
}

void FailedSet::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    failed_.clear();
    order_.clear();
}
