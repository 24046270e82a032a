#include "result_store.hpp"

ResultStore::ResultStore(const ResultStore& other)
    : outcomes_(other.snapshot()) {}

ResultStore& ResultStore::operator=(const ResultStore& other) {
    if (this == &other) return *this;
    auto copy = other.snapshot();
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_ = std::move(copy);
    return *this;
}

void ResultStore::record(const std::string& host, TransferOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_[host] = std::move(outcome);
}

std::optional<TransferOutcome> ResultStore::get(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outcomes_.find(host);
    if (it == outcomes_.end()) return std::nullopt;
    return it->second;
}

bool ResultStore::contains(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.count(host) > 0;
}

size_t ResultStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size();
}

std::map<std::string, TransferOutcome> ResultStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}
