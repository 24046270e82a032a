#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>

// Host address -> outcome of that host's transfer. Written concurrently by
// transfer threads; the guard covers only the map mutation.
class ResultStore {
public:
    ResultStore() = default;
    ResultStore(const ResultStore& other);
    ResultStore& operator=(const ResultStore& other);

    // Insert or replace the outcome for host
    void record(const std::string& host, TransferOutcome outcome);

    std::optional<TransferOutcome> get(const std::string& host) const;
    bool contains(const std::string& host) const;
    size_t size() const;

    // Consistent copy of every entry (ordered by host)
    std::map<std::string, TransferOutcome> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, TransferOutcome> outcomes_;
};
