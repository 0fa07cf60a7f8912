#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "robin_hood.h"

namespace thai {

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

// Wall clock; tests substitute a manual one
Clock system_clock();

int64_t to_epoch_ms(TimePoint t);

struct StoreResult {
    bool success = false;
    std::optional<nlohmann::json> data; // empty on miss or expiry
    std::string error;
};

// Key/value cache with per-entry time-to-live.
class TtlStore {
public:
    virtual ~TtlStore() = default;

    virtual StoreResult get(const std::string& key) = 0;

    // Throws std::runtime_error if the value cannot be persisted
    virtual void set(const std::string& key, const nlohmann::json& value, int64_t ttl_seconds) = 0;
};

class MemoryTtlStore : public TtlStore {
public:
    explicit MemoryTtlStore(Clock clock = system_clock());

    StoreResult get(const std::string& key) override;
    void set(const std::string& key, const nlohmann::json& value, int64_t ttl_seconds) override;

    size_t size() const { return entries_.size(); }

protected:
    struct Entry {
        nlohmann::json value;
        int64_t expiry_ms = 0;
        int64_t timestamp_ms = 0;
    };

    Clock clock_;
    robin_hood::unordered_node_map<std::string, Entry> entries_;
};

// MemoryTtlStore mirrored to a single JSON file, rewritten on every set.
class JsonFileTtlStore : public MemoryTtlStore {
public:
    // Loads `path` if it exists; unexpired entries only
    explicit JsonFileTtlStore(std::string path, Clock clock = system_clock());

    void set(const std::string& key, const nlohmann::json& value, int64_t ttl_seconds) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;

    void load();
    void flush() const;
};

} // namespace thai
