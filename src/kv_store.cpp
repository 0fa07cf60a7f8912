#include "kv_store.hpp"
#include "constants.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace thai {

Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

int64_t to_epoch_ms(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

// ---------------------------------------------------------------------------
// MemoryTtlStore
// ---------------------------------------------------------------------------

MemoryTtlStore::MemoryTtlStore(Clock clock)
    : clock_(std::move(clock))
{
}

StoreResult MemoryTtlStore::get(const std::string& key) {
    StoreResult result;
    result.success = true;

    auto it = entries_.find(key);
    if (it == entries_.end()) return result;

    if (it->second.expiry_ms < to_epoch_ms(clock_())) {
        entries_.erase(it);
        return result;
    }
    result.data = it->second.value;
    return result;
}

void MemoryTtlStore::set(const std::string& key, const nlohmann::json& value, int64_t ttl_seconds) {
    int64_t now = to_epoch_ms(clock_());
    Entry& e = entries_[key];
    e.value = value;
    e.timestamp_ms = now;
    e.expiry_ms = now + std::clamp<int64_t>(ttl_seconds, 0, MAX_TTL_SECONDS) * 1000;
}

// ---------------------------------------------------------------------------
// JsonFileTtlStore
// ---------------------------------------------------------------------------

JsonFileTtlStore::JsonFileTtlStore(std::string path, Clock clock)
    : MemoryTtlStore(std::move(clock)), path_(std::move(path))
{
    load();
}

void JsonFileTtlStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return; // first run

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Warning: Ignoring unreadable cache file " << path_ << ": " << e.what() << std::endl;
        return;
    }
    if (!doc.is_object()) return;

    int64_t now = to_epoch_ms(clock_());
    size_t loaded = 0;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const auto& raw = it.value();
        if (!raw.is_object() || !raw.contains("value")) continue;

        // A malformed entry is a miss, not a reason to drop the whole file
        Entry entry;
        try {
            entry.expiry_ms = raw.value("expiry", int64_t{0});
            entry.timestamp_ms = raw.value("timestamp", int64_t{0});
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "Warning: Skipping cache entry " << it.key() << ": " << e.what() << std::endl;
            continue;
        }
        if (entry.expiry_ms < now) continue;

        entry.value = raw["value"];
        entries_[it.key()] = std::move(entry);
        ++loaded;
    }
    std::cout << "Loaded " << loaded << " cache entries from " << path_ << std::endl;
}

void JsonFileTtlStore::set(const std::string& key, const nlohmann::json& value, int64_t ttl_seconds) {
    MemoryTtlStore::set(key, value, ttl_seconds);
    flush();
}

void JsonFileTtlStore::flush() const {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [key, e] : entries_) {
        doc[key] = {{"value", e.value}, {"expiry", e.expiry_ms}, {"timestamp", e.timestamp_ms}};
    }

    // Write-then-rename keeps the previous file intact on failure
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Could not open cache file for writing: " + tmp);
        }
        out << doc.dump();
        if (!out) {
            throw std::runtime_error("Failed writing cache file: " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        throw std::runtime_error("Failed replacing cache file: " + path_);
    }
}

} // namespace thai
