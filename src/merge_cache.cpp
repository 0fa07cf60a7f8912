#include "merge_cache.hpp"
#include "constants.hpp"
#include "tokenizer.hpp"
#include <iostream>
#include <utility>

namespace thai {

const MergeSet MergeCache::empty_;

std::string line_hash(std::string_view normalized_text) {
    uint32_t h = 2166136261u;
    auto mix = [&h](uint32_t unit) {
        h ^= unit;
        h += (h << 1) + (h << 4) + (h << 7) + (h << 8) + (h << 24);
    };

    size_t i = 0;
    while (i < normalized_text.size()) {
        auto [cp, len] = get_char_at(normalized_text, i);
        if (len == 0) { i++; continue; }
        i += len;
        if (cp > 0xFFFF) {
            cp -= 0x10000;
            mix(0xD800 + (cp >> 10));
            mix(0xDC00 + (cp & 0x3FF));
        } else {
            mix(cp);
        }
    }

    static constexpr char DIGITS[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (h == 0) return "0";
    std::string out;
    while (h > 0) {
        out.insert(out.begin(), DIGITS[h % 36]);
        h /= 36;
    }
    return out;
}

std::string merges_key(const std::string& video_id) {
    return MERGES_KEY_PREFIX + video_id;
}

std::string line_key(const std::string& video_id, const std::string& hash) {
    return LINE_KEY_PREFIX + video_id + "_" + hash;
}

// Array under `key` as strings; non-string items skipped
static std::vector<std::string> string_items(const nlohmann::json& obj, const char* key) {
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end()) return out;
    const nlohmann::json& arr = *it;
    if (!arr.is_array()) return out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

MergeCache::MergeCache(const SegmenterConfig& config, TtlStore& store, TaskQueue& queue, Clock clock)
    : config_(config), store_(store), queue_(queue), clock_(std::move(clock)),
      alive_(std::make_shared<bool>(true))
{
}

const MergeSet& MergeCache::merges_for(const std::string& video_id) {
    if (video_id.empty()) return empty_;
    auto it = videos_.find(video_id);
    if (it != videos_.end()) return it->second.merges;

    schedule_hydration(video_id);
    return empty_;
}

const MergeSet* MergeCache::find(const std::string& video_id) const {
    auto it = videos_.find(video_id);
    return it != videos_.end() ? &it->second.merges : nullptr;
}

size_t MergeCache::add_merges(const std::string& video_id, const std::vector<std::string>& phrases) {
    if (video_id.empty()) return 0;
    VideoEntry& e = entry(video_id);
    const size_t cap = config_.merge_cap();
    size_t added = 0;
    for (const auto& p : phrases) {
        if (e.merges.insert(p, cap)) ++added;
    }
    if (added > 0) schedule_persist_merges(video_id, e.merges.phrases());
    return added;
}

std::optional<std::vector<std::string>> MergeCache::cached_line(const std::string& video_id, const std::string& hash) const {
    auto it = videos_.find(video_id);
    if (it == videos_.end()) return std::nullopt;
    auto line = it->second.lines.find(hash);
    if (line == it->second.lines.end() || line->second.empty()) return std::nullopt;
    return line->second;
}

void MergeCache::remember_line(const std::string& video_id, const std::string& hash,
                               std::vector<std::string> tokens, bool persist) {
    if (video_id.empty() || tokens.empty()) return;
    VideoEntry& e = entry(video_id);
    if (persist) {
        nlohmann::json value = {{"tokens", tokens}};
        std::string key = line_key(video_id, hash);
        int64_t ttl = config_.line_cache_ttl_seconds;
        queue_.post("persist line " + key, [&store = store_, key, value, ttl] {
            store.set(key, value, ttl);
        });
    }
    e.lines[hash] = std::move(tokens);
}

std::optional<std::vector<std::string>> load_stored_line(TtlStore& store, const std::string& video_id,
                                                         const std::string& hash) {
    StoreResult r = store.get(line_key(video_id, hash));
    if (!r.success) {
        std::cerr << "Warning: Line cache read failed for video " << video_id << ": " << r.error << std::endl;
        return std::nullopt;
    }
    if (!r.data || !r.data->is_object()) return std::nullopt;

    auto tokens = string_items(*r.data, "tokens");
    if (tokens.empty()) return std::nullopt;
    return tokens;
}

MergeCache::VideoEntry& MergeCache::entry(const std::string& video_id, bool from_store) {
    auto it = videos_.find(video_id);
    if (it != videos_.end()) return it->second;

    while (!videos_.empty() && videos_.size() >= config_.max_cached_videos) {
        evict_oldest();
    }
    // A fresh entry would otherwise hide the stored set from merges_for
    if (!from_store) schedule_hydration(video_id);
    insertion_order_.push_back(video_id);
    return videos_[video_id];
}

void MergeCache::evict_oldest() {
    while (!insertion_order_.empty()) {
        std::string oldest = std::move(insertion_order_.front());
        insertion_order_.pop_front();
        if (videos_.erase(oldest) > 0) {
            if (config_.debug) {
                std::cout << "[debug] Evicted cached merges for video " << oldest << std::endl;
            }
            return;
        }
    }
}

void MergeCache::schedule_hydration(const std::string& video_id) {
    if (!hydrating_.insert(video_id).second) return;
    std::weak_ptr<bool> alive = alive_;
    queue_.post("hydrate merges " + video_id, [this, alive, video_id] {
        if (alive.expired()) return;
        hydrate(video_id);
    });
}

void MergeCache::hydrate(const std::string& video_id) {
    hydrating_.erase(video_id);

    StoreResult r = store_.get(merges_key(video_id));
    if (!r.success) {
        std::cerr << "Warning: Merge cache read failed for video " << video_id << ": " << r.error << std::endl;
        return;
    }
    if (!r.data || !r.data->is_object()) return;

    auto phrases = string_items(*r.data, "phrases");
    if (phrases.empty()) return;

    // Union: a warm-up or hint may have landed while this was queued
    VideoEntry& e = entry(video_id, true);
    const size_t cap = config_.merge_cap();
    size_t added = 0;
    for (const auto& p : phrases) {
        if (e.merges.insert(normalize(p), cap)) ++added;
    }
    if (config_.debug) {
        std::cout << "[debug] Hydrated " << added << " merges for video " << video_id << std::endl;
    }
}

void MergeCache::schedule_persist_merges(const std::string& video_id, std::vector<std::string> phrases) {
    std::string key = merges_key(video_id);
    int64_t ttl = config_.cache_ttl_seconds;
    size_t cap = config_.merge_cap();
    std::weak_ptr<bool> alive = alive_;
    queue_.post("persist merges " + key,
                [this, alive, &store = store_, clock = clock_, video_id, key, ttl, cap,
                 snapshot = std::move(phrases)] {
        // Live set first; hydration may have grown it since. The entry may
        // also have been evicted and recreated, so the snapshot still counts.
        MergeSet merged;
        if (!alive.expired()) {
            auto it = videos_.find(video_id);
            if (it != videos_.end()) {
                for (const auto& p : it->second.merges.phrases()) merged.insert(p, cap);
            }
        }
        for (const auto& p : snapshot) merged.insert(p, cap);

        // Stored phrases last, so a set that was never hydrated is not lost
        StoreResult r = store.get(key);
        if (r.success && r.data && r.data->is_object()) {
            for (const auto& p : string_items(*r.data, "phrases")) {
                merged.insert(normalize(p), cap);
            }
        }

        nlohmann::json value = {
            {"phrases", merged.phrases()},
            {"ts", to_epoch_ms(clock())},
        };
        store.set(key, value, ttl);
    });
}

} // namespace thai
