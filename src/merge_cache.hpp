#pragma once

#include "config.hpp"
#include "kv_store.hpp"
#include "merge_set.hpp"
#include "task_queue.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "robin_hood.h"

namespace thai {

// 32-bit FNV-style hash over UTF-16 code units, base 36
std::string line_hash(std::string_view normalized_text);

std::string merges_key(const std::string& video_id);
std::string line_key(const std::string& video_id, const std::string& hash);

// Reads a stored line segmentation. Read failures are logged and reported as a miss.
std::optional<std::vector<std::string>> load_stored_line(TtlStore& store, const std::string& video_id,
                                                         const std::string& hash);

// Per-video merge sets and improved line segmentations, backed by a TtlStore.
// Store reads and writes go through the task queue; the synchronous accessors
// only ever see memory. Queued tasks may run after the cache is destroyed:
// they skip the in-memory side then, but persistence still completes as
// long as the store is alive.
class MergeCache {
public:
    MergeCache(const SegmenterConfig& config, TtlStore& store, TaskQueue& queue, Clock clock = system_clock());

    MergeCache(const MergeCache&) = delete;
    MergeCache& operator=(const MergeCache&) = delete;

    // The video's in-memory merge set. On a cold miss, schedules hydration
    // from the store and returns an empty set for this call.
    const MergeSet& merges_for(const std::string& video_id);

    // Memory only; never schedules hydration
    const MergeSet* find(const std::string& video_id) const;

    bool has_video(const std::string& video_id) const { return videos_.count(video_id) > 0; }
    size_t video_count() const { return videos_.size(); }

    // Union into the video's set (capped) and schedule persisting the whole
    // set. A cold video is also hydrated, so stored phrases are never dropped.
    // Returns the number of phrases added.
    size_t add_merges(const std::string& video_id, const std::vector<std::string>& phrases);

    std::optional<std::vector<std::string>> cached_line(const std::string& video_id, const std::string& hash) const;

    void remember_line(const std::string& video_id, const std::string& hash,
                       std::vector<std::string> tokens, bool persist);

    TtlStore& store() { return store_; }

private:
    struct VideoEntry {
        MergeSet merges;
        robin_hood::unordered_flat_map<std::string, std::vector<std::string>> lines;
    };

    const SegmenterConfig& config_;
    TtlStore& store_;
    TaskQueue& queue_;
    Clock clock_;

    robin_hood::unordered_node_map<std::string, VideoEntry> videos_;
    std::deque<std::string> insertion_order_;
    robin_hood::unordered_flat_set<std::string> hydrating_;

    std::shared_ptr<bool> alive_;

    static const MergeSet empty_;

    // Creating a cold entry schedules hydration unless `from_store` is set
    VideoEntry& entry(const std::string& video_id, bool from_store = false);
    void evict_oldest();
    void schedule_hydration(const std::string& video_id);
    void hydrate(const std::string& video_id);
    void schedule_persist_merges(const std::string& video_id, std::vector<std::string> phrases);
};

} // namespace thai
