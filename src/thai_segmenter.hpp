#pragma once

#include "ai_hints.hpp"
#include "collocation_miner.hpp"
#include "config.hpp"
#include "dictionary.hpp"
#include "kv_store.hpp"
#include "merge_cache.hpp"
#include "segmenter.hpp"
#include "span_cost.hpp"
#include "task_queue.hpp"
#include "tokenizer.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "robin_hood.h"

namespace thai {

struct SegmentationSnapshot {
    std::string video_id;
    std::vector<std::string> original;            // baseline tokens
    std::vector<std::string> collocation_applied; // after the DP
};

using LineCallback = std::function<void(std::optional<std::vector<std::string>>)>;

// Per-video Thai re-segmentation engine. One long-lived instance per host;
// none of the public entry points throw.
//
// Background work (store hydration/persistence, hint fetches) is posted to
// the TaskQueue and only takes effect once the host drains it, so a call made
// before that sees the previous state. The queue and store may outlive the
// engine; tasks left behind then finish without touching it.
class ThaiSegmenter {
public:
    // `dictionary` and `ai_provider` are optional and must outlive the engine
    ThaiSegmenter(SegmenterConfig config,
                  const WordBreaker& breaker,
                  TtlStore& store,
                  TaskQueue& queue,
                  const Dictionary* dictionary = nullptr,
                  AiHintProvider* ai_provider = nullptr,
                  Clock clock = system_clock());

    ThaiSegmenter(const ThaiSegmenter&) = delete;
    ThaiSegmenter& operator=(const ThaiSegmenter&) = delete;

    // Display spans for one line. Concatenated they equal normalize(text).
    std::vector<std::string> segment(std::string_view text,
                                     const std::string& video_id = {},
                                     SegmentationSnapshot* snapshot = nullptr);

    // Baseline tokens of normalize(text)
    std::vector<std::string> tokenize(std::string_view text) const;

    // Mines collocations over all of a video's lines into its merge set,
    // persists it, and requests AI hints if enabled and off cooldown.
    void warm_up_for_video(const std::string& video_id, const std::vector<std::string>& line_texts);

    // Schedules hydration of a cold video's merge set from the store
    void prefetch_merges(const std::string& video_id);

    // Normalizes and unions the hinted phrases into the video's merge set
    void set_ai_merge_hints(const AiHintBatch& hints);

    // Queues a hint fetch for up to aiTopN candidates. Returns false when AI
    // is disabled, no provider is set, or the video is within its cooldown.
    bool request_merge_hints(const std::string& video_id, const std::vector<std::string>& candidates);

    // Same, bypassing the cooldown, with the video's current merges as candidates
    bool force_fetch_ai_hints(const std::string& video_id);

    // Looks up an improved segmentation (memory, then store) and reports it
    // through `done`. Never asks the provider: hints arrive per video only.
    void improve_line_segmentation(const std::string& video_id,
                                   const std::string& line_text,
                                   const std::vector<std::string>& baseline_tokens,
                                   const std::vector<std::string>& current_tokens,
                                   LineCallback done);

    std::optional<std::vector<std::string>> cached_line_segmentation(const std::string& video_id,
                                                                     std::string_view line_text) const;

    // Rejected unless `tokens` concatenate to normalize(line_text)
    bool store_line_segmentation(const std::string& video_id,
                                 std::string_view line_text,
                                 std::vector<std::string> tokens);

    // Partial update; on a bad patch the previous config stays in force
    bool update_config(const nlohmann::json& patch);
    const SegmenterConfig& config() const { return config_; }

    void set_ai_hint_provider(AiHintProvider* provider) { ai_provider_ = provider; }
    bool is_ai_provider_active() const { return ai_provider_ != nullptr; }

    const MergeCache& merge_cache() const { return cache_; }

private:
    SegmenterConfig config_;
    Tokenizer tokenizer_;
    SpanCostModel cost_model_;
    Segmenter segmenter_;
    CollocationMiner miner_;
    MergeCache cache_;
    TaskQueue& queue_;
    AiHintProvider* ai_provider_;
    Clock clock_;
    robin_hood::unordered_flat_map<std::string, TimePoint> last_ai_fetch_;
    std::shared_ptr<bool> alive_;

    void dispatch_hint_fetch(const std::string& video_id, std::vector<std::string> sample);
    void prune_cooldowns(TimePoint now);
};

} // namespace thai
