#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace thai {

// Span cost constants. Empirical defaults; all tunable.
struct CostWeights {
    double per_token = 1.0;
    double dictionary_bonus = 2.0;
    double merge_bonus = 1.2;
    double synergy_bonus = 0.5;
    double over_length_penalty = 2.0;
    double floor = 0.05;
};

struct SegmenterConfig {
    bool enabled = true;
    size_t max_span_length = 10;      // tokens per span in the DP, codepoints per mined phrase
    size_t min_collocation_count = 2; // trigrams need one more
    double pmi_threshold = 3.0;
    bool enable_dictionary_bonus = true;
    bool enable_ai_hints = true;
    size_t ai_top_n = 10000;
    int64_t ai_cooldown_minutes = 60;
    int64_t cache_ttl_seconds = 24 * 60 * 60;
    int64_t line_cache_ttl_seconds = 30 * 24 * 60 * 60;
    size_t max_merges_per_video = 10000;
    size_t max_cached_videos = 256;
    bool debug = false;
    CostWeights costs;

    // Effective cap on a video's merge set, clamped to [100, 20000]
    size_t merge_cap() const;

    // Clamp out-of-range values in place
    void validate();

    // Apply the keys present in `patch`. Throws on type errors and leaves *this unchanged.
    void apply(const nlohmann::json& patch);

    nlohmann::json to_json() const;

    static SegmenterConfig from_json(const nlohmann::json& j);

    // Returns defaults if the file is missing or malformed
    static SegmenterConfig load(const std::string& path);
};

} // namespace thai
