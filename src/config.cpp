#include "config.hpp"
#include "constants.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace thai {

namespace {

template <typename T>
void read_if_present(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

// Counts arrive as JSON numbers; negative values must not wrap around
void read_count(const nlohmann::json& j, const char* key, size_t& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a number");
    }
    double v = it->get<double>();
    if (v <= 0.0) {
        out = 0;
    } else if (v >= static_cast<double>(MAX_CONFIG_COUNT)) {
        out = MAX_CONFIG_COUNT;
    } else {
        out = static_cast<size_t>(v);
    }
}

// Signed durations; clamped before the cast for the same reason
void read_duration(const nlohmann::json& j, const char* key, int64_t limit, int64_t& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a number");
    }
    double v = it->get<double>();
    if (v <= 0.0) {
        out = 0;
    } else if (v >= static_cast<double>(limit)) {
        out = limit;
    } else {
        out = static_cast<int64_t>(v);
    }
}

} // namespace

size_t SegmenterConfig::merge_cap() const {
    return std::max(MIN_MERGE_CAP, std::min(max_merges_per_video, MAX_MERGE_CAP));
}

void SegmenterConfig::validate() {
    max_span_length = std::clamp<size_t>(max_span_length, 1, MAX_CONFIG_COUNT);
    min_collocation_count = std::clamp<size_t>(min_collocation_count, 1, MAX_CONFIG_COUNT);
    ai_top_n = std::clamp<size_t>(ai_top_n, 1, MAX_CONFIG_COUNT);
    ai_cooldown_minutes = std::clamp<int64_t>(ai_cooldown_minutes, 0, MAX_COOLDOWN_MINUTES);
    cache_ttl_seconds = std::clamp<int64_t>(cache_ttl_seconds, 1, MAX_TTL_SECONDS);
    line_cache_ttl_seconds = std::clamp<int64_t>(line_cache_ttl_seconds, 1, MAX_TTL_SECONDS);
    max_merges_per_video = merge_cap();
    max_cached_videos = std::clamp<size_t>(max_cached_videos, 1, MAX_CONFIG_COUNT);
    if (!(costs.floor > 0.0)) costs.floor = CostWeights{}.floor;
}

void SegmenterConfig::apply(const nlohmann::json& patch) {
    if (!patch.is_object()) {
        throw std::invalid_argument("config patch must be an object");
    }
    // Stage into a copy so a bad key leaves *this untouched
    SegmenterConfig next = *this;
    read_if_present(patch, "enabled", next.enabled);
    read_count(patch, "maxSpanLength", next.max_span_length);
    read_count(patch, "minCollocationCount", next.min_collocation_count);
    read_if_present(patch, "pmiThreshold", next.pmi_threshold);
    read_if_present(patch, "enableDictionaryBonus", next.enable_dictionary_bonus);
    read_if_present(patch, "enableAiHints", next.enable_ai_hints);
    read_count(patch, "aiTopN", next.ai_top_n);
    read_duration(patch, "aiCooldownMinutes", MAX_COOLDOWN_MINUTES, next.ai_cooldown_minutes);
    read_duration(patch, "cacheTtlSeconds", MAX_TTL_SECONDS, next.cache_ttl_seconds);
    read_duration(patch, "lineCacheTtlSeconds", MAX_TTL_SECONDS, next.line_cache_ttl_seconds);
    read_count(patch, "maxMergesPerVideo", next.max_merges_per_video);
    read_count(patch, "maxCachedVideos", next.max_cached_videos);
    read_if_present(patch, "debug", next.debug);

    auto costs_it = patch.find("costs");
    if (costs_it != patch.end() && costs_it->is_object()) {
        const auto& c = *costs_it;
        read_if_present(c, "perToken", next.costs.per_token);
        read_if_present(c, "dictionaryBonus", next.costs.dictionary_bonus);
        read_if_present(c, "mergeBonus", next.costs.merge_bonus);
        read_if_present(c, "synergyBonus", next.costs.synergy_bonus);
        read_if_present(c, "overLengthPenalty", next.costs.over_length_penalty);
        read_if_present(c, "floor", next.costs.floor);
    }

    next.validate();
    *this = next;
}

nlohmann::json SegmenterConfig::to_json() const {
    return {
        {"enabled", enabled},
        {"maxSpanLength", max_span_length},
        {"minCollocationCount", min_collocation_count},
        {"pmiThreshold", pmi_threshold},
        {"enableDictionaryBonus", enable_dictionary_bonus},
        {"enableAiHints", enable_ai_hints},
        {"aiTopN", ai_top_n},
        {"aiCooldownMinutes", ai_cooldown_minutes},
        {"cacheTtlSeconds", cache_ttl_seconds},
        {"lineCacheTtlSeconds", line_cache_ttl_seconds},
        {"maxMergesPerVideo", max_merges_per_video},
        {"maxCachedVideos", max_cached_videos},
        {"debug", debug},
        {"costs", {
            {"perToken", costs.per_token},
            {"dictionaryBonus", costs.dictionary_bonus},
            {"mergeBonus", costs.merge_bonus},
            {"synergyBonus", costs.synergy_bonus},
            {"overLengthPenalty", costs.over_length_penalty},
            {"floor", costs.floor},
        }},
    };
}

SegmenterConfig SegmenterConfig::from_json(const nlohmann::json& j) {
    SegmenterConfig config;
    config.apply(j);
    return config;
}

SegmenterConfig SegmenterConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Warning: Could not open config file: " << path << ". Using defaults." << std::endl;
        return SegmenterConfig{};
    }
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Invalid config file " << path << ": " << e.what() << ". Using defaults." << std::endl;
        return SegmenterConfig{};
    }
}

} // namespace thai
