#include "thai_segmenter.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace thai {

ThaiSegmenter::ThaiSegmenter(SegmenterConfig config,
                             const WordBreaker& breaker,
                             TtlStore& store,
                             TaskQueue& queue,
                             const Dictionary* dictionary,
                             AiHintProvider* ai_provider,
                             Clock clock)
    : config_(std::move(config)),
      tokenizer_(breaker),
      cost_model_(config_, dictionary),
      segmenter_(config_, cost_model_),
      miner_(config_),
      cache_(config_, store, queue, clock),
      queue_(queue),
      ai_provider_(ai_provider),
      clock_(std::move(clock)),
      alive_(std::make_shared<bool>(true))
{
    config_.validate();
}

std::vector<std::string> ThaiSegmenter::tokenize(std::string_view text) const {
    return tokenizer_.tokenize(normalize(text));
}

std::vector<std::string> ThaiSegmenter::segment(std::string_view text,
                                                const std::string& video_id,
                                                SegmentationSnapshot* snapshot) {
    std::string clean;
    std::vector<std::string> tokens;
    try {
        clean = normalize(text);
        if (!config_.enabled) {
            return tokenizer_.tokenize(clean);
        }
        if (clean.empty()) return {};

        tokens = tokenizer_.tokenize(clean);

        std::vector<std::string> spans;
        if (tokens.size() <= 1) {
            spans = tokens;
        } else {
            spans = segmenter_.segment(tokens, cache_.merges_for(video_id));
        }

        if (snapshot) {
            snapshot->video_id = video_id;
            snapshot->original = tokens;
            snapshot->collocation_applied = spans;
        }
        return spans;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Segmentation failed, using baseline tokens: " << e.what() << std::endl;
        if (!tokens.empty()) return tokens;
        if (!clean.empty()) return {clean};
        return {};
    }
}

void ThaiSegmenter::warm_up_for_video(const std::string& video_id, const std::vector<std::string>& line_texts) {
    if (video_id.empty()) return;
    try {
        std::vector<std::vector<std::string>> lines;
        lines.reserve(line_texts.size());
        for (const auto& text : line_texts) {
            lines.push_back(tokenizer_.tokenize(normalize(text)));
        }

        std::vector<std::string> merges = miner_.mine(lines);
        size_t added = cache_.add_merges(video_id, merges);
        if (config_.debug) {
            std::cout << "[debug] Warm-up for video " << video_id << ": " << line_texts.size()
                      << " lines, " << merges.size() << " mined, " << added << " new" << std::endl;
        }

        if (config_.enable_ai_hints && ai_provider_) {
            request_merge_hints(video_id, merges);
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Warm-up failed for video " << video_id << ": " << e.what() << std::endl;
    }
}

void ThaiSegmenter::prefetch_merges(const std::string& video_id) {
    try {
        cache_.merges_for(video_id);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not schedule hydration for video " << video_id << ": " << e.what() << std::endl;
    }
}

void ThaiSegmenter::set_ai_merge_hints(const AiHintBatch& hints) {
    if (hints.video_id.empty()) return;
    try {
        std::vector<std::string> phrases;
        phrases.reserve(hints.merges.size());
        for (const auto& m : hints.merges) {
            std::string p = normalize(m.phrase);
            if (!p.empty()) phrases.push_back(std::move(p));
        }
        size_t added = cache_.add_merges(hints.video_id, phrases);
        if (config_.debug) {
            std::cout << "[debug] Applied " << added << " of " << hints.merges.size()
                      << " AI merge hints for video " << hints.video_id << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to set AI merge hints for video " << hints.video_id
                  << ": " << e.what() << std::endl;
    }
}

bool ThaiSegmenter::request_merge_hints(const std::string& video_id, const std::vector<std::string>& candidates) {
    if (video_id.empty() || !config_.enable_ai_hints || !ai_provider_ || candidates.empty()) {
        return false;
    }
    try {
        TimePoint now = clock_();
        auto it = last_ai_fetch_.find(video_id);
        if (it != last_ai_fetch_.end() && now - it->second < std::chrono::minutes(config_.ai_cooldown_minutes)) {
            if (config_.debug) {
                std::cout << "[debug] AI hints for video " << video_id << " on cooldown" << std::endl;
            }
            return false;
        }

        prune_cooldowns(now);
        // Counted per attempt: a failing provider is not retried inside the window
        last_ai_fetch_[video_id] = now;

        size_t n = std::min(config_.ai_top_n, candidates.size());
        dispatch_hint_fetch(video_id, std::vector<std::string>(candidates.begin(), candidates.begin() + n));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not request AI hints for video " << video_id << ": " << e.what() << std::endl;
        return false;
    }
}

bool ThaiSegmenter::force_fetch_ai_hints(const std::string& video_id) {
    if (!ai_provider_) {
        if (config_.debug) {
            std::cout << "[debug] force_fetch_ai_hints: AI provider not active (" << video_id << ")" << std::endl;
        }
        return false;
    }
    try {
        const auto& existing = cache_.merges_for(video_id).phrases();
        if (existing.empty()) {
            if (config_.debug) {
                std::cout << "[debug] force_fetch_ai_hints: no candidate merges (" << video_id << ")" << std::endl;
            }
            return false;
        }
        size_t n = std::min(config_.ai_top_n, existing.size());
        dispatch_hint_fetch(video_id, std::vector<std::string>(existing.begin(), existing.begin() + n));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not force AI hints for video " << video_id << ": " << e.what() << std::endl;
        return false;
    }
}

void ThaiSegmenter::dispatch_hint_fetch(const std::string& video_id, std::vector<std::string> sample) {
    std::weak_ptr<bool> alive = alive_;
    queue_.post("fetch merge hints " + video_id, [this, alive, video_id, sample = std::move(sample)] {
        // Engine gone: nowhere to put the hints
        if (alive.expired()) return;
        // The provider may have been swapped out since the request
        AiHintProvider* provider = ai_provider_;
        if (!provider) return;

        std::optional<AiHintBatch> hints;
        try {
            hints = provider->fetch_merge_hints(video_id, sample);
        } catch (const std::exception& e) {
            std::cerr << "Warning: AI hint fetch failed for video " << video_id << ": " << e.what() << std::endl;
            return;
        }
        if (!hints || hints->merges.empty()) {
            if (config_.debug) {
                std::cout << "[debug] No AI hints returned for video " << video_id << std::endl;
            }
            return;
        }
        hints->video_id = video_id;
        set_ai_merge_hints(*hints);
    });
}

void ThaiSegmenter::prune_cooldowns(TimePoint now) {
    if (last_ai_fetch_.size() < config_.max_cached_videos) return;

    const auto cooldown = std::chrono::minutes(config_.ai_cooldown_minutes);
    std::vector<std::string> expired;
    for (const auto& [id, at] : last_ai_fetch_) {
        if (now - at >= cooldown) expired.push_back(id);
    }
    for (const auto& id : expired) {
        last_ai_fetch_.erase(id);
    }
}

void ThaiSegmenter::improve_line_segmentation(const std::string& video_id,
                                              const std::string& line_text,
                                              const std::vector<std::string>& /*baseline_tokens*/,
                                              const std::vector<std::string>& /*current_tokens*/,
                                              LineCallback done) {
    if (!done) return;
    try {
        if (video_id.empty() || !ai_provider_) {
            done(std::nullopt);
            return;
        }

        std::string hash = line_hash(normalize(line_text));
        if (auto hit = cache_.cached_line(video_id, hash)) {
            done(std::move(hit));
            return;
        }

        std::weak_ptr<bool> alive = alive_;
        queue_.post("lookup line " + video_id + "_" + hash,
                    [this, alive, &store = cache_.store(), video_id, hash, done] {
            auto stored = load_stored_line(store, video_id, hash);
            if (stored && !alive.expired()) {
                cache_.remember_line(video_id, hash, *stored, false);
            }
            // A miss is final: no per-line provider round-trip
            done(std::move(stored));
        });
    } catch (const std::exception& e) {
        std::cerr << "Warning: Line improvement failed for video " << video_id << ": " << e.what() << std::endl;
    }
}

std::optional<std::vector<std::string>> ThaiSegmenter::cached_line_segmentation(const std::string& video_id,
                                                                                std::string_view line_text) const {
    if (video_id.empty()) return std::nullopt;
    return cache_.cached_line(video_id, line_hash(normalize(line_text)));
}

bool ThaiSegmenter::store_line_segmentation(const std::string& video_id,
                                            std::string_view line_text,
                                            std::vector<std::string> tokens) {
    if (video_id.empty() || tokens.empty()) return false;
    try {
        std::string clean = normalize(line_text);
        std::string joined;
        joined.reserve(clean.size());
        for (const auto& t : tokens) {
            if (t.empty()) return false;
            joined += t;
        }
        if (joined != clean) {
            std::cerr << "Warning: Rejected line segmentation for video " << video_id
                      << ": tokens do not reproduce the line" << std::endl;
            return false;
        }
        cache_.remember_line(video_id, line_hash(clean), std::move(tokens), true);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not store line segmentation for video " << video_id << ": " << e.what() << std::endl;
        return false;
    }
}

bool ThaiSegmenter::update_config(const nlohmann::json& patch) {
    try {
        config_.apply(patch);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Ignoring config update: " << e.what() << std::endl;
        return false;
    }
}

} // namespace thai
