#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "robin_hood.h"

namespace thai {

struct AiMergeHint {
    std::string phrase;
    std::optional<double> weight;
};

struct AiHintBatch {
    std::string video_id;
    std::vector<AiMergeHint> merges;
};

// External source of merge phrases for a video. Implementations may throw;
// the engine runs them from background tasks and logs failures.
class AiHintProvider {
public:
    virtual ~AiHintProvider() = default;

    virtual std::optional<AiHintBatch> fetch_merge_hints(
        const std::string& video_id,
        const std::vector<std::string>& candidate_phrases) = 0;
};

// "AI disabled"
class NullAiHintProvider : public AiHintProvider {
public:
    std::optional<AiHintBatch> fetch_merge_hints(
        const std::string&, const std::vector<std::string>&) override {
        return std::nullopt;
    }
};

// Offline provider backed by a JSON file:
// { "merges": [...], "videos": { "<id>": { "merges": [...] } } }
// Top-level merges apply to every video.
class FileHintProvider : public AiHintProvider {
public:
    FileHintProvider() = default;

    // Also accepts a raw provider response (see parse_merge_hints).
    // Returns false if the file is missing or holds no hints.
    bool load(const std::string& path);
    void load_json(const nlohmann::json& doc);

    std::optional<AiHintBatch> fetch_merge_hints(
        const std::string& video_id,
        const std::vector<std::string>& candidate_phrases) override;

    size_t calls() const { return calls_; }

private:
    std::vector<AiMergeHint> global_merges_;
    robin_hood::unordered_node_map<std::string, std::vector<AiMergeHint>> videos_;
    size_t calls_ = 0;
};

// Reads a provider's response text: the whole text as JSON, else the span
// between the first '{' and the last '}'. `merges` items may be strings or
// {phrase, weight} objects; other items are skipped.
std::optional<AiHintBatch> parse_merge_hints(const std::string& video_id, std::string_view text);

} // namespace thai
