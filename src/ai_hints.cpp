#include "ai_hints.hpp"
#include <fstream>
#include <iostream>
#include <iterator>

namespace thai {

using json = nlohmann::json;

namespace {

std::string_view trim_ascii(std::string_view s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string_view::npos) return {};
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Object under `field` as an array, trying the whole text then the outermost braces
std::optional<json> find_array_field(std::string_view text, const char* field) {
    auto try_parse = [field](std::string_view s) -> std::optional<json> {
        json j = json::parse(s.begin(), s.end(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) return std::nullopt;
        auto it = j.find(field);
        if (it == j.end() || !it->is_array()) return std::nullopt;
        return *it;
    };

    std::string_view trimmed = trim_ascii(text);
    if (trimmed.empty()) return std::nullopt;

    if (auto direct = try_parse(trimmed)) return direct;

    size_t start = trimmed.find('{');
    size_t end = trimmed.rfind('}');
    if (start != std::string_view::npos && end != std::string_view::npos && end > start) {
        return try_parse(trimmed.substr(start, end - start + 1));
    }
    return std::nullopt;
}

const json& field_or_null(const json& obj, const char* key) {
    static const json null_value;
    auto it = obj.find(key);
    return it != obj.end() ? *it : null_value;
}

std::vector<AiMergeHint> merge_items(const json& arr) {
    std::vector<AiMergeHint> out;
    if (!arr.is_array()) return out;
    for (const auto& item : arr) {
        if (item.is_string()) {
            out.push_back(AiMergeHint{item.get<std::string>(), std::nullopt});
        } else if (item.is_object()) {
            auto phrase = item.find("phrase");
            if (phrase == item.end() || !phrase->is_string()) continue;
            AiMergeHint hint{phrase->get<std::string>(), std::nullopt};
            auto weight = item.find("weight");
            if (weight != item.end() && weight->is_number()) {
                hint.weight = weight->get<double>();
            }
            out.push_back(std::move(hint));
        }
    }
    return out;
}

} // namespace

std::optional<AiHintBatch> parse_merge_hints(const std::string& video_id, std::string_view text) {
    auto arr = find_array_field(text, "merges");
    if (!arr) return std::nullopt;

    AiHintBatch batch{video_id, merge_items(*arr)};
    if (batch.merges.empty()) return std::nullopt;
    return batch;
}

// ---------------------------------------------------------------------------
// FileHintProvider
// ---------------------------------------------------------------------------

bool FileHintProvider::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open hints file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    json doc = json::parse(content, nullptr, false);
    if (!doc.is_discarded() && doc.is_object()) {
        load_json(doc);
    } else if (auto batch = parse_merge_hints("", content)) {
        // A saved provider response, possibly wrapped in prose
        global_merges_.insert(global_merges_.end(), batch->merges.begin(), batch->merges.end());
    } else {
        std::cerr << "Error: No merge hints found in " << path << std::endl;
        return false;
    }

    std::cout << "Loaded hints: " << global_merges_.size() << " global merges, "
              << videos_.size() << " videos." << std::endl;
    return true;
}

void FileHintProvider::load_json(const json& doc) {
    if (!doc.is_object()) return;

    auto merges = merge_items(field_or_null(doc, "merges"));
    global_merges_.insert(global_merges_.end(), merges.begin(), merges.end());

    auto videos = doc.find("videos");
    if (videos == doc.end() || !videos->is_object()) return;

    for (auto it = videos->begin(); it != videos->end(); ++it) {
        const json& v = it.value();
        if (!v.is_object()) continue;

        auto vm = merge_items(field_or_null(v, "merges"));
        auto& hints = videos_[it.key()];
        hints.insert(hints.end(), vm.begin(), vm.end());
    }
}

std::optional<AiHintBatch> FileHintProvider::fetch_merge_hints(
    const std::string& video_id,
    const std::vector<std::string>& /*candidate_phrases*/) {
    ++calls_;

    AiHintBatch batch;
    batch.video_id = video_id;
    batch.merges = global_merges_;

    auto it = videos_.find(video_id);
    if (it != videos_.end()) {
        batch.merges.insert(batch.merges.end(), it->second.begin(), it->second.end());
    }
    if (batch.merges.empty()) return std::nullopt;
    return batch;
}

} // namespace thai
