#include "collocation_miner.hpp"
#include "constants.hpp"
#include <algorithm>
#include <cmath>

namespace thai {

// Unit separator; never produced by the tokenizer inside a Thai token
static constexpr char KEY_SEP = '\x1F';

double pmi(double xy, double x, double y, uint64_t total_tokens) {
    const double eps = 1e-9;
    double n = static_cast<double>(total_tokens);
    double pxy = xy / std::max(1.0, n - 1.0);
    double px = x / std::max(1.0, n);
    double py = y / std::max(1.0, n);
    return std::log2((pxy + eps) / (px * py + eps));
}

// ---------------------------------------------------------------------------
// PhraseStatistics
// ---------------------------------------------------------------------------

std::string PhraseStatistics::key(const std::string& a, const std::string& b) {
    std::string k;
    k.reserve(a.size() + b.size() + 1);
    k += a;
    k += KEY_SEP;
    k += b;
    return k;
}

std::string PhraseStatistics::key(const std::string& a, const std::string& b, const std::string& c) {
    std::string k = key(a, b);
    k += KEY_SEP;
    k += c;
    return k;
}

void PhraseStatistics::add_line(const std::vector<std::string>& tokens) {
    if (tokens.empty()) return;
    total_tokens_ += tokens.size();

    for (size_t i = 0; i < tokens.size(); ++i) {
        ++unigrams_[tokens[i]];

        if (i + 1 < tokens.size()) {
            auto [it, inserted] = bigram_index_.emplace(key(tokens[i], tokens[i + 1]),
                                                        static_cast<uint32_t>(bigrams_.size()));
            if (inserted) {
                bigrams_.push_back(Bigram{tokens[i], tokens[i + 1], 0});
            }
            ++bigrams_[it->second].count;
        }

        if (i + 2 < tokens.size()) {
            auto [it, inserted] = trigram_index_.emplace(key(tokens[i], tokens[i + 1], tokens[i + 2]),
                                                         static_cast<uint32_t>(trigrams_.size()));
            if (inserted) {
                trigrams_.push_back(Trigram{tokens[i], tokens[i + 1], tokens[i + 2], 0});
            }
            ++trigrams_[it->second].count;
        }
    }
}

uint32_t PhraseStatistics::unigram_count(const std::string& token) const {
    auto it = unigrams_.find(token);
    return it != unigrams_.end() ? it->second : 0;
}

uint32_t PhraseStatistics::bigram_count(const std::string& a, const std::string& b) const {
    auto it = bigram_index_.find(key(a, b));
    return it != bigram_index_.end() ? bigrams_[it->second].count : 0;
}

double PhraseStatistics::bigram_pmi(const std::string& a, const std::string& b) const {
    return pmi(bigram_count(a, b), unigram_count(a), unigram_count(b), total_tokens_);
}

// ---------------------------------------------------------------------------
// CollocationMiner
// ---------------------------------------------------------------------------

CollocationMiner::CollocationMiner(const SegmenterConfig& config)
    : config_(config)
{
}

std::vector<std::string> CollocationMiner::mine(const std::vector<std::vector<std::string>>& lines) const {
    PhraseStatistics stats;
    for (const auto& tokens : lines) {
        stats.add_line(tokens);
    }
    return mine(stats);
}

std::vector<std::string> CollocationMiner::mine(const PhraseStatistics& stats) const {
    const size_t cap = config_.merge_cap();
    const size_t min_count = config_.min_collocation_count;
    const double threshold = config_.pmi_threshold;
    const uint64_t n = stats.total_tokens();

    std::vector<std::string> merges;
    robin_hood::unordered_flat_set<std::string> seen;

    auto accept = [&](std::string phrase) {
        if (codepoint_length(phrase) > config_.max_span_length) return;
        if (seen.insert(phrase).second) {
            merges.push_back(std::move(phrase));
        }
    };

    for (const auto& bg : stats.bigrams()) {
        if (bg.count < min_count) continue;
        double score = pmi(bg.count, stats.unigram_count(bg.a), stats.unigram_count(bg.b), n);
        if (score >= threshold) {
            accept(bg.a + bg.b);
        }
    }

    // Both adjacent pairs must be well associated on their own
    for (const auto& tg : stats.trigrams()) {
        if (tg.count < min_count + 1) continue;
        uint32_t ab = stats.bigram_count(tg.a, tg.b);
        uint32_t bc = stats.bigram_count(tg.b, tg.c);
        if (ab == 0 || bc == 0) continue;

        double pmi_ab = pmi(ab, stats.unigram_count(tg.a), stats.unigram_count(tg.b), n);
        double pmi_bc = pmi(bc, stats.unigram_count(tg.b), stats.unigram_count(tg.c), n);
        if (std::min(pmi_ab, pmi_bc) >= threshold) {
            accept(tg.a + tg.b + tg.c);
        }
    }

    if (merges.size() > cap) {
        merges.resize(cap);
    }
    return merges;
}

} // namespace thai
