#pragma once

#include "config.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "robin_hood.h"

namespace thai {

// log2(P(x,y) / (P(x) P(y))) over n tokens, with n-1 adjacent pairs.
// Epsilon-smoothed so zero counts stay finite.
double pmi(double xy, double x, double y, uint64_t total_tokens);

struct Bigram {
    std::string a, b;
    uint32_t count = 0;
};

struct Trigram {
    std::string a, b, c;
    uint32_t count = 0;
};

// Unigram/bigram/trigram counts for one video's lines. Bigrams and trigrams
// are kept in first-seen order.
class PhraseStatistics {
public:
    void add_line(const std::vector<std::string>& tokens);

    uint64_t total_tokens() const { return total_tokens_; }
    uint32_t unigram_count(const std::string& token) const;
    uint32_t bigram_count(const std::string& a, const std::string& b) const;

    // PMI of an adjacent pair using its observed counts
    double bigram_pmi(const std::string& a, const std::string& b) const;

    const std::vector<Bigram>& bigrams() const { return bigrams_; }
    const std::vector<Trigram>& trigrams() const { return trigrams_; }

private:
    robin_hood::unordered_flat_map<std::string, uint32_t> unigrams_;
    robin_hood::unordered_flat_map<std::string, uint32_t> bigram_index_;
    robin_hood::unordered_flat_map<std::string, uint32_t> trigram_index_;
    std::vector<Bigram> bigrams_;
    std::vector<Trigram> trigrams_;
    uint64_t total_tokens_ = 0;

    static std::string key(const std::string& a, const std::string& b);
    static std::string key(const std::string& a, const std::string& b, const std::string& c);
};

// Proposes a video's merge candidates from PMI over baseline tokens.
class CollocationMiner {
public:
    explicit CollocationMiner(const SegmenterConfig& config);

    // Deduplicated phrases, bigrams before trigrams, truncated to config.merge_cap()
    std::vector<std::string> mine(const std::vector<std::vector<std::string>>& lines) const;
    std::vector<std::string> mine(const PhraseStatistics& stats) const;

private:
    const SegmenterConfig& config_;
};

} // namespace thai
