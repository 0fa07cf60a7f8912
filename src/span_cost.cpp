#include "span_cost.hpp"
#include "constants.hpp"

namespace thai {

SpanCostModel::SpanCostModel(const SegmenterConfig& config, const Dictionary* dictionary)
    : config_(config), dictionary_(dictionary)
{
}

double SpanCostModel::cost(std::string_view phrase, size_t token_count, const MergeSet& merges) const {
    const CostWeights& w = config_.costs;
    size_t phrase_len = codepoint_length(phrase);

    double cost = static_cast<double>(token_count) * w.per_token;

    bool in_dictionary = dictionary_ != nullptr
        && phrase_len <= dictionary_->max_word_length()
        && dictionary_->contains(phrase);
    bool in_merges = merges.contains(phrase);

    if (config_.enable_dictionary_bonus && in_dictionary) {
        cost -= w.dictionary_bonus;
    }
    if (in_merges) {
        cost -= w.merge_bonus;
    }
    // Convergent evidence; applies whether or not the dictionary bonus is enabled
    if (in_dictionary && in_merges) {
        cost -= w.synergy_bonus;
    }
    if (phrase_len > config_.max_span_length) {
        cost += w.over_length_penalty;
    }

    return cost < w.floor ? w.floor : cost;
}

} // namespace thai
