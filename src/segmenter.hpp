#pragma once

#include "config.hpp"
#include "merge_set.hpp"
#include "span_cost.hpp"
#include <string>
#include <vector>

namespace thai {

// Minimum-cost partition of baseline tokens into spans.
class Segmenter {
public:
    Segmenter(const SegmenterConfig& config, const SpanCostModel& cost_model);

    // Spans concatenate to the concatenated tokens; hard-boundary tokens stay singletons
    std::vector<std::string> segment(const std::vector<std::string>& tokens, const MergeSet& merges) const;

private:
    const SegmenterConfig& config_;
    const SpanCostModel& cost_model_;

    static std::string join(const std::vector<std::string>& tokens, size_t start, size_t end);
};

} // namespace thai
