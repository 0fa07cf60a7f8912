#pragma once

#include "config.hpp"
#include "dictionary.hpp"
#include "merge_set.hpp"
#include <string_view>

namespace thai {

// Cost of emitting a run of baseline tokens as one span. Lower is preferred.
class SpanCostModel {
public:
    // `dictionary` may be null (no gazetteer loaded)
    SpanCostModel(const SegmenterConfig& config, const Dictionary* dictionary);

    double cost(std::string_view phrase, size_t token_count, const MergeSet& merges) const;

private:
    const SegmenterConfig& config_;
    const Dictionary* dictionary_;
};

} // namespace thai
