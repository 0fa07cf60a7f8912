#include "segmenter.hpp"
#include "boundary.hpp"
#include <algorithm>
#include <iostream>
#include <limits>

namespace thai {

// Reused across calls to avoid per-line allocation
struct ThreadLocalBuffers {
    std::vector<double> dp_cost;
    std::vector<int32_t> dp_next;
    std::vector<char> hard;
    std::string phrase;

    ThreadLocalBuffers() {
        dp_cost.reserve(256);
        dp_next.reserve(256);
        hard.reserve(256);
        phrase.reserve(256);
    }
};

static thread_local ThreadLocalBuffers tl_buffers;

Segmenter::Segmenter(const SegmenterConfig& config, const SpanCostModel& cost_model)
    : config_(config), cost_model_(cost_model)
{
}

std::vector<std::string> Segmenter::segment(const std::vector<std::string>& tokens, const MergeSet& merges) const {
    const size_t n = tokens.size();
    if (n <= 1) return tokens;

    auto& dp_cost = tl_buffers.dp_cost;
    auto& dp_next = tl_buffers.dp_next;
    auto& hard = tl_buffers.hard;
    auto& phrase = tl_buffers.phrase;

    dp_cost.assign(n + 1, std::numeric_limits<double>::infinity());
    dp_next.assign(n + 1, -1);
    dp_cost[n] = 0.0;

    // Hard-boundary flags, computed once per line
    hard.resize(n);
    for (size_t k = 0; k < n; ++k) {
        hard[k] = is_hard_boundary(tokens[k]) ? 1 : 0;
    }

    const size_t max_span = std::min(config_.max_span_length, n);

    for (size_t i = n; i-- > 0;) {
        phrase.clear();
        for (size_t len = 1; len <= max_span && i + len <= n; ++len) {
            // A multi-token span stops at the first hard boundary
            if (len > 1 && (hard[i] || hard[i + len - 1])) break;

            phrase += tokens[i + len - 1];
            double total = cost_model_.cost(phrase, len, merges) + dp_cost[i + len];
            if (total < dp_cost[i]) {
                dp_cost[i] = total;
                dp_next[i] = static_cast<int32_t>(i + len);
            }
        }
    }

    // Walk the chosen edges from position 0
    std::vector<std::string> spans;
    spans.reserve(n);
    size_t idx = 0;
    while (idx < n && dp_next[idx] > static_cast<int32_t>(idx)) {
        size_t next = static_cast<size_t>(dp_next[idx]);
        spans.push_back(join(tokens, idx, next));
        idx = next;
    }

    if (spans.empty() || idx != n) {
        std::cerr << "Warning: Segmentation path incomplete at token " << idx
                  << ", returning baseline tokens" << std::endl;
        return tokens;
    }
    return spans;
}

std::string Segmenter::join(const std::vector<std::string>& tokens, size_t start, size_t end) {
    if (end - start == 1) return tokens[start];
    size_t bytes = 0;
    for (size_t k = start; k < end; ++k) bytes += tokens[k].size();
    std::string out;
    out.reserve(bytes);
    for (size_t k = start; k < end; ++k) out += tokens[k];
    return out;
}

} // namespace thai
