#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "robin_hood.h"

namespace thai {

// Per-video phrase vocabulary. Insert-only, keeps first-insertion order
// so truncation and candidate sampling are deterministic.
class MergeSet {
public:
    // Returns false if already present or the set holds `cap` phrases
    bool insert(std::string phrase, size_t cap) {
        if (phrase.empty() || order_.size() >= cap) return false;
        if (!members_.insert(phrase).second) return false;
        order_.push_back(std::move(phrase));
        return true;
    }

    bool contains(std::string_view phrase) const {
        if (order_.empty()) return false;
        return members_.count(std::string(phrase)) > 0;
    }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    const std::vector<std::string>& phrases() const { return order_; }

private:
    robin_hood::unordered_flat_set<std::string> members_;
    std::vector<std::string> order_;
};

} // namespace thai
