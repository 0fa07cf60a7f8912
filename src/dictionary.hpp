#pragma once

#include <string>
#include <string_view>
#include "robin_hood.h"

namespace thai {

// Static phrase gazetteer, queried by set membership.
class Dictionary {
public:
    Dictionary();

    // Non-copyable; shared by reference with the engine
    Dictionary(const Dictionary&) = delete;
    Dictionary& operator=(const Dictionary&) = delete;

    // One phrase per line. Returns false if the file cannot be opened.
    bool load(const std::string& path);

    // Normalizes before inserting; empty phrases are ignored
    void add(std::string_view phrase);

    bool contains(std::string_view phrase) const {
        if (word_set_.empty()) return false;
        return word_set_.count(std::string(phrase)) > 0;
    }

    size_t size() const { return word_set_.size(); }

    // Longest entry, in codepoints
    size_t max_word_length() const { return max_word_length_; }

private:
    robin_hood::unordered_flat_set<std::string> word_set_;
    size_t max_word_length_;
};

} // namespace thai
