#include "dictionary.hpp"
#include "constants.hpp"
#include "tokenizer.hpp"
#include <fstream>
#include <iostream>

namespace thai {

Dictionary::Dictionary() : max_word_length_(0) {
}

bool Dictionary::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open dictionary file: " << path << std::endl;
        return false;
    }

    size_t before = word_set_.size();
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        add(line);
    }

    std::cout << "Loaded " << (word_set_.size() - before) << " phrases. Max length: "
              << max_word_length_ << std::endl;
    return true;
}

void Dictionary::add(std::string_view phrase) {
    std::string clean = normalize(phrase);
    if (clean.empty()) return;

    size_t len = codepoint_length(clean);
    if (len > max_word_length_) max_word_length_ = len;
    word_set_.insert(std::move(clean));
}

} // namespace thai
