#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <unicode/uversion.h>

U_NAMESPACE_BEGIN
class BreakIterator;
U_NAMESPACE_END

namespace thai {

// NFC, strip zero-width joiners / variation selectors, trim.
std::string normalize(std::string_view text);

// Word-boundary capability. Implementations return the pieces of `text`
// in order; concatenated they must reproduce `text`.
class WordBreaker {
public:
    virtual ~WordBreaker() = default;
    virtual std::vector<std::string> segment_words(std::string_view text, std::string_view locale) const = 0;
};

// ICU dictionary-based word breaker
class IcuWordBreaker : public WordBreaker {
public:
    // Throws std::runtime_error if ICU cannot create a word iterator for "th"
    IcuWordBreaker();
    ~IcuWordBreaker() override;

    IcuWordBreaker(const IcuWordBreaker&) = delete;
    IcuWordBreaker& operator=(const IcuWordBreaker&) = delete;

    std::vector<std::string> segment_words(std::string_view text, std::string_view locale) const override;

private:
    std::unique_ptr<icu::BreakIterator> thai_prototype_;
};

// Baseline tokenization over an injected word breaker
class Tokenizer {
public:
    explicit Tokenizer(const WordBreaker& breaker, std::string locale = "th");

    // Non-empty tokens that concatenate to `normalized`. Never throws.
    std::vector<std::string> tokenize(std::string_view normalized) const;

private:
    const WordBreaker& breaker_;
    std::string locale_;
};

} // namespace thai
