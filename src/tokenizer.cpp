#include "tokenizer.hpp"
#include "constants.hpp"
#include <iostream>
#include <stdexcept>
#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

namespace thai {

static icu::UnicodeString to_unicode_string(std::string_view text) {
    return icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

static std::string compose_nfc(std::string_view text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        std::cerr << "Warning: NFC normalizer unavailable: " << u_errorName(status) << std::endl;
        return std::string(text);
    }

    icu::UnicodeString src = to_unicode_string(text);
    if (nfc->isNormalized(src, status) && U_SUCCESS(status)) {
        return std::string(text);
    }

    status = U_ZERO_ERROR;
    icu::UnicodeString composed = nfc->normalize(src, status);
    if (U_FAILURE(status)) {
        std::cerr << "Warning: NFC normalization failed: " << u_errorName(status) << std::endl;
        return std::string(text);
    }

    std::string out;
    composed.toUTF8String(out);
    return out;
}

std::string normalize(std::string_view text) {
    if (text.empty()) return {};

    std::u32string cps = to_u32(compose_nfc(text));

    size_t begin = 0;
    size_t end = cps.size();
    while (begin < end && (is_trim_space(cps[begin]) || is_invisible_mark(cps[begin]))) ++begin;
    while (end > begin && (is_trim_space(cps[end - 1]) || is_invisible_mark(cps[end - 1]))) --end;

    std::string out;
    out.reserve((end - begin) * 3);
    for (size_t i = begin; i < end; ++i) {
        if (is_invisible_mark(cps[i])) continue;
        append_utf8(out, cps[i]);
    }
    return out;
}

// ---------------------------------------------------------------------------
// IcuWordBreaker
// ---------------------------------------------------------------------------

static std::unique_ptr<icu::BreakIterator> create_word_iterator(std::string_view locale) {
    UErrorCode status = U_ZERO_ERROR;
    std::string name(locale);
    std::unique_ptr<icu::BreakIterator> it(
        icu::BreakIterator::createWordInstance(icu::Locale(name.c_str()), status));
    if (U_FAILURE(status) || !it) {
        throw std::runtime_error(std::string("ICU word iterator for '") + name + "': " + u_errorName(status));
    }
    return it;
}

IcuWordBreaker::IcuWordBreaker()
    : thai_prototype_(create_word_iterator("th"))
{
}

IcuWordBreaker::~IcuWordBreaker() = default;

std::vector<std::string> IcuWordBreaker::segment_words(std::string_view text, std::string_view locale) const {
    std::unique_ptr<icu::BreakIterator> it;
    if (locale == "th") {
        // Clones share the loaded rules and dictionary
        it.reset(thai_prototype_->clone());
        if (!it) throw std::runtime_error("ICU word iterator clone failed");
    } else {
        it = create_word_iterator(locale);
    }

    icu::UnicodeString ustr = to_unicode_string(text);
    it->setText(ustr);

    std::vector<std::string> words;
    int32_t start = it->first();
    for (int32_t end = it->next(); end != icu::BreakIterator::DONE; start = end, end = it->next()) {
        std::string word;
        ustr.tempSubStringBetween(start, end).toUTF8String(word);
        words.push_back(std::move(word));
    }
    return words;
}

// ---------------------------------------------------------------------------
// Tokenizer
// ---------------------------------------------------------------------------

Tokenizer::Tokenizer(const WordBreaker& breaker, std::string locale)
    : breaker_(breaker), locale_(std::move(locale))
{
}

std::vector<std::string> Tokenizer::tokenize(std::string_view normalized) const {
    if (normalized.empty()) return {};

    std::vector<std::string> words;
    try {
        words = breaker_.segment_words(normalized, locale_);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Word breaking failed, keeping line whole: " << e.what() << std::endl;
        return {std::string(normalized)};
    }

    std::vector<std::string> tokens;
    tokens.reserve(words.size());
    size_t covered = 0;
    for (auto& w : words) {
        if (w.empty()) continue;
        covered += w.size();
        tokens.push_back(std::move(w));
    }

    // The breaker must partition the text exactly
    bool exact = covered == normalized.size();
    if (exact) {
        size_t pos = 0;
        for (const auto& t : tokens) {
            if (normalized.compare(pos, t.size(), t) != 0) { exact = false; break; }
            pos += t.size();
        }
    }
    if (!exact) {
        std::cerr << "Warning: Word breaker output does not cover input, keeping line whole" << std::endl;
        return {std::string(normalized)};
    }
    return tokens;
}

} // namespace thai
