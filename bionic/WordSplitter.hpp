#pragma once
//
// WordSplitter.hpp
// -----------------------------------------------------------------------------
// Bionic emphasis split of a single word.
//
//   "(test)"  -> bold "(te", regular "st)"
//   "reading" -> bold "rea", regular "ding"   (ratio 0.5)
//
// A word is decomposed into leading punctuation, an alphanumeric core and
// trailing punctuation. Only the core is measured; punctuation rides along on
// the side it was found, so bold + regular always reconstructs the word.
// -----------------------------------------------------------------------------

#include <QChar>

#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "Ligatures.hpp"
#include "TextCodec.hpp"

namespace bionic {
    struct EmphasisSplit {
        std::u32string bold;
        std::u32string regular;

        bool operator==(const EmphasisSplit &other) const {
            return bold == other.bold && regular == other.regular;
        }
    };

    namespace text {
        // Letters and digits of any script. Everything else (punctuation,
        // whitespace, symbols, un-normalized ligature glyphs) is "punctuation".
        // Ligature presentation forms are category Ll, so Qt alone would
        // call them letters.
        [[nodiscard]] inline bool IsAlphanumeric(const char32_t ch) noexcept {
            return !IsLigature(ch) && QChar::isLetterOrNumber(ch);
        }

        [[nodiscard]] inline bool IsAllWhitespace(const std::u32string_view s) noexcept {
            for (const char32_t ch: s) {
                if (!QChar::isSpace(ch))
                    return false;
            }
            return true;
        }
    } // namespace text

    // Number of core characters to embolden.
    //   n <= 2      -> 1
    //   3 <= n <= 5 -> 2
    //   n >= 6      -> max(1, floor(n * ratio)), never more than n
    [[nodiscard]] inline std::size_t BoldCount(const std::size_t coreLength, const double ratio) noexcept {
        if (coreLength == 0)
            return 0;
        if (coreLength <= 2)
            return 1;
        if (coreLength <= 5)
            return 2;

        // NaN and negative ratios fall through to the minimum.
        const double scaled = std::floor(static_cast<double>(coreLength) * ratio);
        if (!(scaled >= 1.0))
            return 1;
        if (scaled >= static_cast<double>(coreLength))
            return coreLength;
        return static_cast<std::size_t>(scaled);
    }

    [[nodiscard]] inline EmphasisSplit SplitWord(const std::u32string_view word, const double ratio) {
        if (word.empty() || text::IsAllWhitespace(word))
            return {std::u32string(word), {}};

        // Exterior whitespace is not alphanumeric, so it lands in the
        // punctuation runs and is handed back untouched.
        std::size_t begin = 0;
        while (begin < word.size() && !text::IsAlphanumeric(word[begin]))
            ++begin;

        std::size_t end = word.size();
        while (end > begin && !text::IsAlphanumeric(word[end - 1]))
            --end;

        if (begin == end)
            return {std::u32string(word), {}};

        const std::size_t cut = begin + BoldCount(end - begin, ratio);
        return {std::u32string(word.substr(0, cut)), std::u32string(word.substr(cut))};
    }

    // UTF-8 convenience overload for the unit tests; the engine itself
    // stays on UTF-32.
    [[nodiscard]] inline std::pair<std::string, std::string> SplitWord(const std::string &utf8Word, const double ratio) {
        const EmphasisSplit split = SplitWord(text::Utf8ToU32(utf8Word), ratio);
        return {text::U32ToUtf8(split.bold), text::U32ToUtf8(split.regular)};
    }
} // namespace bionic
