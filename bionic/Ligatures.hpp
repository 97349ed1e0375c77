#pragma once
//
// Ligatures.hpp
// -----------------------------------------------------------------------------
// Expand typographic ligature glyphs (U+FB00..U+FB06) into their letters.
//
// Must run before splitting/measuring on the paginated path: a ligature is a
// single glyph and cannot be drawn half bold, and the replayed runs are
// measured letter by letter in the substitute font.
// -----------------------------------------------------------------------------

#include <array>
#include <string>
#include <string_view>

#include "TextCodec.hpp"

namespace bionic {
    struct LigatureExpansion {
        char32_t glyph;
        std::u32string_view letters;
    };

    inline constexpr std::array<LigatureExpansion, 7> LIGATURES{{
        {U'ﬀ', U"ff"},
        {U'ﬁ', U"fi"},
        {U'ﬂ', U"fl"},
        {U'ﬃ', U"ffi"},
        {U'ﬄ', U"ffl"},
        {U'ﬅ', U"st"}, // long s + t
        {U'ﬆ', U"st"},
    }};

    [[nodiscard]] inline bool IsLigature(const char32_t ch) noexcept {
        return ch >= LIGATURES.front().glyph && ch <= LIGATURES.back().glyph;
    }

    [[nodiscard]] inline std::u32string NormalizeLigatures(const std::u32string_view s) {
        std::u32string out;
        out.reserve(s.size());

        for (const char32_t ch: s) {
            if (IsLigature(ch)) {
                out += LIGATURES[ch - LIGATURES.front().glyph].letters;
            } else {
                out.push_back(ch);
            }
        }
        return out;
    }

    [[nodiscard]] inline std::string NormalizeLigatures(const std::string &utf8) {
        return text::U32ToUtf8(NormalizeLigatures(text::Utf8ToU32(utf8)));
    }
} // namespace bionic
