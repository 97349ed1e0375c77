#pragma once
//
// TextRunFormatter.hpp
// -----------------------------------------------------------------------------
// Split a run of text on ASCII spaces and emphasis-split every token.
//
// Every token except the last gets one ' ' appended to its regular part, so
// concatenating bold + regular over the result reproduces the input exactly,
// including runs of several spaces (they show up as empty tokens).
// -----------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "WordSplitter.hpp"

namespace bionic {
    [[nodiscard]] inline std::vector<std::u32string_view> SplitOnSpaces(const std::u32string_view text) {
        std::vector<std::u32string_view> tokens;
        std::size_t start = 0;
        for (;;) {
            const std::size_t pos = text.find(U' ', start);
            if (pos == std::u32string_view::npos) {
                tokens.push_back(text.substr(start));
                return tokens;
            }
            tokens.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
    }

    [[nodiscard]] inline std::vector<EmphasisSplit> FormatRun(const std::u32string_view text, const double ratio) {
        const std::vector<std::u32string_view> tokens = SplitOnSpaces(text);

        std::vector<EmphasisSplit> out;
        out.reserve(tokens.size());

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            EmphasisSplit split = SplitWord(tokens[i], ratio);
            if (i + 1 < tokens.size())
                split.regular.push_back(U' ');
            out.push_back(std::move(split));
        }
        return out;
    }

    // UTF-8 convenience overload for the unit tests.
    [[nodiscard]] inline std::vector<std::pair<std::string, std::string> >
    FormatRun(const std::string &utf8Text, const double ratio) {
        const std::u32string wide = text::Utf8ToU32(utf8Text);

        std::vector<std::pair<std::string, std::string> > out;
        for (const EmphasisSplit &split: FormatRun(std::u32string_view(wide), ratio))
            out.emplace_back(text::U32ToUtf8(split.bold), text::U32ToUtf8(split.regular));
        return out;
    }

    // Inverse of FormatRun(): concatenation of every bold + regular part.
    [[nodiscard]] inline std::u32string JoinRun(const std::vector<EmphasisSplit> &run) {
        std::u32string out;
        for (const auto &[bold, regular]: run) {
            out += bold;
            out += regular;
        }
        return out;
    }
} // namespace bionic
