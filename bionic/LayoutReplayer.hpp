#pragma once
//
// LayoutReplayer.hpp
// -----------------------------------------------------------------------------
// Paginated bionic output: replays extracted spans onto a new page as bold and
// regular runs, advancing a cursor by measured widths so every word starts
// where the previous one ended. Image blocks are copied through unchanged.
// -----------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "LayoutModel.hpp"

namespace bionic {
    enum class Emphasis {
        Bold,
        Regular,
    };

    // One placed run. Inter-word spaces are recorded with advanceOnly set:
    // they move the cursor but are never drawn.
    struct RunSegment {
        std::u32string text;
        Emphasis style = Emphasis::Regular;
        double x = 0.0;
        double width = 0.0;
        bool advanceOnly = false;
    };

    using FormattedRun = std::vector<RunSegment>;

    [[nodiscard]] double AdvanceOf(const FormattedRun &run) noexcept;

    struct ReplayReport {
        std::size_t spans = 0;
        std::size_t tokens = 0;
        std::size_t fallbacks = 0;
        std::size_t imagesCopied = 0;
        std::size_t imagesSkipped = 0;

        ReplayReport &operator+=(const ReplayReport &other) noexcept;
    };

    class LayoutReplayer {
    public:
        struct Options {
            double ratio = 0.5;
            FontPair fonts;
            bool copyImages = true;
        };

        explicit LayoutReplayer(GlyphMetrics &metrics);

        LayoutReplayer(GlyphMetrics &metrics, Options options);

        [[nodiscard]] const Options &GetOptions() const noexcept { return options_; }

        // Replays one span starting at its origin; returns what was placed.
        FormattedRun ReplaySpan(const TextSpan &span, PageCanvas &canvas, ReplayReport &report);

        ReplayReport ReplayLine(const TextLine &line, PageCanvas &canvas);

        ReplayReport ReplayPage(const PageContent &page, ImageProvider &images, PageCanvas &canvas);

    private:
        bool Place(std::u32string_view text, Emphasis style, const TextSpan &span,
                   double &cursor, PageCanvas &canvas, FormattedRun &run);

        void Fallback(std::u32string_view text, const TextSpan &span,
                      double cursor, PageCanvas &canvas, FormattedRun &run, ReplayReport &report);

        void CopyImage(const ImageBlock &block, ImageProvider &images, PageCanvas &canvas,
                       ReplayReport &report);

        [[nodiscard]] const std::string &FontFor(Emphasis style) const noexcept;

        GlyphMetrics &metrics_;
        Options options_;
    };
} // namespace bionic
