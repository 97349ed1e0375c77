#include "LayoutReplayer.hpp"

#include <QDebug>
#include <QString>

#include <utility>
#include <variant>

#include "Ligatures.hpp"
#include "TextRunFormatter.hpp"

namespace bionic {
    namespace {
        QString ToQString(const std::u32string_view s) {
            return QString::fromUcs4(s.data(), static_cast<qsizetype>(s.size()));
        }
    } // namespace

    double AdvanceOf(const FormattedRun &run) noexcept {
        double total = 0.0;
        for (const RunSegment &segment: run)
            total += segment.width;
        return total;
    }

    ReplayReport &ReplayReport::operator+=(const ReplayReport &other) noexcept {
        spans += other.spans;
        tokens += other.tokens;
        fallbacks += other.fallbacks;
        imagesCopied += other.imagesCopied;
        imagesSkipped += other.imagesSkipped;
        return *this;
    }

    LayoutReplayer::LayoutReplayer(GlyphMetrics &metrics)
        : LayoutReplayer(metrics, Options{}) {
    }

    LayoutReplayer::LayoutReplayer(GlyphMetrics &metrics, Options options)
        : metrics_(metrics)
          , options_(std::move(options)) {
    }

    const std::string &LayoutReplayer::FontFor(const Emphasis style) const noexcept {
        return style == Emphasis::Bold ? options_.fonts.bold : options_.fonts.regular;
    }

    FormattedRun LayoutReplayer::ReplaySpan(const TextSpan &span, PageCanvas &canvas, ReplayReport &report) {
        ++report.spans;

        FormattedRun run;
        const std::u32string text = NormalizeLigatures(span.text);
        const std::vector<EmphasisSplit> tokens = FormatRun(std::u32string_view(text), options_.ratio);

        double cursor = span.originX;

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const bool last = i + 1 == tokens.size();

            std::u32string_view bold = tokens[i].bold;
            std::u32string_view regular = tokens[i].regular;
            if (!last && !regular.empty() && regular.back() == U' ')
                regular.remove_suffix(1);

            if (!bold.empty() || !regular.empty())
                ++report.tokens;

            if (!bold.empty() && !Place(bold, Emphasis::Bold, span, cursor, canvas, run)) {
                std::u32string rest(bold);
                rest += regular;
                Fallback(rest, span, cursor, canvas, run, report);
            } else if (!regular.empty() && !Place(regular, Emphasis::Regular, span, cursor, canvas, run)) {
                Fallback(regular, span, cursor, canvas, run, report);
            }

            if (last)
                break;

            if (const auto space = metrics_.Measure(U" ", options_.fonts.regular, span.fontSize)) {
                run.push_back({U" ", Emphasis::Regular, cursor, *space, true});
                cursor += *space;
            } else {
                qWarning() << "Cannot measure inter-word space in" << QString::fromStdString(options_.fonts.regular)
                        << span.fontSize;
            }
        }

        return run;
    }

    bool LayoutReplayer::Place(const std::u32string_view text, const Emphasis style, const TextSpan &span,
                               double &cursor, PageCanvas &canvas, FormattedRun &run) {
        const std::string &font = FontFor(style);

        const auto width = metrics_.Measure(text, font, span.fontSize);
        if (!width)
            return false;

        if (!canvas.DrawText(cursor, span.originY, text, font, span.fontSize, span.color))
            return false;

        run.push_back({std::u32string(text), style, cursor, *width, false});
        cursor += *width;
        return true;
    }

    // Unstyled emission at the current cursor; the token does not advance it.
    void LayoutReplayer::Fallback(const std::u32string_view text, const TextSpan &span,
                                  const double cursor, PageCanvas &canvas, FormattedRun &run,
                                  ReplayReport &report) {
        ++report.fallbacks;
        qWarning() << "Styled emission failed, falling back to regular text:" << ToQString(text);

        if (!canvas.DrawText(cursor, span.originY, text, options_.fonts.regular, span.fontSize, span.color)) {
            qWarning() << "Regular fallback failed too, token dropped:" << ToQString(text);
            return;
        }
        run.push_back({std::u32string(text), Emphasis::Regular, cursor, 0.0, false});
    }

    ReplayReport LayoutReplayer::ReplayLine(const TextLine &line, PageCanvas &canvas) {
        ReplayReport report;
        for (const TextSpan &span: line.spans)
            (void) ReplaySpan(span, canvas, report);
        return report;
    }

    ReplayReport LayoutReplayer::ReplayPage(const PageContent &page, ImageProvider &images, PageCanvas &canvas) {
        ReplayReport report;

        for (const ContentBlock &block: page.blocks) {
            if (const auto *text = std::get_if<TextBlock>(&block)) {
                for (const TextLine &line: text->lines)
                    report += ReplayLine(line, canvas);
            } else if (const auto *image = std::get_if<ImageBlock>(&block)) {
                if (options_.copyImages)
                    CopyImage(*image, images, canvas, report);
            }
        }

        return report;
    }

    void LayoutReplayer::CopyImage(const ImageBlock &block, ImageProvider &images, PageCanvas &canvas,
                                   ReplayReport &report) {
        const std::vector<ImageResource> resources = images.ImagesFor(block);
        if (resources.empty()) {
            qWarning().nospace() << "No image resource for block " << block.id << " at ("
                    << block.bbox.left << ", " << block.bbox.bottom << ", "
                    << block.bbox.right << ", " << block.bbox.top << "), skipped";
            ++report.imagesSkipped;
            return;
        }

        // First resource wins; any others are ignored.
        if (!canvas.DrawImage(block.bbox, resources.front())) {
            qWarning() << "Could not copy image block" << block.id;
            ++report.imagesSkipped;
            return;
        }
        ++report.imagesCopied;
    }
} // namespace bionic
