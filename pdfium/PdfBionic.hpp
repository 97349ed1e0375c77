#pragma once
//
// PdfBionic.hpp
// -----------------------------------------------------------------------------
// PDF -> bionic PDF conversion driver.
//
//   source bytes -> Document -> per page: ExtractPageContent
//                                         -> LayoutReplayer::ReplayPage
//                                         -> destination page, GenerateContent
//                -> SaveToBytes
// -----------------------------------------------------------------------------

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "PdfiumHelper.hpp"
#include "PdfiumBackend.hpp"
#include "../bionic/LayoutReplayer.hpp"

namespace pdfium {
    struct ConversionOptions {
        double ratio = 0.5;
        bionic::FontPair fonts{};
        bool copyImages = true;
    };

    // Accepted ratio domain for callers; the engine itself is total.
    constexpr double kMinRatio = 0.0;
    constexpr double kMaxRatio = 0.7;

    inline double ClampRatio(const double ratio) noexcept {
        if (std::isnan(ratio))
            return ConversionOptions{}.ratio;
        return std::clamp(ratio, kMinRatio, kMaxRatio);
    }

    // Emoji progress bar:
    // 🟩 = U+1F7E9 = F0 9F 9F A9
    // ⬜ = U+2B1C  = E2 AC 9C
    inline std::string BuildProgressBar(int percent, const int width = 10) {
        if (percent < 0) percent = 0;
        if (percent > 100) percent = 100;

        const int filled = (percent * width) / 100;

        static constexpr auto GREEN = "\xF0\x9F\x9F\xA9";
        static constexpr auto WHITE = "\xE2\xAC\x9C";

        std::string bar;
        bar.reserve(width * 4);

        for (int i = 0; i < filled; ++i)
            bar += GREEN;
        for (int i = filled; i < width; ++i)
            bar += WHITE;

        return bar;
    }

    // Progress callback:
    //   pageIndex  : 0-based page index
    //   pageCount  : total pages
    //   percent    : completion percentage (0..100)
    //   bar        : emoji progress bar (🟩⬜⬜...)
    using ProgressCallback =
    std::function<void(int pageIndex,
                       int pageCount,
                       int percent,
                       const std::string &bar)>;

    struct BytesResult {
        bool success;
        std::string message;
        std::vector<std::uint8_t> outputBytes; // valid if success==true
        bool cancelled = false;
        bionic::ReplayReport report{};
        int pagesConverted = 0;
    };

    namespace detail {
        inline bionic::ReplayReport ConvertPage(Document &source, Document &target, const int index,
                                                bionic::LayoutReplayer &replayer,
                                                StandardFonts &fonts) {
            const Page sourcePage(source.Get(), index);
            const bionic::PageContent content = ExtractPageContent(sourcePage.Get());

            const Page targetPage = Page::CreateNew(target.Get(), index, content.width, content.height);

            PdfiumImageProvider images(source.Get(), sourcePage.Get());
            PdfiumPageCanvas canvas(fonts, targetPage.Get());

            bionic::ReplayReport report = replayer.ReplayPage(content, images, canvas);
            targetPage.GenerateContent();
            return report;
        }
    } // namespace detail

    // Converts a whole PDF held in memory. Document-level failures (load,
    // create, save) come back as success=false; per-token and per-image
    // failures are recovered inside the replayer and only counted.
    //
    // cancelFlag is checked between pages. A cancelled conversion returns
    // success=false, cancelled=true and no bytes.
    inline BytesResult ConvertToBionic(std::vector<std::uint8_t> inputBytes,
                                       const ConversionOptions &options = {},
                                       const ProgressCallback &progress = nullptr,
                                       const std::atomic<bool> *cancelFlag = nullptr) {
        try {
            // Ensure library is initialized
            (void) PdfiumLibrary::Instance();

            Document source(std::move(inputBytes));
            const int pageCount = source.GetPageCount();
            if (pageCount <= 0)
                return {false, "PDF has no pages"};

            Document target = Document::CreateNew();

            BytesResult result{true, {}};
            {
                // Fonts must be released before the target document closes.
                StandardFonts fonts(target.Get());
                PdfiumGlyphMetrics metrics(fonts);

                bionic::LayoutReplayer::Options replayOptions;
                replayOptions.ratio = ClampRatio(options.ratio);
                replayOptions.fonts = options.fonts;
                replayOptions.copyImages = options.copyImages;
                bionic::LayoutReplayer replayer(metrics, replayOptions);

                for (int i = 0; i < pageCount; ++i) {
                    if (cancelFlag && cancelFlag->load(std::memory_order_relaxed)) {
                        result.success = false;
                        result.cancelled = true;
                        result.message = "Cancelled after " + std::to_string(i) + " of " +
                                         std::to_string(pageCount) + " page(s)";
                        return result;
                    }

                    result.report += detail::ConvertPage(source, target, i, replayer, fonts);
                    ++result.pagesConverted;

                    if (progress) {
                        const int percent =
                                static_cast<int>((static_cast<double>(i + 1) /
                                                  static_cast<double>(pageCount)) * 100.0);
                        progress(i, pageCount, percent, BuildProgressBar(percent));
                    }
                }
            }

            result.outputBytes = target.SaveToBytes();
            result.message = std::to_string(result.pagesConverted) + " page(s), " +
                             std::to_string(result.report.tokens) + " word(s), " +
                             std::to_string(result.report.fallbacks) + " fallback(s), " +
                             std::to_string(result.report.imagesCopied) + " image(s) copied, " +
                             std::to_string(result.report.imagesSkipped) + " skipped";
            return result;
        } catch (const std::exception &ex) {
            return {false, ex.what()};
        }
    }
} // namespace pdfium
