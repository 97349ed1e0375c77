#pragma once
//
// LayoutModel.hpp
// -----------------------------------------------------------------------------
// What the bionic engine needs from a document/rendering backend, and nothing
// more. A backend (PDFium in this application) fills a PageContent, measures
// text, supplies image resources and draws onto a destination page.
//
// Coordinates are whatever the backend uses (PDF user space for PDFium);
// the engine only adds widths to x positions and never converts units.
// -----------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ImageMime.hpp"

namespace bionic {
    struct Rect {
        double left = 0.0;
        double bottom = 0.0;
        double right = 0.0;
        double top = 0.0;

        [[nodiscard]] double Width() const noexcept { return right - left; }
        [[nodiscard]] double Height() const noexcept { return top - bottom; }
    };

    // A maximal run of text sharing one font/size/color. origin is the
    // baseline anchor of the first glyph, not a corner of bbox.
    struct TextSpan {
        std::u32string text;
        double originX = 0.0;
        double originY = 0.0;
        std::string fontName;
        double fontSize = 0.0;
        std::uint32_t color = 0x000000; // 0xRRGGBB
        Rect bbox;
    };

    struct TextLine {
        std::vector<TextSpan> spans;
        Rect bbox;
    };

    struct TextBlock {
        std::vector<TextLine> lines;
        Rect bbox;
    };

    // id is backend-defined (PDFium: page object index).
    struct ImageBlock {
        Rect bbox;
        int id = -1;
    };

    using ContentBlock = std::variant<TextBlock, ImageBlock>;

    struct PageContent {
        double width = 0.0;
        double height = 0.0;
        std::vector<ContentBlock> blocks;
    };

    // An image as handed from source to destination. Either an encoded stream
    // the destination can embed as-is (encoded + mime), or decoded 32-bit BGRA
    // pixels (bgra + width/height/stride), or both.
    struct ImageResource {
        ImageMime mime = ImageMime::Unknown;
        std::vector<std::uint8_t> encoded;

        int width = 0;
        int height = 0;
        int stride = 0;
        std::vector<std::uint8_t> bgra;

        [[nodiscard]] bool HasPixels() const noexcept {
            return width > 0 && height > 0 && stride >= width * 4 &&
                   bgra.size() >= static_cast<std::size_t>(stride) * static_cast<std::size_t>(height);
        }
    };

    struct FontPair {
        std::string regular = "Helvetica";
        std::string bold = "Helvetica-Bold";
    };

    // Advance width of text in fontName at fontSize, in page units.
    // nullopt when the backend cannot measure it.
    class GlyphMetrics {
    public:
        virtual ~GlyphMetrics() = default;

        [[nodiscard]] virtual std::optional<double> Measure(std::u32string_view text,
                                                            const std::string &fontName,
                                                            double fontSize) = 0;
    };

    class ImageProvider {
    public:
        virtual ~ImageProvider() = default;

        // Zero or more resources attached to block, in backend order.
        [[nodiscard]] virtual std::vector<ImageResource> ImagesFor(const ImageBlock &block) = 0;
    };

    // Destination page. Returning false means the run/image was not placed.
    class PageCanvas {
    public:
        virtual ~PageCanvas() = default;

        virtual bool DrawText(double x, double y, std::u32string_view text,
                              const std::string &fontName, double fontSize,
                              std::uint32_t color) = 0;

        virtual bool DrawImage(const Rect &bbox, const ImageResource &image) = 0;
    };
} // namespace bionic
