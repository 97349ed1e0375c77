#pragma once
//
// PdfiumBackend.hpp
// -----------------------------------------------------------------------------
// PDFium implementation of the bionic layout contract:
//   - ExtractPageContent(): page objects -> blocks / lines / spans / images
//   - PdfiumImageProvider : image resources of a source page
//   - StandardFonts       : standard-14 fonts loaded into a destination doc
//   - PdfiumGlyphMetrics  : advance widths from PDFium font metrics
//   - PdfiumPageCanvas    : text/image objects inserted into a destination page
//
// Every call into PDFium holds PdfiumLibrary's mutex; none of these functions
// call each other while holding it.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fpdfview.h"
#include "fpdf_edit.h"
#include "fpdf_text.h"

#include "PdfiumHelper.hpp"
#include "../bionic/ImageMime.hpp"
#include "../bionic/LayoutModel.hpp"
#include "../bionic/TextCodec.hpp"

namespace pdfium {
    namespace detail {
        inline bionic::Rect ObjectBounds(FPDF_PAGEOBJECT obj) {
            float left = 0, bottom = 0, right = 0, top = 0;
            if (!FPDFPageObj_GetBounds(obj, &left, &bottom, &right, &top))
                return {};
            return {left, bottom, right, top};
        }

        inline void Unite(bionic::Rect &into, const bionic::Rect &r, const bool first) {
            if (first) {
                into = r;
                return;
            }
            into.left = std::min(into.left, r.left);
            into.bottom = std::min(into.bottom, r.bottom);
            into.right = std::max(into.right, r.right);
            into.top = std::max(into.top, r.top);
        }

        inline std::u32string TextObjectText(FPDF_PAGEOBJECT obj, FPDF_TEXTPAGE textPage) {
            // First call returns the required size in bytes, including the NUL.
            const unsigned long bytes = FPDFTextObj_GetText(obj, textPage, nullptr, 0);
            if (bytes <= 2)
                return {};

            std::u16string buffer(bytes / sizeof(char16_t), u'\0');
            FPDFTextObj_GetText(obj, textPage,
                                reinterpret_cast<FPDF_WCHAR *>(buffer.data()),
                                static_cast<unsigned long>(buffer.size() * sizeof(char16_t)));

            while (!buffer.empty() && buffer.back() == u'\0')
                buffer.pop_back();

            return bionic::text::Utf16ToU32(buffer);
        }

        inline std::string FontName(FPDF_PAGEOBJECT obj) {
            FPDF_FONT font = FPDFTextObj_GetFont(obj);
            if (!font)
                return {};

            const size_t len = FPDFFont_GetBaseFontName(font, nullptr, 0);
            if (len <= 1)
                return {};

            std::string name(len, '\0');
            FPDFFont_GetBaseFontName(font, name.data(), len);
            name.resize(len - 1);
            return name;
        }

        inline std::optional<bionic::TextSpan> TextObjectSpan(FPDF_PAGEOBJECT obj, FPDF_TEXTPAGE textPage) {
            bionic::TextSpan span;
            span.text = TextObjectText(obj, textPage);
            if (span.text.empty())
                return std::nullopt;

            FS_MATRIX m{};
            if (!FPDFPageObj_GetMatrix(obj, &m))
                return std::nullopt;

            float size = 0.0f;
            if (!FPDFTextObj_GetFontSize(obj, &size))
                return std::nullopt;

            // Tf size scaled by the vertical scale of the text matrix.
            const double scale = std::hypot(static_cast<double>(m.c), static_cast<double>(m.d));
            span.fontSize = size * (scale > 0.0 ? scale : 1.0);
            span.originX = m.e;
            span.originY = m.f;
            span.fontName = FontName(obj);
            span.bbox = ObjectBounds(obj);

            unsigned int r = 0, g = 0, b = 0, a = 0;
            if (FPDFPageObj_GetFillColor(obj, &r, &g, &b, &a))
                span.color = ((r & 0xFF) << 16) | ((g & 0xFF) << 8) | (b & 0xFF);

            return span;
        }

        // Converts any PDFium bitmap format into tightly described BGRA.
        inline bool CopyBitmap(FPDF_BITMAP bitmap, bionic::ImageResource &out) {
            const int width = FPDFBitmap_GetWidth(bitmap);
            const int height = FPDFBitmap_GetHeight(bitmap);
            const int stride = FPDFBitmap_GetStride(bitmap);
            const auto *src = static_cast<const std::uint8_t *>(FPDFBitmap_GetBuffer(bitmap));
            if (width <= 0 || height <= 0 || !src)
                return false;

            int bpp = 0;
            switch (FPDFBitmap_GetFormat(bitmap)) {
                case FPDFBitmap_Gray: bpp = 1; break;
                case FPDFBitmap_BGR: bpp = 3; break;
                case FPDFBitmap_BGRx:
                case FPDFBitmap_BGRA: bpp = 4; break;
                default: return false;
            }

            const bool opaque = FPDFBitmap_GetFormat(bitmap) != FPDFBitmap_BGRA;

            out.width = width;
            out.height = height;
            out.stride = width * 4;
            out.bgra.assign(static_cast<std::size_t>(out.stride) * height, 0);

            for (int y = 0; y < height; ++y) {
                const std::uint8_t *row = src + static_cast<std::size_t>(y) * stride;
                std::uint8_t *dst = out.bgra.data() + static_cast<std::size_t>(y) * out.stride;
                for (int x = 0; x < width; ++x, dst += 4) {
                    const std::uint8_t *px = row + static_cast<std::size_t>(x) * bpp;
                    if (bpp == 1) {
                        dst[0] = dst[1] = dst[2] = px[0];
                        dst[3] = 0xFF;
                    } else {
                        dst[0] = px[0];
                        dst[1] = px[1];
                        dst[2] = px[2];
                        dst[3] = opaque ? 0xFF : px[3];
                    }
                }
            }
            return true;
        }

        // A sole DCTDecode filter means the raw stream is a complete JPEG file.
        inline bool IsPlainJpeg(FPDF_PAGEOBJECT image) {
            if (FPDFImageObj_GetImageFilterCount(image) != 1)
                return false;

            char name[32] = {};
            const unsigned long len = FPDFImageObj_GetImageFilter(image, 0, name, sizeof(name));
            return len > 0 && len <= sizeof(name) && std::strcmp(name, "DCTDecode") == 0;
        }
    } // namespace detail

    // Reads one source page into the engine's layout model. Consecutive text
    // objects sharing a baseline form a line; consecutive lines form a block;
    // an image object closes the current text block.
    inline bionic::PageContent ExtractPageContent(FPDF_PAGE page) {
        bionic::PageContent content;
        if (!page)
            return content;

        auto &lib = PdfiumLibrary::Instance();
        std::lock_guard lock(lib.Mutex());

        content.width = FPDF_GetPageWidth(page);
        content.height = FPDF_GetPageHeight(page);

        FPDF_TEXTPAGE textPage = FPDFText_LoadPage(page);

        bionic::TextBlock block;
        auto flushBlock = [&content, &block]() {
            if (!block.lines.empty())
                content.blocks.emplace_back(std::move(block));
            block = bionic::TextBlock{};
        };

        const int count = FPDFPage_CountObjects(page);
        for (int i = 0; i < count; ++i) {
            FPDF_PAGEOBJECT obj = FPDFPage_GetObject(page, i);
            if (!obj)
                continue;

            const int type = FPDFPageObj_GetType(obj);

            if (type == FPDF_PAGEOBJ_IMAGE) {
                flushBlock();
                content.blocks.emplace_back(bionic::ImageBlock{detail::ObjectBounds(obj), i});
                continue;
            }

            if (type != FPDF_PAGEOBJ_TEXT || !textPage)
                continue;

            std::optional<bionic::TextSpan> span = detail::TextObjectSpan(obj, textPage);
            if (!span)
                continue;

            const double tolerance = 0.2 * span->fontSize;
            const bool sameLine = !block.lines.empty() &&
                                  !block.lines.back().spans.empty() &&
                                  std::fabs(block.lines.back().spans.back().originY - span->originY) <= tolerance;

            if (!sameLine)
                block.lines.emplace_back();

            bionic::TextLine &line = block.lines.back();
            detail::Unite(line.bbox, span->bbox, line.spans.empty());
            detail::Unite(block.bbox, span->bbox, block.lines.size() == 1 && line.spans.empty());
            line.spans.push_back(std::move(*span));
        }
        flushBlock();

        if (textPage)
            FPDFText_ClosePage(textPage);

        return content;
    }

    class PdfiumImageProvider final : public bionic::ImageProvider {
    public:
        PdfiumImageProvider(FPDF_DOCUMENT doc, FPDF_PAGE page)
            : doc_(doc)
              , page_(page) {
        }

        std::vector<bionic::ImageResource> ImagesFor(const bionic::ImageBlock &block) override {
            std::vector<bionic::ImageResource> resources;

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            FPDF_PAGEOBJECT obj = FPDFPage_GetObject(page_, block.id);
            if (!obj || FPDFPageObj_GetType(obj) != FPDF_PAGEOBJ_IMAGE)
                return resources;

            bionic::ImageResource resource;

            if (detail::IsPlainJpeg(obj)) {
                if (const unsigned long len = FPDFImageObj_GetImageDataRaw(obj, nullptr, 0); len > 0) {
                    resource.encoded.resize(len);
                    FPDFImageObj_GetImageDataRaw(obj, resource.encoded.data(), len);
                    resource.mime = bionic::SniffImageMime(resource.encoded.data(), resource.encoded.size());
                    if (resource.mime != bionic::ImageMime::Jpeg)
                        resource.encoded.clear();
                }
            }

            // Rendered bitmap applies masks and colour spaces; always keep it
            // as the fallback representation.
            if (FPDF_BITMAP bitmap = FPDFImageObj_GetRenderedBitmap(doc_, page_, obj)) {
                detail::CopyBitmap(bitmap, resource);
                FPDFBitmap_Destroy(bitmap);
            }

            if (!resource.encoded.empty() || resource.HasPixels())
                resources.push_back(std::move(resource));

            return resources;
        }

    private:
        FPDF_DOCUMENT doc_;
        FPDF_PAGE page_;
    };

    // Standard-14 fonts loaded into one destination document, by base name.
    class StandardFonts {
    public:
        explicit StandardFonts(FPDF_DOCUMENT doc)
            : doc_(doc) {
        }

        ~StandardFonts() {
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());
            for (auto &[name, font]: fonts_) {
                if (font)
                    FPDFFont_Close(font);
            }
        }

        StandardFonts(const StandardFonts &) = delete;

        StandardFonts &operator=(const StandardFonts &) = delete;

        [[nodiscard]] FPDF_DOCUMENT Document() const noexcept { return doc_; }

        // Caller must hold PdfiumLibrary's mutex. nullptr if the name is not
        // a standard font.
        FPDF_FONT GetLocked(const std::string &name) {
            if (const auto it = fonts_.find(name); it != fonts_.end())
                return it->second;

            FPDF_FONT font = FPDFText_LoadStandardFont(doc_, name.c_str());
            fonts_.emplace(name, font);
            return font;
        }

    private:
        FPDF_DOCUMENT doc_;
        std::map<std::string, FPDF_FONT> fonts_;
    };

    class PdfiumGlyphMetrics final : public bionic::GlyphMetrics {
    public:
        explicit PdfiumGlyphMetrics(StandardFonts &fonts)
            : fonts_(fonts) {
        }

        std::optional<double> Measure(const std::u32string_view text,
                                      const std::string &fontName,
                                      const double fontSize) override {
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            FPDF_FONT font = fonts_.GetLocked(fontName);
            if (!font)
                return std::nullopt;

            double total = 0.0;
            for (const char32_t ch: text) {
                float width = 0.0f;
                if (!FPDFFont_GetGlyphWidth(font, static_cast<uint32_t>(ch), static_cast<float>(fontSize), &width))
                    return std::nullopt;
                total += width;
            }
            return total;
        }

    private:
        StandardFonts &fonts_;
    };

    class PdfiumPageCanvas final : public bionic::PageCanvas {
    public:
        PdfiumPageCanvas(StandardFonts &fonts, FPDF_PAGE page)
            : fonts_(fonts)
              , page_(page) {
        }

        bool DrawText(const double x, const double y, const std::u32string_view text,
                      const std::string &fontName, const double fontSize,
                      const std::uint32_t color) override {
            const std::u16string wide = bionic::text::U32ToUtf16(text);

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            FPDF_FONT font = fonts_.GetLocked(fontName);
            if (!font)
                return false;

            FPDF_PAGEOBJECT obj = FPDFPageObj_CreateTextObj(fonts_.Document(), font, static_cast<float>(fontSize));
            if (!obj)
                return false;

            if (!FPDFText_SetText(obj, reinterpret_cast<FPDF_WIDESTRING>(wide.c_str()))) {
                FPDFPageObj_Destroy(obj);
                return false;
            }

            FPDFPageObj_SetFillColor(obj, (color >> 16) & 0xFF, (color >> 8) & 0xFF, color & 0xFF, 255);
            FPDFPageObj_Transform(obj, 1, 0, 0, 1, x, y);
            FPDFPage_InsertObject(page_, obj);
            return true;
        }

        bool DrawImage(const bionic::Rect &bbox, const bionic::ImageResource &image) override {
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            FPDF_PAGEOBJECT obj = FPDFPageObj_NewImageObj(fonts_.Document());
            if (!obj)
                return false;

            bool loaded = false;
            if (image.mime == bionic::ImageMime::Jpeg && !image.encoded.empty())
                loaded = LoadJpeg(obj, image.encoded);

            if (!loaded && image.HasPixels()) {
                FPDF_BITMAP bitmap = FPDFBitmap_CreateEx(image.width, image.height, FPDFBitmap_BGRA,
                                                         const_cast<std::uint8_t *>(image.bgra.data()),
                                                         image.stride);
                if (bitmap) {
                    loaded = FPDFImageObj_SetBitmap(&page_, 1, obj, bitmap);
                    FPDFBitmap_Destroy(bitmap);
                }
            }

            if (!loaded) {
                FPDFPageObj_Destroy(obj);
                return false;
            }

            // Image space is the unit square; scale it onto the bbox.
            FPDFImageObj_SetMatrix(obj, bbox.Width(), 0, 0, bbox.Height(), bbox.left, bbox.bottom);
            FPDFPage_InsertObject(page_, obj);
            return true;
        }

    private:
        bool LoadJpeg(FPDF_PAGEOBJECT obj, const std::vector<std::uint8_t> &jpeg) {
            FPDF_FILEACCESS access{};
            access.m_FileLen = static_cast<unsigned long>(jpeg.size());
            access.m_Param = const_cast<std::vector<std::uint8_t> *>(&jpeg);
            access.m_GetBlock = [](void *param, const unsigned long position,
                                   unsigned char *buf, const unsigned long size) -> int {
                const auto *data = static_cast<const std::vector<std::uint8_t> *>(param);
                if (position + size < position || position + size > data->size())
                    return 0;
                std::memcpy(buf, data->data() + position, size);
                return 1;
            };
            // Inline: the stream is read now, so access may go out of scope.
            return FPDFImageObj_LoadJpegFileInline(&page_, 1, obj, &access);
        }

        StandardFonts &fonts_;
        FPDF_PAGE page_;
    };
} // namespace pdfium
