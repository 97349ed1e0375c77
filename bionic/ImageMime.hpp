#pragma once
//
// ImageMime.hpp
// -----------------------------------------------------------------------------
// Image type detection: sniff magic numbers first, fall back to the file
// extension. Used to keep already-compressed images stored (not deflated)
// when rewriting an EPUB, and to pass JPEG streams through when copying PDF
// images.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace bionic {
    enum class ImageMime {
        Unknown,
        Jpeg,
        Png,
        Gif,
        Svg,
        Webp,
        Bmp,
    };

    [[nodiscard]] inline const char *ImageMimeType(const ImageMime mime) noexcept {
        switch (mime) {
            case ImageMime::Jpeg: return "image/jpeg";
            case ImageMime::Png: return "image/png";
            case ImageMime::Gif: return "image/gif";
            case ImageMime::Svg: return "image/svg+xml";
            case ImageMime::Webp: return "image/webp";
            case ImageMime::Bmp: return "image/bmp";
            case ImageMime::Unknown: break;
        }
        return "application/octet-stream";
    }

    // Raster formats that are already entropy-coded; deflating them again is wasted work.
    [[nodiscard]] inline bool IsCompressedRaster(const ImageMime mime) noexcept {
        return mime == ImageMime::Jpeg || mime == ImageMime::Png ||
               mime == ImageMime::Gif || mime == ImageMime::Webp;
    }

    [[nodiscard]] inline ImageMime SniffImageMime(const std::uint8_t *data, const std::size_t size) noexcept {
        if (!data)
            return ImageMime::Unknown;

        const auto startsWith = [data, size](const char *magic, const std::size_t n, const std::size_t at = 0) {
            return size >= at + n && std::memcmp(data + at, magic, n) == 0;
        };

        if (startsWith("\xFF\xD8\xFF", 3))
            return ImageMime::Jpeg;
        if (startsWith("\x89PNG\r\n\x1A\n", 8))
            return ImageMime::Png;
        if (startsWith("GIF87a", 6) || startsWith("GIF89a", 6))
            return ImageMime::Gif;
        if (startsWith("RIFF", 4) && startsWith("WEBP", 4, 8))
            return ImageMime::Webp;
        if (startsWith("BM", 2))
            return ImageMime::Bmp;

        // SVG is text: look for the root element near the top, after any XML prolog.
        const std::string_view head(reinterpret_cast<const char *>(data), std::min<std::size_t>(size, 512));
        if (head.find("<svg") != std::string_view::npos)
            return ImageMime::Svg;

        return ImageMime::Unknown;
    }

    [[nodiscard]] inline ImageMime ImageMimeFromExtension(const std::string_view name) {
        const std::size_t dot = name.rfind('.');
        if (dot == std::string_view::npos)
            return ImageMime::Unknown;

        std::string ext(name.substr(dot + 1));
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

        struct Entry {
            std::string_view ext;
            ImageMime mime;
        };
        static constexpr std::array<Entry, 8> TABLE{{
            {"jpg", ImageMime::Jpeg},
            {"jpeg", ImageMime::Jpeg},
            {"jpe", ImageMime::Jpeg},
            {"png", ImageMime::Png},
            {"gif", ImageMime::Gif},
            {"svg", ImageMime::Svg},
            {"webp", ImageMime::Webp},
            {"bmp", ImageMime::Bmp},
        }};

        for (const auto &[e, mime]: TABLE) {
            if (e == ext)
                return mime;
        }
        return ImageMime::Unknown;
    }

    [[nodiscard]] inline ImageMime DetectImageMime(const std::uint8_t *data, const std::size_t size,
                                                   const std::string_view name = {}) {
        if (const ImageMime sniffed = SniffImageMime(data, size); sniffed != ImageMime::Unknown)
            return sniffed;
        return ImageMimeFromExtension(name);
    }
} // namespace bionic
