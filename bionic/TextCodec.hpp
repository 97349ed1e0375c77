#pragma once
//
// TextCodec.hpp
// -----------------------------------------------------------------------------
// UTF-8 / UTF-16LE / UTF-32 conversion helpers.
//
// The bionic engine works on UTF-32 so that "word length" means code points,
// not bytes. PDFium speaks UTF-16LE (FPDF_WIDESTRING); files and Qt speak
// UTF-8. Everything crosses into the engine through these helpers.
// -----------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bionic::text {
    inline void AppendUtf8(std::string &out, const char32_t ch) {
        const auto cp = static_cast<std::uint32_t>(ch);
        if (cp <= 0x7F) {
            out.push_back(static_cast<char>(cp));
        } else if (cp <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    // Malformed input (stray or missing continuation bytes, overlong forms,
    // surrogates, values past U+10FFFF) yields one U+FFFD per offending lead
    // byte; decoding resumes at the next byte.
    inline std::u32string Utf8ToU32(const std::string_view s) {
        std::u32string out;
        out.reserve(s.size());

        auto p = reinterpret_cast<const unsigned char *>(s.data());
        const unsigned char *end = p + s.size();

        while (p < end) {
            const unsigned char c = *p;
            if (c < 0x80) {
                out.push_back(static_cast<char32_t>(c));
                ++p;
                continue;
            }

            std::size_t len = 0;
            std::uint32_t ch = 0;
            std::uint32_t min = 0;
            if ((c >> 5) == 0x6) {
                // 110xxxxx
                len = 2;
                ch = c & 0x1F;
                min = 0x80;
            } else if ((c >> 4) == 0xE) {
                // 1110xxxx
                len = 3;
                ch = c & 0x0F;
                min = 0x800;
            } else if ((c >> 3) == 0x1E) {
                // 11110xxx
                len = 4;
                ch = c & 0x07;
                min = 0x10000;
            }

            bool valid = len != 0 && static_cast<std::size_t>(end - p) >= len;
            for (std::size_t k = 1; valid && k < len; ++k) {
                if ((p[k] & 0xC0) != 0x80)
                    valid = false;
                else
                    ch = (ch << 6) | (p[k] & 0x3F);
            }

            if (valid && (ch < min || ch > 0x10FFFF || (ch >= 0xD800 && ch <= 0xDFFF)))
                valid = false;

            if (!valid) {
                out.push_back(static_cast<char32_t>(0xFFFD));
                ++p;
                continue;
            }

            out.push_back(static_cast<char32_t>(ch));
            p += len;
        }

        return out;
    }

    inline std::string U32ToUtf8(const std::u32string_view s) {
        std::string out;
        out.reserve(s.size() * 3);
        for (const char32_t ch: s)
            AppendUtf8(out, ch);
        return out;
    }

    // UTF-16LE (as returned by PDFium) -> UTF-32. Unpaired surrogates become U+FFFD.
    inline std::u32string Utf16ToU32(const std::u16string_view src) {
        std::u32string out;
        out.reserve(src.size());

        for (std::size_t i = 0; i < src.size(); ++i) {
            if (const std::uint32_t ch = src[i]; ch >= 0xD800 && ch <= 0xDBFF) {
                if (i + 1 < src.size()) {
                    if (const std::uint32_t low = src[i + 1]; low >= 0xDC00 && low <= 0xDFFF) {
                        out.push_back(static_cast<char32_t>(
                            0x10000 + (((ch - 0xD800) << 10) | (low - 0xDC00))));
                        ++i;
                        continue;
                    }
                }
                out.push_back(U'\uFFFD');
            } else if (ch >= 0xDC00 && ch <= 0xDFFF) {
                out.push_back(U'\uFFFD');
            } else {
                out.push_back(static_cast<char32_t>(ch));
            }
        }

        return out;
    }

    // UTF-32 -> UTF-16LE; c_str() of the result is what FPDFText_SetText() expects.
    inline std::u16string U32ToUtf16(const std::u32string_view s) {
        std::u16string out;
        out.reserve(s.size());

        for (const char32_t ch: s) {
            if (const auto cp = static_cast<std::uint32_t>(ch); cp >= 0x10000) {
                const std::uint32_t v = cp - 0x10000;
                out.push_back(static_cast<char16_t>(0xD800 + (v >> 10)));
                out.push_back(static_cast<char16_t>(0xDC00 + (v & 0x3FF)));
            } else {
                out.push_back(static_cast<char16_t>(cp));
            }
        }
        return out;
    }
} // namespace bionic::text
