#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE pdfium_roundtrip

#include <atomic>
#include <cmath>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "PdfBionic.hpp"

namespace {
    struct SourceText {
        double x;
        double y;
        std::u32string text;
    };

    // Builds a one-page Letter-size PDF with Helvetica 12 text objects and
    // optionally a small opaque image.
    std::vector<std::uint8_t> makePdf(const std::vector<SourceText> &texts, const bool withImage = false) {
        pdfium::Document doc = pdfium::Document::CreateNew();
        const pdfium::Page page = pdfium::Page::CreateNew(doc.Get(), 0, 612, 792);
        {
            pdfium::StandardFonts fonts(doc.Get());
            pdfium::PdfiumPageCanvas canvas(fonts, page.Get());

            for (const SourceText &t: texts)
                BOOST_TEST_REQUIRE(canvas.DrawText(t.x, t.y, t.text, "Helvetica", 12, 0x000000));

            if (withImage) {
                bionic::ImageResource image;
                image.width = 2;
                image.height = 2;
                image.stride = 8;
                image.bgra.assign(16, 0x80);
                BOOST_TEST_REQUIRE(canvas.DrawImage({100, 100, 200, 200}, image));
            }
        }
        page.GenerateContent();
        return doc.SaveToBytes();
    }

    bionic::PageContent firstPage(const std::vector<std::uint8_t> &pdf) {
        const pdfium::Document doc{std::vector<std::uint8_t>(pdf)};
        const pdfium::Page page(doc.Get(), 0);
        return pdfium::ExtractPageContent(page.Get());
    }

    std::u32string withoutSpaces(const std::u32string &s) {
        std::u32string out;
        for (const char32_t c: s) {
            if (c != U' ')
                out += c;
        }
        return out;
    }
}

BOOST_AUTO_TEST_SUITE(extract)

BOOST_AUTO_TEST_CASE(lines_by_baseline) {
    const bionic::PageContent content = firstPage(makePdf({
        {72, 700, U"First"},
        {120, 700.5, U"line"},
        {72, 680, U"Second"},
    }));

    BOOST_TEST(std::fabs(content.width - 612) < 0.01);
    BOOST_TEST(std::fabs(content.height - 792) < 0.01);
    BOOST_TEST_REQUIRE(content.blocks.size() == 1u);

    const auto *block = std::get_if<bionic::TextBlock>(&content.blocks.front());
    BOOST_TEST_REQUIRE(block != nullptr);
    BOOST_TEST_REQUIRE(block->lines.size() == 2u);
    BOOST_TEST(block->lines[0].spans.size() == 2u);
    BOOST_TEST(block->lines[1].spans.size() == 1u);

    const bionic::TextSpan &span = block->lines[0].spans[0];
    BOOST_TEST((withoutSpaces(span.text) == U"First"));
    BOOST_TEST(std::fabs(span.originX - 72) < 0.01);
    BOOST_TEST(std::fabs(span.originY - 700) < 0.01);
    BOOST_TEST(std::fabs(span.fontSize - 12) < 0.01);
    BOOST_TEST(span.fontName == "Helvetica");
}

BOOST_AUTO_TEST_CASE(image_closes_block) {
    const bionic::PageContent content = firstPage(makePdf({{72, 700, U"Caption"}}, true));

    BOOST_TEST_REQUIRE(content.blocks.size() == 2u);
    BOOST_TEST(std::holds_alternative<bionic::TextBlock>(content.blocks[0]));

    const auto *image = std::get_if<bionic::ImageBlock>(&content.blocks[1]);
    BOOST_TEST_REQUIRE(image != nullptr);
    BOOST_TEST(std::fabs(image->bbox.left - 100) < 0.5);
    BOOST_TEST(std::fabs(image->bbox.top - 200) < 0.5);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(convert)

BOOST_AUTO_TEST_CASE(words_split_into_styled_objects) {
    const pdfium::BytesResult result = pdfium::ConvertToBionic(makePdf({{72, 700, U"Hello bionic world"}}));
    BOOST_TEST_REQUIRE(result.success, result.message);
    BOOST_TEST(!result.cancelled);
    BOOST_TEST(result.pagesConverted == 1);
    BOOST_TEST(result.report.tokens == 3u);
    BOOST_TEST(result.report.fallbacks == 0u);

    const bionic::PageContent content = firstPage(result.outputBytes);
    BOOST_TEST(std::fabs(content.width - 612) < 0.01);
    BOOST_TEST(std::fabs(content.height - 792) < 0.01);
    BOOST_TEST_REQUIRE(content.blocks.size() == 1u);

    const auto &block = std::get<bionic::TextBlock>(content.blocks.front());
    BOOST_TEST_REQUIRE(block.lines.size() == 1u);

    const std::vector<bionic::TextSpan> &spans = block.lines.front().spans;
    BOOST_TEST_REQUIRE(spans.size() == 6u);

    BOOST_TEST((withoutSpaces(spans[0].text) == U"He"));
    BOOST_TEST((withoutSpaces(spans[1].text) == U"llo"));
    BOOST_TEST((withoutSpaces(spans[2].text) == U"bio"));
    BOOST_TEST(spans[0].fontName == "Helvetica-Bold");
    BOOST_TEST(spans[1].fontName == "Helvetica");

    BOOST_TEST(std::fabs(spans[0].originX - 72) < 0.01);
    for (std::size_t i = 1; i < spans.size(); ++i) {
        BOOST_TEST(spans[i].originX > spans[i - 1].originX);
        BOOST_TEST(std::fabs(spans[i].originY - 700) < 0.01);
    }
}

BOOST_AUTO_TEST_CASE(images_copied) {
    const pdfium::BytesResult result = pdfium::ConvertToBionic(makePdf({{72, 700, U"Caption"}}, true));
    BOOST_TEST_REQUIRE(result.success, result.message);
    BOOST_TEST(result.report.imagesCopied == 1u);
    BOOST_TEST(result.report.imagesSkipped == 0u);

    const bionic::PageContent content = firstPage(result.outputBytes);
    BOOST_TEST_REQUIRE(content.blocks.size() == 2u);
    BOOST_TEST(std::holds_alternative<bionic::ImageBlock>(content.blocks[1]));
}

BOOST_AUTO_TEST_CASE(images_not_copied_when_disabled) {
    pdfium::ConversionOptions options;
    options.copyImages = false;

    const pdfium::BytesResult result = pdfium::ConvertToBionic(makePdf({{72, 700, U"Caption"}}, true), options);
    BOOST_TEST_REQUIRE(result.success, result.message);
    BOOST_TEST(result.report.imagesCopied == 0u);

    const bionic::PageContent content = firstPage(result.outputBytes);
    BOOST_TEST(content.blocks.size() == 1u);
}

BOOST_AUTO_TEST_CASE(unknown_font_falls_back) {
    pdfium::ConversionOptions options;
    options.fonts.bold = "NoSuchFont-Bold";

    const pdfium::BytesResult result = pdfium::ConvertToBionic(makePdf({{72, 700, U"Hello world"}}), options);
    BOOST_TEST_REQUIRE(result.success, result.message);
    BOOST_TEST(result.report.fallbacks == 2u);

    const bionic::PageContent content = firstPage(result.outputBytes);
    const auto &spans = std::get<bionic::TextBlock>(content.blocks.front()).lines.front().spans;
    BOOST_TEST_REQUIRE(spans.size() == 2u);
    BOOST_TEST((withoutSpaces(spans[0].text) == U"Hello"));
    BOOST_TEST(spans[0].fontName == "Helvetica");
}

BOOST_AUTO_TEST_CASE(progress_reported) {
    std::vector<int> percents;
    const pdfium::BytesResult result = pdfium::ConvertToBionic(
        makePdf({{72, 700, U"Progress"}}), {},
        [&percents](const int pageIndex, const int pageCount, const int percent, const std::string &bar) {
            BOOST_TEST(pageIndex == 0);
            BOOST_TEST(pageCount == 1);
            BOOST_TEST(bar == pdfium::BuildProgressBar(percent));
            percents.push_back(percent);
        });

    BOOST_TEST_REQUIRE(result.success, result.message);
    BOOST_TEST_REQUIRE(percents.size() == 1u);
    BOOST_TEST(percents.front() == 100);
}

BOOST_AUTO_TEST_CASE(cancelled_before_first_page) {
    const std::atomic<bool> cancel{true};
    const pdfium::BytesResult result = pdfium::ConvertToBionic(makePdf({{72, 700, U"Stop"}}), {}, nullptr, &cancel);

    BOOST_TEST(!result.success);
    BOOST_TEST(result.cancelled);
    BOOST_TEST(result.pagesConverted == 0);
    BOOST_TEST(result.outputBytes.empty());
}

BOOST_AUTO_TEST_CASE(garbage_input) {
    const pdfium::BytesResult result = pdfium::ConvertToBionic({'n', 'o', 't', ' ', 'a', ' ', 'p', 'd', 'f'});
    BOOST_TEST(!result.success);
    BOOST_TEST(!result.cancelled);
    BOOST_TEST(!result.message.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(options)

BOOST_AUTO_TEST_CASE(clamp_ratio) {
    BOOST_TEST(pdfium::ClampRatio(0.3) == 0.3);
    BOOST_TEST(pdfium::ClampRatio(-1.0) == pdfium::kMinRatio);
    BOOST_TEST(pdfium::ClampRatio(2.0) == pdfium::kMaxRatio);
    BOOST_TEST(pdfium::ClampRatio(std::nan("")) == 0.5);
}

BOOST_AUTO_TEST_CASE(progress_bar) {
    const std::string green = "\xF0\x9F\x9F\xA9";
    const std::string white = "\xE2\xAC\x9C";

    BOOST_TEST(pdfium::BuildProgressBar(0, 4) == white + white + white + white);
    BOOST_TEST(pdfium::BuildProgressBar(50, 4) == green + green + white + white);
    BOOST_TEST(pdfium::BuildProgressBar(150, 2) == green + green);
    BOOST_TEST(pdfium::BuildProgressBar(-5, 1) == white);
}

BOOST_AUTO_TEST_SUITE_END()
