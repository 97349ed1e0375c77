#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE word_splitter

#include <cmath>
#include <string>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include "WordSplitter.hpp"

BOOST_AUTO_TEST_SUITE(bold_count)

static const std::vector<std::tuple<std::size_t, double, std::size_t> >
bold_count_dataset = {
    {  0, 0.5,  0 },
    {  1, 0.5,  1 },
    {  2, 0.5,  1 },
    {  2, 0.0,  1 },
    {  3, 0.5,  2 },
    {  5, 0.5,  2 },
    {  5, 0.0,  2 },
    {  6, 0.5,  3 },
    {  7, 0.5,  3 },
    { 20, 0.25, 5 },
    {  6, 0.0,  1 },
    {  6, 0.1,  1 },
    {  6, 1.0,  6 },
    {  6, 2.5,  6 },
    {  8, -1.0, 1 }
};

BOOST_DATA_TEST_CASE(
    policy_, data::make(bold_count_dataset), n, ratio, expected) {
    BOOST_TEST(bionic::BoldCount(n, ratio) == expected);
}

BOOST_AUTO_TEST_CASE(never_zero_for_nonempty_core) {
    for (std::size_t n = 1; n < 40; ++n) {
        BOOST_TEST(bionic::BoldCount(n, 0.0) >= 1u);
        BOOST_TEST(bionic::BoldCount(n, 0.0) <= n);
    }
}

BOOST_AUTO_TEST_CASE(nan_ratio_is_total) {
    BOOST_TEST(bionic::BoldCount(9, std::nan("")) == 1u);
}

BOOST_AUTO_TEST_CASE(monotonic_in_ratio) {
    for (std::size_t n = 6; n < 30; ++n) {
        std::size_t previous = 0;
        for (int step = 0; step <= 100; ++step) {
            const std::size_t count = bionic::BoldCount(n, step / 100.0);
            BOOST_TEST(count >= previous);
            previous = count;
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(split_word)

static const std::vector<std::tuple<std::string, std::string, std::string> >
split_dataset = {
    { "reading", "rea", "ding" },
    { "it's", "it", "'s" },
    { "(test)", "(te", "st)" },
    { "I", "I", "" },
    { "to", "t", "o" },
    { "the", "th", "e" },
    { "quick,", "qu", "ick," },
    { "\"Hello!\"", "\"He", "llo!\"" },
    { "2024", "20", "24" },
    { "Ärger", "Är", "ger" },
    { "Überraschung", "Überra", "schung" },
    { "日本語", "日本", "語" },
    { "--", "--", "" },
    { "...", "...", "" },
    { "()", "()", "" },
    { "—", "—", "" },
    { "", "", "" },
    { "   ", "   ", "" },
    { " word ", " wo", "rd " }
};

BOOST_DATA_TEST_CASE(
    split_, data::make(split_dataset), word, bold, regular) {
    const auto [b, r] = bionic::SplitWord(word, 0.5);
    BOOST_TEST(b == bold);
    BOOST_TEST(r == regular);
}

static const std::vector<std::string>
lossless_dataset = {
    "reading", "it's", "(test)", "I", "", "   ", "--", "e.g.", "naïve",
    "“quoted”", "x86_64", "€100", "a-b-c", "ﬁrst", "\tword\t"
};

BOOST_DATA_TEST_CASE(
    lossless_, data::make(lossless_dataset), word) {
    for (const double ratio: {0.0, 0.3, 0.5, 0.7, 1.0}) {
        const auto [b, r] = bionic::SplitWord(word, ratio);
        BOOST_TEST(b + r == word);
    }
}

BOOST_AUTO_TEST_CASE(unnormalized_ligature_is_punctuation) {
    // U+FB01 is not a letter; the core starts after it.
    const auto [b, r] = bionic::SplitWord(std::string("\xEF\xAC\x81rst"), 0.5);
    BOOST_TEST(b == "\xEF\xAC\x81rs");
    BOOST_TEST(r == "t");
}

BOOST_AUTO_TEST_CASE(ligature_glyphs_not_alphanumeric) {
    for (char32_t ch = 0xFB00; ch <= 0xFB06; ++ch)
        BOOST_TEST(!bionic::text::IsAlphanumeric(ch), static_cast<unsigned>(ch));

    BOOST_TEST(bionic::text::IsAlphanumeric(U'a'));
    BOOST_TEST(bionic::text::IsAlphanumeric(U'\u00E9'));
    BOOST_TEST(bionic::text::IsAlphanumeric(U'7'));
}

BOOST_AUTO_TEST_CASE(trailing_ligature_is_punctuation) {
    const bionic::EmphasisSplit split = bionic::SplitWord(std::u32string_view(U"sta\uFB00"), 0.5);
    BOOST_TEST((split.bold == U"st"));
    BOOST_TEST((split.regular == U"a\uFB00"));
}

BOOST_AUTO_TEST_CASE(wide_overload_) {
    const bionic::EmphasisSplit split = bionic::SplitWord(std::u32string_view(U"reading"), 0.5);
    BOOST_TEST((split.bold == U"rea"));
    BOOST_TEST((split.regular == U"ding"));
}

BOOST_AUTO_TEST_SUITE_END()
