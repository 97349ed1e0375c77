#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE text_run_formatter

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include "TextRunFormatter.hpp"

namespace {
    std::string join(const std::vector<std::pair<std::string, std::string> > &run) {
        std::string out;
        for (const auto &[bold, regular]: run)
            out += bold + regular;
        return out;
    }
}

BOOST_AUTO_TEST_SUITE(format_run)

BOOST_AUTO_TEST_CASE(quick_brown_fox) {
    const auto run = bionic::FormatRun(std::string("The quick brown fox"), 0.5);

    BOOST_TEST_REQUIRE(run.size() == 4u);
    BOOST_TEST(run[0].first == "Th");
    BOOST_TEST(run[0].second == "e ");
    BOOST_TEST(run[1].first == "qu");
    BOOST_TEST(run[1].second == "ick ");
    BOOST_TEST(run[2].first == "br");
    BOOST_TEST(run[2].second == "own ");
    BOOST_TEST(run[3].first == "fo");
    BOOST_TEST(run[3].second == "x");

    BOOST_TEST(join(run) == "The quick brown fox");
}

static const std::vector<std::string>
reconstruct_dataset = {
    "The quick brown fox",
    "",
    " ",
    "single",
    "two  spaces",
    " leading and trailing ",
    "tab\tinside token",
    "punctuation, (brackets) and -- dashes...",
    "Ünïcödé wörds ånd 日本語 テキスト",
    "line\nbreak"
};

BOOST_DATA_TEST_CASE(
    reconstructs_exactly_, data::make(reconstruct_dataset), text) {
    for (const double ratio: {0.0, 0.5, 0.7}) {
        BOOST_TEST(join(bionic::FormatRun(text, ratio)) == text);
    }
}

BOOST_AUTO_TEST_CASE(double_space_is_empty_token) {
    const auto run = bionic::FormatRun(std::string("a  b"), 0.5);

    BOOST_TEST_REQUIRE(run.size() == 3u);
    BOOST_TEST(run[1].first == "");
    BOOST_TEST(run[1].second == " ");
}

BOOST_AUTO_TEST_CASE(tab_is_not_a_separator) {
    const auto run = bionic::FormatRun(std::string("a\tb"), 0.5);
    BOOST_TEST(run.size() == 1u);
}

BOOST_AUTO_TEST_CASE(last_token_has_no_trailing_space) {
    const auto run = bionic::FormatRun(std::string("one two"), 0.5);

    BOOST_TEST_REQUIRE(run.size() == 2u);
    BOOST_TEST(run.back().second == "o");
}

BOOST_AUTO_TEST_CASE(join_run_) {
    const std::u32string text = U"bionic reading  works";
    BOOST_TEST((bionic::JoinRun(bionic::FormatRun(std::u32string_view(text), 0.5)) == text));
}

BOOST_AUTO_TEST_CASE(split_on_spaces_) {
    const auto tokens = bionic::SplitOnSpaces(U" a ");

    BOOST_TEST_REQUIRE(tokens.size() == 3u);
    BOOST_TEST(tokens[0].empty());
    BOOST_TEST((tokens[1] == U"a"));
    BOOST_TEST(tokens[2].empty());
}

BOOST_AUTO_TEST_SUITE_END()
