#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE text_codec

#include <string>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include "TextCodec.hpp"

BOOST_AUTO_TEST_SUITE(utf8_decode)

// Expected values are the UTF-8 re-encoding of the decoded code points.
#define REPL "\xEF\xBF\xBD"

static const std::vector<std::tuple<std::string, std::string> >
decode_dataset = {
    { "plain", "plain" },
    { "na\xC3\xAFve", "na\xC3\xAFve" },
    { "\xE2\x82\xAC" "100", "\xE2\x82\xAC" "100" },
    { "\xF0\x9F\x98\x80", "\xF0\x9F\x98\x80" },
    { "\xF4\x8F\xBF\xBF", "\xF4\x8F\xBF\xBF" },
    { "", "" },

    // truncated lead must not swallow the next character
    { "\xC3" "A|", REPL "A|" },
    { "ab\xE2\x82", "ab" REPL REPL },
    { "\xF0\x9F\x98" "x", REPL REPL REPL "x" },

    // stray continuation and invalid lead bytes
    { "\x80" "a", REPL "a" },
    { "\xFF", REPL },

    // overlong, surrogate and out-of-range encodings
    { "\xC0\xAF", REPL REPL },
    { "\xED\xA0\x80", REPL REPL REPL },
    { "\xF4\x90\x80\x80", REPL REPL REPL REPL }
};

BOOST_DATA_TEST_CASE(
    decode_, data::make(decode_dataset), input, expected) {
    BOOST_TEST(bionic::text::U32ToUtf8(bionic::text::Utf8ToU32(input)) == expected);
}

BOOST_AUTO_TEST_CASE(truncated_lead_keeps_next_char) {
    const std::u32string decoded = bionic::text::Utf8ToU32("\xC3" "A|");
    BOOST_TEST_REQUIRE(decoded.size() == 3u);
    BOOST_TEST(static_cast<unsigned>(decoded[0]) == 0xFFFDu);
    BOOST_TEST(static_cast<unsigned>(decoded[1]) == static_cast<unsigned>('A'));
    BOOST_TEST(static_cast<unsigned>(decoded[2]) == static_cast<unsigned>('|'));
}

BOOST_AUTO_TEST_CASE(valid_text_survives_encode) {
    const std::string text = "Bionic \xE2\x80\x94 \xC3\x9C" "ber \xF0\x9F\x93\x96";
    BOOST_TEST(bionic::text::U32ToUtf8(bionic::text::Utf8ToU32(text)) == text);
}

BOOST_AUTO_TEST_SUITE_END()
