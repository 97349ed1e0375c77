#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE html_injector

#include <optional>
#include <string>

#include <QByteArray>
#include <QDomDocument>
#include <QString>

#include <boost/test/unit_test.hpp>

#include "HtmlBionicInjector.hpp"

namespace {
    std::string apply(const bionic::HtmlBionicInjector &injector, const std::string &markup) {
        QString error;
        const std::optional<QByteArray> out = injector.Apply(QByteArray::fromStdString(markup), &error);
        BOOST_TEST_REQUIRE(out.has_value(), "parse failed: " << error.toStdString());
        return out->toStdString();
    }

    bool contains(const std::string &haystack, const std::string &needle) {
        return haystack.find(needle) != std::string::npos;
    }

    std::string markup(const bionic::HtmlBionicInjector &injector, const char *text) {
        return injector.FormatTextAsMarkup(QString::fromUtf8(text)).toStdString();
    }
}

BOOST_AUTO_TEST_SUITE(format_text)

BOOST_AUTO_TEST_CASE(words_get_bold_prefix) {
    const bionic::HtmlBionicInjector injector(0.5);
    BOOST_TEST(markup(injector, "reading is fun") ==
               "<strong>rea</strong>ding <strong>i</strong>s <strong>fu</strong>n");
}

BOOST_AUTO_TEST_CASE(punctuation_stays_outside) {
    const bionic::HtmlBionicInjector injector(0.5);
    BOOST_TEST(markup(injector, "(test), \"quoted!\"") ==
               "(<strong>te</strong>st), &quot;<strong>quo</strong>ted!&quot;");
}

BOOST_AUTO_TEST_CASE(unmatched_tokens_are_verbatim) {
    const bionic::HtmlBionicInjector injector(0.5);
    BOOST_TEST(markup(injector, "e.g. ... \xE2\x80\x94 it's") == "e.g. ... \xE2\x80\x94 it's");
}

BOOST_AUTO_TEST_CASE(text_is_escaped) {
    const bionic::HtmlBionicInjector injector(0.5);
    BOOST_TEST(markup(injector, "a<b & c") == "a&lt;b &amp; <strong>c</strong>");
}

BOOST_AUTO_TEST_CASE(generic_whitespace_collapses) {
    const bionic::HtmlBionicInjector injector(0.5);
    BOOST_TEST(markup(injector, "one\t\ttwo\nthree") ==
               "<strong>on</strong>e <strong>tw</strong>o <strong>th</strong>ree");
}

BOOST_AUTO_TEST_CASE(unicode_letters) {
    const bionic::HtmlBionicInjector injector(0.5);
    BOOST_TEST(markup(injector, "\xC3\x9C" "berraschung") == "<strong>\xC3\x9C" "berra</strong>schung");
}

BOOST_AUTO_TEST_CASE(custom_emphasis_tag) {
    const bionic::HtmlBionicInjector injector(0.5, bionic::IsXhtmlProseContainer, QStringLiteral("b"));
    BOOST_TEST(markup(injector, "bold") == "<b>bo</b>ld");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(inject)

BOOST_AUTO_TEST_CASE(rewrites_prose_only) {
    const bionic::HtmlBionicInjector injector(0.5);
    const std::string out = apply(injector,
        "<html xmlns=\"http://www.w3.org/1999/xhtml\">"
        "<head><title>Title words</title><style>p { color: red; }</style></head>"
        "<body><p class=\"lead\">Hello world</p>"
        "<script>var answer = 42;</script></body></html>");

    BOOST_TEST(contains(out, "<p class=\"lead\"><strong>He</strong>llo <strong>wo</strong>rld</p>"));
    BOOST_TEST(contains(out, "<title>Title words</title>"));
    BOOST_TEST(contains(out, "p { color: red; }"));
    BOOST_TEST(contains(out, "var answer = 42;"));
}

BOOST_AUTO_TEST_CASE(edge_whitespace_is_kept) {
    const bionic::HtmlBionicInjector injector(0.5);
    const std::string out = apply(injector, "<p>Hi <em>there</em> friend</p>");

    BOOST_TEST(contains(out, "<p><strong>H</strong>i <em><strong>th</strong>ere</em> <strong>fri</strong>end</p>"));
}

BOOST_AUTO_TEST_CASE(image_attributes_untouched) {
    const bionic::HtmlBionicInjector injector(0.5);
    const std::string out = apply(injector,
        "<div><img src=\"data:image/png;base64,AAAA\" alt=\"An image caption\"/>caption</div>");

    BOOST_TEST(contains(out, "src=\"data:image/png;base64,AAAA\""));
    BOOST_TEST(contains(out, "alt=\"An image caption\""));
    BOOST_TEST(contains(out, "<strong>cap</strong>tion"));
}

BOOST_AUTO_TEST_CASE(whitespace_nodes_are_skipped) {
    QDomDocument document;
    BOOST_TEST_REQUIRE(static_cast<bool>(document.setContent(QByteArray("<div>\n  <p>a</p>\n  <p>\t</p>\n</div>"))));

    const bionic::HtmlBionicInjector injector(0.5);
    BOOST_TEST(injector.Inject(document) == 1);
}

BOOST_AUTO_TEST_CASE(second_pass_does_not_nest) {
    const bionic::HtmlBionicInjector injector(0.5);
    const std::string once = apply(injector, "<p>bionic</p>");
    const std::string twice = apply(injector, once);

    BOOST_TEST(contains(twice, "<strong>bio</strong>"));
    BOOST_TEST(!contains(twice, "<strong><strong>"));
    BOOST_TEST(!contains(twice, "<strong>b</strong>io"));
}

BOOST_AUTO_TEST_CASE(custom_classifier) {
    const bionic::HtmlBionicInjector injector(0.5, [](const QDomElement &element) {
        return element.tagName() != QLatin1String("aside");
    });
    const std::string out = apply(injector, "<body><aside>note text</aside><p>body text</p></body>");

    BOOST_TEST(contains(out, "<aside>note text</aside>"));
    BOOST_TEST(contains(out, "<strong>bo</strong>dy"));
}

BOOST_AUTO_TEST_CASE(malformed_markup_is_reported) {
    const bionic::HtmlBionicInjector injector(0.5);
    QString error;
    const std::optional<QByteArray> out = injector.Apply(QByteArray("<p>unclosed <b>tags</p>"), &error);

    BOOST_TEST(!out.has_value());
    BOOST_TEST(!error.isEmpty());
}

BOOST_AUTO_TEST_CASE(null_root) {
    const bionic::HtmlBionicInjector injector(0.5);
    BOOST_TEST(injector.Inject(QDomNode()) == 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(prose_container)

BOOST_AUTO_TEST_CASE(default_classification) {
    QDomDocument document;
    for (const char *name: {"script", "style", "title", "head", "noscript", "template", "textarea",
                            "strong", "b", "html:script", "SCRIPT"}) {
        BOOST_TEST(!bionic::IsXhtmlProseContainer(document.createElement(QString::fromLatin1(name))), name);
    }
    for (const char *name: {"p", "div", "span", "em", "body", "h1", "li", "a"}) {
        BOOST_TEST(bionic::IsXhtmlProseContainer(document.createElement(QString::fromLatin1(name))), name);
    }
}

BOOST_AUTO_TEST_SUITE_END()
