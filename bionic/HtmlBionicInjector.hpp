#pragma once
//
// HtmlBionicInjector.hpp
// -----------------------------------------------------------------------------
// Reflowable bionic output: rewrites the text nodes of an (X)HTML tree so the
// bold prefix of every word sits in an inline emphasis element. No geometry;
// the markup renderer owns the flow.
//
// Runs after any pass that rewrites image sources. Attributes and non-text
// nodes are never touched.
// -----------------------------------------------------------------------------

#include <QByteArray>
#include <QDomDocument>
#include <QDomElement>
#include <QDomNode>
#include <QString>

#include <functional>
#include <optional>

namespace bionic {
    // true when text inside element is rendered prose and may be emphasized.
    using ProseClassifier = std::function<bool(const QDomElement &)>;

    // Default classification for XHTML/HTML: script, style, title, head,
    // noscript, template, textarea are not prose; neither are existing
    // strong/b elements, so a second pass does not nest emphasis.
    [[nodiscard]] bool IsXhtmlProseContainer(const QDomElement &element);

    class HtmlBionicInjector {
    public:
        explicit HtmlBionicInjector(double ratio,
                                    ProseClassifier isProse = IsXhtmlProseContainer,
                                    QString emphasisTag = QStringLiteral("strong"));

        // Rewrites every qualifying text node below root. Returns the number of
        // text nodes replaced.
        int Inject(QDomNode root) const;

        int Inject(QDomDocument &document) const;

        // Parse, inject, serialize. nullopt (with errorMessage set) when the
        // markup is not well-formed.
        [[nodiscard]] std::optional<QByteArray> Apply(const QByteArray &markup,
                                                      QString *errorMessage = nullptr) const;

        // Emphasis markup for one text node: "<strong>rea</strong>ding" etc.
        // Exposed mainly for previews and tests; Inject() builds DOM nodes directly.
        [[nodiscard]] QString FormatTextAsMarkup(const QString &text) const;

    private:
        bool RewriteTextNode(QDomNode &node) const;

        double ratio_;
        ProseClassifier isProse_;
        QString emphasisTag_;
    };
} // namespace bionic
