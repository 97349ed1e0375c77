#include "HtmlBionicInjector.hpp"

#include <QDebug>
#include <QDomDocumentFragment>
#include <QDomText>
#include <QList>
#include <QRegularExpression>
#include <QSet>
#include <QStringList>

#include <utility>
#include <vector>

#include "WordSplitter.hpp"

namespace bionic {
    namespace {
        // A whitespace-delimited token. When emphasized is false the token did
        // not match prefix/core/suffix and is carried verbatim in prefix.
        struct WordPiece {
            QString prefix;
            QString bold;
            QString tail;
            bool emphasized = false;
        };

        std::vector<WordPiece> SplitWords(const QString &text, const double ratio) {
            static const QRegularExpression SPACES(QStringLiteral(R"(\s+)"),
                                                   QRegularExpression::UseUnicodePropertiesOption);
            static const QRegularExpression WORD(QStringLiteral(R"(^(\W*)(\w+)(\W*)$)"),
                                                 QRegularExpression::UseUnicodePropertiesOption);

            std::vector<WordPiece> pieces;
            for (const QString &token: text.split(SPACES, Qt::SkipEmptyParts)) {
                const QRegularExpressionMatch match = WORD.match(token);
                if (!match.hasMatch()) {
                    pieces.push_back({token, {}, {}, false});
                    continue;
                }

                // Count in code points, not UTF-16 units.
                const QList<uint> core = match.captured(2).toUcs4();
                const auto n = static_cast<qsizetype>(BoldCount(static_cast<std::size_t>(core.size()), ratio));

                pieces.push_back({
                    match.captured(1),
                    QString::fromUcs4(reinterpret_cast<const char32_t *>(core.constData()), n),
                    QString::fromUcs4(reinterpret_cast<const char32_t *>(core.constData()) + n, core.size() - n)
                    + match.captured(3),
                    true
                });
            }
            return pieces;
        }

        void CollectTextNodes(const QDomNode &parent, const ProseClassifier &isProse, QList<QDomNode> &out) {
            for (QDomNode child = parent.firstChild(); !child.isNull(); child = child.nextSibling()) {
                if (child.nodeType() == QDomNode::TextNode) {
                    out.push_back(child);
                } else if (child.isElement() && isProse(child.toElement())) {
                    CollectTextNodes(child, isProse, out);
                }
            }
        }
    } // namespace

    bool IsXhtmlProseContainer(const QDomElement &element) {
        static const QSet<QString> NON_PROSE = {
            QStringLiteral("script"),
            QStringLiteral("style"),
            QStringLiteral("title"),
            QStringLiteral("head"),
            QStringLiteral("noscript"),
            QStringLiteral("template"),
            QStringLiteral("textarea"),
            QStringLiteral("strong"),
            QStringLiteral("b"),
        };

        // Local name, so "html:script" in prefixed XHTML is recognised too.
        const QString name = element.tagName().section(QLatin1Char(':'), -1).toLower();
        return !NON_PROSE.contains(name);
    }

    HtmlBionicInjector::HtmlBionicInjector(const double ratio, ProseClassifier isProse, QString emphasisTag)
        : ratio_(ratio)
          , isProse_(std::move(isProse))
          , emphasisTag_(std::move(emphasisTag)) {
        if (!isProse_)
            isProse_ = IsXhtmlProseContainer;
    }

    int HtmlBionicInjector::Inject(QDomNode root) const {
        if (root.isNull())
            return 0;
        if (root.isElement() && !isProse_(root.toElement()))
            return 0;

        // Collect first: replacing a node while walking its siblings would
        // invalidate the walk.
        QList<QDomNode> textNodes;
        CollectTextNodes(root, isProse_, textNodes);

        int rewritten = 0;
        for (QDomNode &node: textNodes) {
            if (RewriteTextNode(node))
                ++rewritten;
        }
        return rewritten;
    }

    int HtmlBionicInjector::Inject(QDomDocument &document) const {
        return Inject(document.documentElement());
    }

    bool HtmlBionicInjector::RewriteTextNode(QDomNode &node) const {
        const QString text = node.nodeValue();
        if (text.trimmed().isEmpty())
            return false;

        QDomNode parent = node.parentNode();
        if (parent.isNull())
            return false;

        QDomDocument document = node.ownerDocument();
        QDomDocumentFragment fragment = document.createDocumentFragment();

        // Tokens are re-joined with single spaces; a node that started or ended
        // with whitespace keeps one space there so inline neighbours stay apart.
        QString pending;
        if (text.front().isSpace())
            pending += QLatin1Char(' ');

        const std::vector<WordPiece> pieces = SplitWords(text, ratio_);
        for (std::size_t i = 0; i < pieces.size(); ++i) {
            const WordPiece &piece = pieces[i];
            if (i > 0)
                pending += QLatin1Char(' ');

            pending += piece.prefix;
            if (!piece.emphasized)
                continue;

            if (!pending.isEmpty()) {
                fragment.appendChild(document.createTextNode(pending));
                pending.clear();
            }

            QDomElement emphasis = document.createElement(emphasisTag_);
            emphasis.appendChild(document.createTextNode(piece.bold));
            fragment.appendChild(emphasis);

            pending += piece.tail;
        }

        if (text.back().isSpace())
            pending += QLatin1Char(' ');
        if (!pending.isEmpty())
            fragment.appendChild(document.createTextNode(pending));

        parent.replaceChild(fragment, node);
        return true;
    }

    std::optional<QByteArray> HtmlBionicInjector::Apply(const QByteArray &markup, QString *errorMessage) const {
        QDomDocument document;
        QString error;
        int line = 0;
        int column = 0;

        if (!document.setContent(markup, false, &error, &line, &column)) {
            if (errorMessage)
                *errorMessage = QStringLiteral("%1 (line %2, column %3)").arg(error).arg(line).arg(column);
            return std::nullopt;
        }

        const int rewritten = Inject(document);
        qDebug() << "Emphasized" << rewritten << "text node(s)";

        return document.toByteArray(-1);
    }

    QString HtmlBionicInjector::FormatTextAsMarkup(const QString &text) const {
        if (text.trimmed().isEmpty())
            return text.toHtmlEscaped();

        const QString open = QLatin1Char('<') + emphasisTag_ + QLatin1Char('>');
        const QString close = QStringLiteral("</") + emphasisTag_ + QLatin1Char('>');

        QStringList words;
        for (const WordPiece &piece: SplitWords(text, ratio_)) {
            if (!piece.emphasized) {
                words << piece.prefix.toHtmlEscaped();
                continue;
            }
            words << piece.prefix.toHtmlEscaped() + open + piece.bold.toHtmlEscaped() + close
                    + piece.tail.toHtmlEscaped();
        }
        return words.join(QLatin1Char(' '));
    }
} // namespace bionic
