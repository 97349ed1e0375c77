#include "filetype_utils.h"

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <unordered_set>
#include <string>

namespace {

    inline const std::unordered_set<std::string> BIONIC_INPUT_EXTENSIONS = {
        "pdf", "epub"
    };

    constexpr qint64 PDF_HEADER_WINDOW = 1024;

    // Local file header of the first entry: "PK\3\4", name at offset 30.
    // EPUB requires that entry to be the uncompressed "mimetype".
    bool looksLikeEpub(const QByteArray &head) {
        if (!head.startsWith(QByteArrayLiteral("PK\x03\x04")))
            return false;
        return head.mid(30, 8) == QByteArrayLiteral("mimetype") &&
               head.indexOf(QByteArrayLiteral("application/epub+zip")) >= 0;
    }

} // anonymous namespace (internal constants only)

bool isBionicInputExt(const QString &extLower)
{
    return BIONIC_INPUT_EXTENSIONS.count(extLower.toStdString()) != 0;
}

DocumentKind detectDocumentKind(const QString &path)
{
    if (QFile f(path); f.open(QIODevice::ReadOnly)) {
        const QByteArray head = f.read(PDF_HEADER_WINDOW);
        // Some producers put junk before the header; readers accept it.
        if (head.indexOf(QByteArrayLiteral("%PDF-")) >= 0)
            return DocumentKind::Pdf;
        if (looksLikeEpub(head))
            return DocumentKind::Epub;
    }

    const QString extLower = QFileInfo(path).suffix().toLower();
    if (extLower == QLatin1String("pdf"))
        return DocumentKind::Pdf;
    if (extLower == QLatin1String("epub"))
        return DocumentKind::Epub;
    return DocumentKind::Unknown;
}

QString documentKindName(const DocumentKind kind)
{
    switch (kind) {
        case DocumentKind::Pdf: return QStringLiteral("PDF");
        case DocumentKind::Epub: return QStringLiteral("EPUB");
        default: return QStringLiteral("unknown");
    }
}

QString makeOutputPath(const QString &outDir,
                       const QString &fileName)
{
    return QDir(outDir).filePath(QStringLiteral("bionic_") + fileName);
}
