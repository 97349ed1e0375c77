#pragma once

#include <QString>

enum class DocumentKind {
    Unknown,
    Pdf,
    Epub
};

bool isBionicInputExt(const QString &extLower);

// Sniffs the file header first (%PDF-, EPUB zip with a leading mimetype
// entry), then falls back to the extension.
DocumentKind detectDocumentKind(const QString &path);

QString documentKindName(DocumentKind kind);

// <outDir>/bionic_<fileName>
QString makeOutputPath(const QString &outDir,
                       const QString &fileName);
