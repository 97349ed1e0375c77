// BatchWorker.cpp
#include "batchworker.h"
#include "PdfBionicWorker.h"

#include <QFileInfo>
#include <QFile>

#include "filetype_utils.h"
#include "EpubBionicConverter.hpp"

BatchWorker::BatchWorker(const QStringList &files,
                         const QString &outDir,
                         const pdfium::ConversionOptions &options,
                         const bool overwrite,
                         QObject *parent)
    : QObject(parent),
      m_files(files),
      m_outDir(outDir),
      m_options(options),
      m_overwrite(overwrite),
      m_cancelRequested(false) {
    m_options.ratio = pdfium::ClampRatio(m_options.ratio);
}

void BatchWorker::requestCancel() {
    m_cancelRequested.storeRelaxed(true);
}

void BatchWorker::process() {
    const qsizetype total = m_files.size();
    if (total == 0) {
        emit finished(false);
        return;
    }

    if (const QDir dir(m_outDir); !dir.exists() && !dir.mkpath(".")) {
        emit error(QString("❌ Cannot create output directory: %1").arg(m_outDir));
        emit finished(false);
        return;
    }

    for (qsizetype i = 0; i < m_files.size(); ++i) {
        const qsizetype idx = i + 1;

        if (m_cancelRequested.loadRelaxed()) {
            emit log(QStringLiteral("Batch cancelled."));
            emit finished(true);
            return;
        }

        const QString path = m_files.at(i);
        if (QFileInfo fi(path); !fi.exists()) {
            emit log(QString("%1: %2 -> ❌ File not found.")
                .arg(idx)
                .arg(path));
            emit progress(static_cast<int>(idx),
                          static_cast<int>(total));

            continue;
        }

        try {
            processOneFile(static_cast<int>(idx), path);
        } catch (const std::exception &e) {
            emit error(QString("%1: %2 -> Error: %3")
                .arg(idx)
                .arg(path, QString::fromUtf8(e.what())));
        }

        emit progress(static_cast<int>(idx),
                      static_cast<int>(total));
    }

    emit finished(m_cancelRequested.loadRelaxed());
}

void BatchWorker::processOneFile(const int idx, const QString &path) {
    const QFileInfo fi(path);
    const QString outPath = makeOutputPath(m_outDir, fi.fileName());

    if (QFileInfo(outPath).absoluteFilePath() == fi.absoluteFilePath()) {
        emit log(QString("%1: %2 -> ❌ Skip: Output Path = Source Path.")
            .arg(idx)
            .arg(outPath));
        return;
    }

    if (!m_overwrite && QFileInfo::exists(outPath)) {
        emit log(QString("%1: %2 -> ❌ Skip: Output exists.")
            .arg(idx)
            .arg(outPath));
        return;
    }

    switch (detectDocumentKind(path)) {
        case DocumentKind::Pdf:
            processPdf(idx, path, outPath);
            return;
        case DocumentKind::Epub:
            processEpub(idx, path, outPath);
            return;
        default:
            emit log(QString("%1: %2 -> ❌ Skip: Unsupported file type.")
                .arg(idx)
                .arg(path));
            return;
    }
}

void BatchWorker::processPdf(const int idx,
                             const QString &path,
                             const QString &outPath) {
    emit log(QString("%1: %2 -> Converting PDF...")
        .arg(idx)
        .arg(path));

    const pdfium::BytesResult result = PdfBionicWorker::convertPdfBlocking(
        path,
        outPath,
        m_options,
        [this]() { return m_cancelRequested.loadRelaxed(); });

    if (result.cancelled) {
        emit log(QString("%1: %2 -> ❌ Cancelled during PDF conversion.")
            .arg(idx)
            .arg(path));
        return;
    }

    if (!result.success) {
        emit log(QString("%1: %2 -> ❌ %3")
            .arg(idx)
            .arg(path, QString::fromStdString(result.message)));
        return;
    }

    emit log(QString("%1: %2 -> ✅ Done (%3).")
        .arg(idx)
        .arg(outPath, QString::fromStdString(result.message)));
}

void BatchWorker::processEpub(const int idx,
                              const QString &path,
                              const QString &outPath) {
    auto [ok, msg] = EpubBionicConverter::Convert(
        path.toStdString(),
        outPath.toStdString(),
        m_options.ratio
    );

    emit log(QString("%1: %2 -> %3")
        .arg(idx)
        .arg(ok ? outPath : path, QString::fromStdString(msg)));
}
