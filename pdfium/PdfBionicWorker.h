// PdfBionicWorker.h
#pragma once

#include <QObject>
#include <QString>
#include <atomic>
#include <functional>
#include <memory>
#include <utility>

#include "PdfBionic.hpp"

class PdfBionicWorker final : public QObject {
    Q_OBJECT

public:
    explicit PdfBionicWorker(QString inputPath,
                             QString outputPath,
                             pdfium::ConversionOptions options = {},
                             QObject *parent = nullptr)
        : QObject(parent)
          , m_inputPath(std::move(inputPath))
          , m_outputPath(std::move(outputPath))
          , m_options(std::move(options))
          , m_cancelFlag(std::make_shared<std::atomic<bool> >(false)) {
    }

    // Synchronous helper for BatchWorker. Writes outputPath and returns the
    // driver result; isCancelled is polled between pages.
    static pdfium::BytesResult convertPdfBlocking(const QString &inputPath,
                                                  const QString &outputPath,
                                                  const pdfium::ConversionOptions &options,
                                                  const std::function<bool()> &isCancelled);

public slots:
    // Entry point for the worker thread
    void process();

    // Called from GUI thread to request cancellation
    void requestCancel() const {
        m_cancelFlag->store(true, std::memory_order_relaxed);
    }

signals:
    // percent: 0–100
    // bar: emoji progress bar (🟩🟩⬜⬜…)
    // pageIndex: 0-based
    // pageCount: total pages
    void progressChanged(int percent,
                         const QString &bar,
                         int pageIndex,
                         int pageCount);

    // Emitted when the bionic PDF was written to outputPath
    void finished(const QString &outputPath, const QString &summary);

    // Emitted when user cancelled; nothing is written
    void cancelled(const QString &message);

    // Emitted on error
    void errorOccurred(const QString &message);

private:
    QString m_inputPath;
    QString m_outputPath;
    pdfium::ConversionOptions m_options;
    std::shared_ptr<std::atomic<bool> > m_cancelFlag;
};
