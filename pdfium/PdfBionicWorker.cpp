// PdfBionicWorker.cpp

#include "PdfBionicWorker.h"

#include <QDebug>
#include <QFile>
#include <QSaveFile>
#include <QString>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {
    std::vector<std::uint8_t> readAllBytes(const QString &path) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly))
            throw std::runtime_error("Cannot open " + path.toStdString() + ": " +
                                     file.errorString().toStdString());

        const QByteArray data = file.readAll();
        return {data.cbegin(), data.cend()};
    }

    void writeAllBytes(const QString &path, const std::vector<std::uint8_t> &bytes) {
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly))
            throw std::runtime_error("Cannot create " + path.toStdString() + ": " +
                                     file.errorString().toStdString());

        const auto size = static_cast<qint64>(bytes.size());
        if (file.write(reinterpret_cast<const char *>(bytes.data()), size) != size || !file.commit())
            throw std::runtime_error("Cannot write " + path.toStdString() + ": " +
                                     file.errorString().toStdString());
    }
} // namespace

void PdfBionicWorker::process() {
    try {
        const pdfium::ProgressCallback progressCb =
                [this](const int pageIndex,
                       const int pageCount,
                       const int percent,
                       const std::string &barUtf8) {
            if (m_cancelFlag->load(std::memory_order_relaxed))
                return;

            const QString bar = QString::fromUtf8(barUtf8.c_str(),
                                                  static_cast<int>(barUtf8.size()));
            emit progressChanged(percent, bar, pageIndex, pageCount);
        };

        const pdfium::BytesResult result =
                pdfium::ConvertToBionic(readAllBytes(m_inputPath),
                                        m_options,
                                        progressCb,
                                        m_cancelFlag.get());

        if (result.cancelled) {
            emit cancelled(QString::fromStdString(result.message));
            return;
        }

        if (!result.success) {
            emit errorOccurred(QString::fromStdString(result.message));
            return;
        }

        writeAllBytes(m_outputPath, result.outputBytes);
        emit finished(m_outputPath, QString::fromStdString(result.message));
    } catch (const std::exception &ex) {
        emit errorOccurred(QString::fromUtf8(ex.what()));
    }
}

pdfium::BytesResult PdfBionicWorker::convertPdfBlocking(
    const QString &inputPath,
    const QString &outputPath,
    const pdfium::ConversionOptions &options,
    const std::function<bool()> &isCancelled) {
    std::atomic<bool> cancelFlag(false);

    const pdfium::ProgressCallback progressCb =
            [&isCancelled, &cancelFlag](int, int, int, const std::string &) {
        if (isCancelled && isCancelled())
            cancelFlag.store(true, std::memory_order_relaxed);
    };

    try {
        pdfium::BytesResult result =
                pdfium::ConvertToBionic(readAllBytes(inputPath), options, progressCb, &cancelFlag);

        if (result.success)
            writeAllBytes(outputPath, result.outputBytes);
        return result;
    } catch (const std::exception &ex) {
        qWarning() << "PDF conversion error:" << ex.what();
        return {false, ex.what()};
    }
}
