#pragma once

#include <QObject>
#include <QStringList>
#include <QDir>
#include <QAtomicInteger>

#include "PdfBionic.hpp"

class BatchWorker : public QObject
{
    Q_OBJECT

public:
    BatchWorker(const QStringList &files,
                const QString &outDir,
                const pdfium::ConversionOptions &options,
                bool overwrite,
                QObject *parent = nullptr);

public slots:
    void process();
    void requestCancel();

signals:
    void log(const QString &line);
    void progress(int current, int total); // (idx, total)
    void finished(bool cancelled);
    void error(const QString &msg);

private:
    void processOneFile(int idx, const QString &path);
    void processPdf(int idx, const QString &path, const QString &outPath);
    void processEpub(int idx, const QString &path, const QString &outPath);

    QStringList m_files;
    QString     m_outDir;
    pdfium::ConversionOptions m_options;
    bool        m_overwrite;

    QAtomicInteger<bool> m_cancelRequested;
};
