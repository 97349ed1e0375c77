#pragma once

#include "ui_mainwindow.h"
#include "PdfBionicWorker.h"
#include "batchworker.h"

QT_BEGIN_NAMESPACE

namespace Ui {
    class MainWindowClass;
};

QT_END_NAMESPACE

class MainWindow final : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);

    ~MainWindow() override;

private slots:
    void on_btnExit_clicked();

    static void on_actionExit_triggered();

    void on_actionAbout_triggered();

    void on_actionConvertPdf_triggered();

    void on_tabWidget_currentChanged(int index) const;

    void on_btnPaste_clicked() const;

    void on_btnProcess_clicked() const;

    void on_btnCopy_clicked() const;

    void on_btnOpenFile_clicked();

    void on_btnSaveAs_clicked();

    void on_tbSource_textChanged() const;

    void on_btnAdd_clicked();

    void on_btnRemove_clicked() const;

    void on_btnListClear_clicked() const;

    void on_btnOutDir_clicked();

    void on_btnBatchStart_clicked();

    void on_btnPreviewClear_clicked() const;

    void on_btnClearTbSource_clicked() const;

    void on_btnClearTbDestination_clicked() const;

    void onDocumentDropped(const QString &path);

    void onPdfConversionFinished(const QString &outputPath, const QString &summary);

    void onPdfConversionCancelled(const QString &message);

    void onPdfConversionError(const QString &message);

    void cleanupPdfThread();

    void onCancelClicked() const;

    // Batch handlers
    void onBatchProgress(int current, int total) const;
    void onBatchError(const QString &msg) const;
    void onBatchFinished(bool cancelled) const;
    void onBatchThreadFinished();

    void cleanupBatchThread();

private:
    Ui::MainWindowClass *ui;

    void displayFileList(const QStringList &files) const;

    [[nodiscard]] pdfium::ConversionOptions currentOptions() const;

    [[nodiscard]] QString suggestedOutputPath(const QString &inputPath) const;

    void startPdfConversion(const QString &inputPath, const QString &outputPath);

    void startBatchProcess();

    QPushButton *m_cancelButton = nullptr; // button shown in status bar
    QThread *m_pdfThread = nullptr;
    PdfBionicWorker *m_pdfWorker = nullptr;
    QString m_currentPdfFilePath;

    QThread *m_batchThread = nullptr;
    BatchWorker *m_batchWorker = nullptr;
};
