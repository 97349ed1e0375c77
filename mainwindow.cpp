#include "mainwindow.h"
#include "QClipboard"
#include "QFileDialog"
#include "QMessageBox"
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QMimeData>
#include <QThread>
#include <QTextStream>
#include "draglistwidget.h"
#include "filetype_utils.h"
#include "HtmlBionicInjector.hpp"
#include "Ligatures.hpp"

#include <optional>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent), ui(new Ui::MainWindowClass()) {
    ui->setupUi(this);
    ui->tabWidget->setCurrentIndex(0);

    ui->sbRatio->setRange(pdfium::kMinRatio, pdfium::kMaxRatio);
    ui->sbRatio->setSingleStep(0.05);
    ui->sbRatio->setValue(pdfium::ConversionOptions{}.ratio);

    connect(ui->tbSource, &TextEditWidget::fileDropped, this,
            [this](const QString &path) {
                ui->lblFileName->setText(path.section("/", -1, -1));
                if (path.isEmpty()) {
                    ui->statusBar->showMessage("Text contents dropped");
                }
            });

    connect(ui->tbSource, &TextEditWidget::documentDropped,
            this, &MainWindow::onDocumentDropped);

    connect(ui->listSource, &DragListWidget::filesRejected, this,
            [this](const QStringList &paths) {
                for (const QString &path: paths)
                    ui->tbPreview->appendPlainText(QString("❌ Not a PDF/EPUB file: %1").arg(path));
                ui->statusBar->showMessage(QString("%1 file(s) rejected.").arg(paths.size()));
            });

    // --- Status-bar Cancel button ---
    m_cancelButton = new QPushButton(tr("Cancel"), this);
    m_cancelButton->setObjectName("btnCancel");
    m_cancelButton->setAutoDefault(false);
    m_cancelButton->setFlat(true); // look like status-bar control
    m_cancelButton->hide(); // hidden by default

    ui->statusBar->addPermanentWidget(m_cancelButton);

    connect(m_cancelButton, &QPushButton::clicked,
            this, &MainWindow::onCancelClicked);
}

MainWindow::~MainWindow() {
    if (m_pdfWorker)
        m_pdfWorker->requestCancel();
    if (m_batchWorker)
        m_batchWorker->requestCancel();
    cleanupPdfThread();
    cleanupBatchThread();
    delete ui;
}

void MainWindow::on_btnExit_clicked() { this->close(); }

void MainWindow::on_actionExit_triggered() { QApplication::quit(); }

void MainWindow::on_actionAbout_triggered() {
    QMessageBox::about(this, "About",
                       "BionicReaderQt version 1.0.0\n"
                       "Bionic reading converter for PDF and EPUB.");
}

pdfium::ConversionOptions MainWindow::currentOptions() const {
    pdfium::ConversionOptions options;
    options.ratio = pdfium::ClampRatio(ui->sbRatio->value());
    options.copyImages = ui->actionCopyImages->isChecked();
    return options;
}

QString MainWindow::suggestedOutputPath(const QString &inputPath) const {
    const QFileInfo fi(inputPath);
    const QString outDir = QDir(ui->lineEditDir->text()).exists() && !ui->lineEditDir->text().isEmpty()
                               ? ui->lineEditDir->text()
                               : fi.absolutePath();
    return makeOutputPath(outDir, fi.fileName());
}

void MainWindow::on_actionConvertPdf_triggered() {
    const QString inputPath = QFileDialog::getOpenFileName(
        this,
        tr("Convert PDF"),
        ".",
        tr("PDF Files (*.pdf);;All Files (*.*)"));

    if (inputPath.isEmpty())
        return;

    if (detectDocumentKind(inputPath) != DocumentKind::Pdf) {
        ui->statusBar->showMessage(tr("❌ Not a PDF file: %1").arg(inputPath));
        return;
    }

    const QString outputPath = QFileDialog::getSaveFileName(
        this,
        tr("Save Bionic PDF"),
        suggestedOutputPath(inputPath),
        tr("PDF Files (*.pdf)"));

    if (outputPath.isEmpty())
        return;

    startPdfConversion(inputPath, outputPath);
}

void MainWindow::onDocumentDropped(const QString &path) {
    const DocumentKind kind = detectDocumentKind(path);

    if (kind == DocumentKind::Pdf && !m_pdfThread) {
        const QString outputPath = suggestedOutputPath(path);
        if (QFileInfo::exists(outputPath) && !ui->actionOverwrite->isChecked()) {
            ui->statusBar->showMessage(tr("❌ Output exists: %1").arg(outputPath));
            return;
        }
        startPdfConversion(path, outputPath);
        return;
    }

    // EPUBs (and PDFs while another conversion runs) go to the batch list.
    displayFileList({path});
    ui->tabWidget->setCurrentIndex(1);
    ui->statusBar->showMessage(tr("%1 added to batch list: %2").arg(documentKindName(kind), path));
}

void MainWindow::startPdfConversion(const QString &inputPath, const QString &outputPath) {
    // Clean up any previous thread/worker if needed
    cleanupPdfThread();

    m_currentPdfFilePath = inputPath;
    m_pdfThread = new QThread(this);
    m_pdfWorker = new PdfBionicWorker(inputPath, outputPath, currentOptions());

    m_pdfWorker->moveToThread(m_pdfThread);

    // When thread starts -> do work
    connect(m_pdfThread, &QThread::started,
            m_pdfWorker, &PdfBionicWorker::process);

    // Progress → update status bar text / emoji bar
    connect(m_pdfWorker, &PdfBionicWorker::progressChanged,
            this, [this](const int percent, const QString &bar, const int pageIndex, const int pageCount) {
                ui->statusBar->showMessage(QString("%1  %2%  (%3/%4)")
                    .arg(bar)
                    .arg(percent)
                    .arg(pageIndex + 1)
                    .arg(pageCount));
            });

    connect(m_pdfWorker, &PdfBionicWorker::finished,
            this, &MainWindow::onPdfConversionFinished);

    connect(m_pdfWorker, &PdfBionicWorker::cancelled,
            this, &MainWindow::onPdfConversionCancelled);

    connect(m_pdfWorker, &PdfBionicWorker::errorOccurred,
            this, &MainWindow::onPdfConversionError);

    // Cleanup when thread exits
    connect(m_pdfThread, &QThread::finished,
            m_pdfWorker, &QObject::deleteLater);
    connect(m_pdfThread, &QThread::finished,
            m_pdfThread, &QObject::deleteLater);

    // --- Show Cancel button while running ---
    m_cancelButton->setEnabled(true);
    m_cancelButton->show();

    ui->statusBar->showMessage(tr("Converting PDF: %1").arg(inputPath));
    m_pdfThread->start();
}

void MainWindow::onCancelClicked() const
{
    if (m_pdfWorker) {
        // requestCancel() only writes an atomic<bool>, which is thread-safe.
        m_pdfWorker->requestCancel();
        m_cancelButton->setEnabled(false);
        ui->statusBar->showMessage("Cancelling PDF conversion...");
    } else if (m_batchWorker) {
        m_batchWorker->requestCancel();
        m_cancelButton->setEnabled(false);
        ui->statusBar->showMessage("Cancelling batch...");
    }
}

void MainWindow::onPdfConversionFinished(const QString &outputPath, const QString &summary) {
    m_cancelButton->hide();

    ui->tbPreview->appendPlainText(QString("%1 -> ✅ %2 (%3)").arg(m_currentPdfFilePath, outputPath, summary));
    ui->statusBar->showMessage(tr("✅ Bionic PDF saved: %1").arg(outputPath));

    cleanupPdfThread();
    m_currentPdfFilePath.clear();
}

void MainWindow::onPdfConversionCancelled(const QString &message) {
    m_cancelButton->hide();

    ui->statusBar->showMessage(
        tr("❌ PDF conversion cancelled: %1 (%2)").arg(m_currentPdfFilePath, message)
    );

    cleanupPdfThread();
    m_currentPdfFilePath.clear();
}

void MainWindow::onPdfConversionError(const QString &message) {
    ui->tbPreview->appendPlainText(QString("%1 -> ❌ %2").arg(m_currentPdfFilePath, message));
    ui->statusBar->showMessage(tr("Error: %1").arg(message), 5000);
    m_cancelButton->hide();

    cleanupPdfThread();
    m_currentPdfFilePath.clear();
}

void MainWindow::cleanupPdfThread() {
    if (m_pdfThread) {
        m_pdfThread->quit(); // ask thread to stop event loop
        m_pdfThread->wait(); // block until fully stopped

        m_pdfThread = nullptr;
        m_pdfWorker = nullptr;
    }
}

void MainWindow::onBatchProgress(const int current, const int total) const {
    ui->statusBar->showMessage(
        QString("Processing %1/%2...").arg(current).arg(total));
}

void MainWindow::onBatchError(const QString &msg) const {
    ui->tbPreview->appendPlainText(QString("[Error] %1").arg(msg));
    ui->statusBar->showMessage(msg);
}

void MainWindow::onBatchFinished(const bool cancelled) const {
    if (cancelled) {
        ui->tbPreview->appendPlainText("❌ Batch cancelled.");
        ui->statusBar->showMessage("❌ Batch cancelled.");
    } else {
        ui->tbPreview->appendPlainText("✅ Batch conversion completed.");
        ui->statusBar->showMessage("Batch completed.");
    }

    ui->btnBatchStart->setEnabled(true);
    m_cancelButton->hide();
}

void MainWindow::onBatchThreadFinished() {
    m_batchThread = nullptr;
    m_batchWorker = nullptr;
}

void MainWindow::cleanupBatchThread() {
    if (m_batchThread) {
        m_batchThread->quit();
        m_batchThread->wait();
        m_batchThread = nullptr;
        m_batchWorker = nullptr;
    }
}

void MainWindow::on_tabWidget_currentChanged(const int index) const {
    switch (index) {
        case 0:
            ui->btnOpenFile->setEnabled(true);
            ui->btnSaveAs->setEnabled(true);
            break;
        case 1:
            ui->btnOpenFile->setEnabled(false);
            ui->btnSaveAs->setEnabled(false);
            break;
        default:
            break;
    }
}

void MainWindow::on_btnPaste_clicked() const {
    const QString text = QGuiApplication::clipboard()->text();
    if (text.isEmpty()) {
        ui->statusBar->showMessage("Clipboard empty");
        return;
    }

    ui->tbSource->document()->setPlainText(text);
    ui->tbSource->contentFilename = "";
    ui->lblFileName->setText("");
    ui->statusBar->showMessage("Clipboard contents pasted.");
}

void MainWindow::on_btnProcess_clicked() const {
    const QString input = ui->tbSource->toPlainText();
    if (input.trimmed().isEmpty()) {
        ui->statusBar->showMessage("Source content is empty");
        return;
    }

    const double ratio = pdfium::ClampRatio(ui->sbRatio->value());
    const bionic::HtmlBionicInjector injector(ratio);

    QElapsedTimer timer;
    timer.start();

    ui->tbDestination->document()->clear();

    // XHTML is rewritten as a document; anything else is treated as text.
    if (input.trimmed().startsWith(QLatin1Char('<'))) {
        QString parseError;
        const std::optional<QByteArray> output = injector.Apply(input.toUtf8(), &parseError);
        if (!output) {
            ui->statusBar->showMessage(QString("❌ Markup is not well-formed: %1").arg(parseError));
            return;
        }
        ui->tbDestination->setHtml(QString::fromUtf8(*output));
    } else {
        // Text copied out of PDFs often carries ligature glyphs; expand them
        // so they are emphasized like the letters they stand for.
        QStringList paragraphs;
        for (const QString &line: input.split(QLatin1Char('\n'))) {
            const QString expanded = QString::fromStdString(bionic::NormalizeLigatures(line.toStdString()));
            paragraphs << injector.FormatTextAsMarkup(expanded);
        }
        ui->tbDestination->setHtml(paragraphs.join(QStringLiteral("<br/>")));
    }

    ui->statusBar->showMessage(
        QString("Conversion completed in %1 ms. (ratio %2)").arg(timer.elapsed()).arg(ratio)
    );
}

void MainWindow::startBatchProcess() {
    if (ui->listSource->count() == 0) {
        ui->statusBar->showMessage("Nothing to convert: Empty file list.");
        return;
    }

    const QString outDir = ui->lineEditDir->text();
    if (outDir.isEmpty() || !QDir(outDir).exists()) {
        QMessageBox msg;
        msg.setWindowTitle("Attention");
        msg.setIcon(QMessageBox::Information);
        msg.setText("Invalid output directory.");
        msg.setInformativeText("Output directory:\n" + outDir + "\n not found.");
        msg.exec();
        ui->lineEditDir->setFocus();
        ui->statusBar->showMessage("Invalid output directory.");
        return;
    }

    QStringList files;
    files.reserve(ui->listSource->count());
    for (int i = 0; i < ui->listSource->count(); ++i) {
        files << ui->listSource->item(i)->text();
    }

    ui->tbPreview->clear();
    ui->statusBar->showMessage("Starting batch conversion...");

    cleanupBatchThread();

    m_batchThread = new QThread(this);
    m_batchWorker = new BatchWorker(
        files,
        outDir,
        currentOptions(),
        ui->actionOverwrite->isChecked(),
        nullptr
    );

    m_batchWorker->moveToThread(m_batchThread);

    connect(m_batchThread, &QThread::started,
            m_batchWorker, &BatchWorker::process);

    connect(m_batchWorker, &BatchWorker::log,
            ui->tbPreview, &QPlainTextEdit::appendPlainText);
    connect(m_batchWorker, &BatchWorker::progress,
            this, &MainWindow::onBatchProgress);
    connect(m_batchWorker, &BatchWorker::error,
            this, &MainWindow::onBatchError);
    connect(m_batchWorker, &BatchWorker::finished,
            this, &MainWindow::onBatchFinished);

    connect(m_batchWorker, &BatchWorker::finished,
            m_batchThread, &QThread::quit);
    connect(m_batchThread, &QThread::finished,
            m_batchWorker, &QObject::deleteLater);
    connect(m_batchThread, &QThread::finished,
            m_batchThread, &QObject::deleteLater);
    connect(m_batchThread, &QThread::finished,
            this, &MainWindow::onBatchThreadFinished);

    ui->btnBatchStart->setEnabled(false);
    m_cancelButton->setEnabled(true);
    m_cancelButton->show();

    m_batchThread->start();
}

void MainWindow::on_btnBatchStart_clicked() {
    startBatchProcess();
}

void MainWindow::on_btnCopy_clicked() const {
    if (ui->tbDestination->document()->isEmpty()) {
        ui->statusBar->showMessage("Destination content empty.");
        return;
    }

    // Rich text for editors that accept it, plain text for the rest.
    auto *mime = new QMimeData();
    mime->setHtml(ui->tbDestination->toHtml());
    mime->setText(ui->tbDestination->toPlainText());
    QGuiApplication::clipboard()->setMimeData(mime);

    ui->statusBar->showMessage("Destination contents copied to clipboard");
}

void MainWindow::on_btnOpenFile_clicked() {
    const QString file_name = QFileDialog::getOpenFileName(
        this,
        tr("Open File"),
        ".",
        tr("Text Files (*.txt);;"
            "XHTML Files (*.xhtml *.html *.htm);;"
            "Documents (*.pdf *.epub);;"
            "All Files (*.*)")
    );

    if (file_name.isEmpty())
        return;

    if (detectDocumentKind(file_name) != DocumentKind::Unknown) {
        onDocumentDropped(file_name);
        return;
    }

    QFile file(file_name);

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        ui->statusBar->showMessage(tr("Error opening file: %1").arg(file.errorString()));
        return;
    }

    QTextStream in(&file);
    const QString file_content = in.readAll();
    file.close();

    ui->tbSource->document()->setPlainText(file_content);
    ui->tbSource->contentFilename = file_name;
    ui->lblFileName->setText(file_name.section("/", -1, -1));

    ui->statusBar->showMessage(QStringLiteral("File: %1").arg(file_name));
}

void MainWindow::on_btnSaveAs_clicked() {
    if (ui->tbDestination->document()->isEmpty()) {
        ui->statusBar->showMessage("Destination content empty.");
        return;
    }

    const QString filename =
            QFileDialog::getSaveFileName(
                this,
                tr("Save Bionic HTML"),
                "./bionic.html",
                tr("HTML File (*.html);;All Files (*.*)")
            );

    if (filename.isEmpty())
        return;

    QFile file(filename);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        ui->statusBar->showMessage("❌ Cannot open file for writing.");
        return;
    }

    QTextStream out(&file);
    out << ui->tbDestination->toHtml();
    file.close();

    ui->statusBar->showMessage(
        QStringLiteral("💾 File saved: %1").arg(filename)
    );
}

void MainWindow::on_tbSource_textChanged() const {
    ui->lblCharCount->setText(
        QStringLiteral("[ %L1 chars ]")
        .arg(ui->tbSource->document()->toPlainText().length()));
}

void MainWindow::on_btnAdd_clicked() {
    if (const QStringList files =
            QFileDialog::getOpenFileNames(this,
                                          "Open Files",
                                          "",
                                          "Documents (*.pdf *.epub);;"
                                          "PDF Files (*.pdf);;"
                                          "EPUB Files (*.epub);;"
                                          "All Files (*.*)"); !files.isEmpty()) {
        displayFileList(files);
        ui->statusBar->showMessage("File(s) added.");
    }
}

void MainWindow::displayFileList(const QStringList &files) const {
    for (const QString &file: files) {
        if (!ui->listSource->addDocument(file))
            ui->tbPreview->appendPlainText(QString("❌ Skipped (duplicate or unsupported): %1").arg(file));
    }
}

void MainWindow::on_btnRemove_clicked() const {
    if (QList<QListWidgetItem *> selected_items = ui->listSource->selectedItems(); !selected_items.isEmpty()) {
        for (qsizetype i = selected_items.size() - 1; i >= 0; --i) {
            const QListWidgetItem *selected_item = selected_items[i];
            const int row = ui->listSource->row(selected_item);
            delete ui->listSource->takeItem(row);
        }
        ui->statusBar->showMessage("File(s) removed.");
    }
}

void MainWindow::on_btnListClear_clicked() const {
    ui->listSource->clear();
    ui->statusBar->showMessage("All entries cleared.");
}

void MainWindow::on_btnOutDir_clicked() {
    if (const QString directory = QFileDialog::getExistingDirectory(this, ""); !directory.isEmpty()) {
        ui->lineEditDir->setText(directory);
        ui->statusBar->showMessage("Output directory set: " + directory);
    }
}

void MainWindow::on_btnPreviewClear_clicked() const {
    ui->tbPreview->clear();
    ui->statusBar->showMessage("Log contents cleared");
}

void MainWindow::on_btnClearTbSource_clicked() const {
    ui->tbSource->clear();
    ui->tbSource->contentFilename.clear();
    ui->lblFileName->setText("");
    ui->statusBar->showMessage("Source contents cleared");
}

void MainWindow::on_btnClearTbDestination_clicked() const {
    ui->tbDestination->clear();
    ui->statusBar->showMessage("Destination contents cleared");
}
