#ifndef TEXTEDITWIDGET_H
#define TEXTEDITWIDGET_H

#include <QPlainTextEdit>
#include <QDragEnterEvent>

// Preview source pane: takes pasted or dropped text/XHTML. Dropped PDF and
// EPUB files are handed to the window instead of being loaded as text.
class TextEditWidget : public QPlainTextEdit
{
    Q_OBJECT

public:
    explicit TextEditWidget(QWidget* parent = nullptr);

    QString contentFilename;

signals:
    void fileDropped(const QString& filePath);
    void documentDropped(const QString& filePath);

protected:
    void dragEnterEvent(QDragEnterEvent* event) override;

    void dropEvent(QDropEvent* event) override;

    void loadFile(const QString& filePath);
};

#endif // TEXTEDITWIDGET_H
