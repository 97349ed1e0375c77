#ifndef DRAGLISTWIDGET_H
#define DRAGLISTWIDGET_H

#include <QListWidget>
#include <QDragEnterEvent>

// File list for batch conversion; accepts dropped PDF and EPUB files only.
class DragListWidget : public QListWidget {
Q_OBJECT

public:
    explicit DragListWidget(QWidget *parent = nullptr);

    // Returns false for duplicates and unsupported files.
    bool addDocument(const QString &path);

signals:
    void filesRejected(const QStringList &paths);

protected:
    void dragEnterEvent(QDragEnterEvent *event) override;

    void dragMoveEvent(QDragMoveEvent *event) override;

    void dropEvent(QDropEvent *event) override;

    bool isItemInList(const QString &itemText) const;
};

#endif // DRAGLISTWIDGET_H
