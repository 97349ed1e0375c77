#include <QMimeData>
#include "draglistwidget.h"
#include "filetype_utils.h"


DragListWidget::DragListWidget(QWidget* parent) : QListWidget(parent)
{
    setSelectionMode(ExtendedSelection);
    setAcceptDrops(true);
    viewport()->setAcceptDrops(true);
    setDragEnabled(true);
    setDropIndicatorShown(true);
    setDefaultDropAction(Qt::CopyAction);
    setDragDropMode(InternalMove);
}

bool DragListWidget::addDocument(const QString& path)
{
    if (path.isEmpty() || isItemInList(path))
        return false;
    if (detectDocumentKind(path) == DocumentKind::Unknown)
        return false;

    // Let QListWidget allocate & own the item internally
    addItem(path);
    return true;
}

void DragListWidget::dragEnterEvent(QDragEnterEvent* event)
{
    if (const QMimeData* mimeData = event->mimeData(); mimeData->hasUrls())
    {
        event->acceptProposedAction();
    }
}

void DragListWidget::dragMoveEvent(QDragMoveEvent* event)
{
    if (event->mimeData()->hasUrls())
        event->acceptProposedAction();
}

void DragListWidget::dropEvent(QDropEvent* event)
{
    const QMimeData* mimeData = event->mimeData();
    if (!mimeData->hasUrls())
        return;

    QStringList rejected;
    for (const QUrl& url : mimeData->urls())
    {
        const QString path = url.toLocalFile();
        if (!addDocument(path) && !path.isEmpty() && !isItemInList(path))
            rejected << path;
    }
    if (!rejected.isEmpty())
        emit filesRejected(rejected);

    event->acceptProposedAction();
}

bool DragListWidget::isItemInList(const QString& itemText) const
{
    const QList<QListWidgetItem*> items = findItems(itemText, Qt::MatchExactly);
    return !items.isEmpty();
}
