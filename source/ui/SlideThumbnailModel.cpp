#include "SlideThumbnailModel.h"
#include "../core/PresentationSession.h"

#include <QByteArray>
#include <QDataStream>
#include <QFileInfo>
#include <QMimeData>
#include <QUrl>

// ============================================================================
// Constructor
// ============================================================================

SlideThumbnailModel::SlideThumbnailModel(QObject* parent)
    : QAbstractListModel(parent)
{
}

// ============================================================================
// QAbstractListModel Interface
// ============================================================================

int SlideThumbnailModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid() || !m_session) {
        return 0;
    }
    return m_session->slideCount();
}

QVariant SlideThumbnailModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || !m_session) {
        return QVariant();
    }

    const int position = index.row();
    const int slideId = m_session->slideOrder().slideIdAt(position);
    if (slideId < 0) {
        return QVariant();
    }

    switch (role) {
        case Qt::DisplayRole:
            return m_session->slideLabel(position);

        case Qt::ToolTipRole:
            return QFileInfo(m_session->registry().resolve(slideId).documentPath).fileName();

        case SlidePositionRole:
            return position;

        case SlideIdRole:
            return slideId;

        case SourcePageRole:
            return m_session->registry().resolve(slideId).pageIndex;

        case ThumbnailRole:
            return QVariant::fromValue(thumbnailForSlide(slideId));

        case IsCurrentSlideRole:
            return position == m_currentPosition;

        case AspectRatioRole: {
            const QPixmap thumb = thumbnailForSlide(slideId);
            if (thumb.isNull() || thumb.width() == 0) {
                return QVariant();
            }
            return static_cast<qreal>(thumb.height()) / thumb.width();
        }

        default:
            return QVariant();
    }
}

Qt::ItemFlags SlideThumbnailModel::flags(const QModelIndex& index) const
{
    Qt::ItemFlags defaultFlags = QAbstractListModel::flags(index);

    if (!index.isValid()) {
        return defaultFlags | Qt::ItemIsDropEnabled;
    }

    return defaultFlags | Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsDragEnabled;
}

QHash<int, QByteArray> SlideThumbnailModel::roleNames() const
{
    QHash<int, QByteArray> roles = QAbstractListModel::roleNames();
    roles[SlidePositionRole] = "slidePosition";
    roles[SlideIdRole] = "slideId";
    roles[SourcePageRole] = "sourcePage";
    roles[ThumbnailRole] = "thumbnail";
    roles[IsCurrentSlideRole] = "isCurrentSlide";
    roles[AspectRatioRole] = "aspectRatio";
    return roles;
}

// ============================================================================
// Drag-and-Drop Support
// ============================================================================

Qt::DropActions SlideThumbnailModel::supportedDropActions() const
{
    return Qt::MoveAction | Qt::CopyAction;
}

QStringList SlideThumbnailModel::mimeTypes() const
{
    QStringList types;
    types << MIME_TYPE << QStringLiteral("text/uri-list");
    return types;
}

QMimeData* SlideThumbnailModel::mimeData(const QModelIndexList& indexes) const
{
    if (indexes.isEmpty()) {
        return nullptr;
    }

    // Only use the first index (single selection)
    const QModelIndex& index = indexes.first();
    if (!index.isValid()) {
        return nullptr;
    }

    QMimeData* mimeData = new QMimeData();
    QByteArray encodedData;
    QDataStream stream(&encodedData, QIODevice::WriteOnly);
    stream << index.row();
    mimeData->setData(MIME_TYPE, encodedData);

    return mimeData;
}

bool SlideThumbnailModel::canDropMimeData(const QMimeData* data, Qt::DropAction action,
                                          int row, int column, const QModelIndex& parent) const
{
    Q_UNUSED(column);
    Q_UNUSED(parent);

    if (!data || !m_session) {
        return false;
    }

    if (data->hasFormat(MIME_TYPE)) {
        return action == Qt::MoveAction && row <= m_session->slideCount();
    }

    // PDFs dragged in from the folder browser or the desktop
    if (data->hasUrls()) {
        for (const QUrl& url : data->urls()) {
            if (url.isLocalFile() && url.toLocalFile().endsWith(".pdf", Qt::CaseInsensitive)) {
                return true;
            }
        }
    }
    return false;
}

bool SlideThumbnailModel::dropMimeData(const QMimeData* data, Qt::DropAction action,
                                       int row, int column, const QModelIndex& parent)
{
    if (!canDropMimeData(data, action, row, column, parent)) {
        return false;
    }

    if (!data->hasFormat(MIME_TYPE)) {
        QStringList paths;
        for (const QUrl& url : data->urls()) {
            const QString path = url.toLocalFile();
            if (path.endsWith(".pdf", Qt::CaseInsensitive)) {
                paths.append(path);
            }
        }
        emit filesDropped(paths);
        return true;
    }

    // Decode the source position
    QByteArray encodedData = data->data(MIME_TYPE);
    QDataStream stream(&encodedData, QIODevice::ReadOnly);
    int sourcePosition = -1;
    stream >> sourcePosition;

    // Dropping on empty space below the last tile appends
    int targetPosition = (row < 0) ? m_session->slideCount() : row;

    // If dropping after the source, adjust for the removal
    if (targetPosition > sourcePosition) {
        targetPosition--;
    }

    if (sourcePosition == targetPosition) {
        return false;
    }

    // Let the owner perform the move; the model resets on slidesChanged
    emit slideDropped(sourcePosition, targetPosition);
    return true;
}

// ============================================================================
// Session Binding
// ============================================================================

void SlideThumbnailModel::setSession(PresentationSession* session)
{
    if (m_session == session) {
        return;
    }

    beginResetModel();
    if (m_session) {
        disconnect(m_session, nullptr, this, nullptr);
    }
    m_session = session;
    m_pixmapCache.clear();
    m_currentPosition = session ? session->currentPosition() : 0;
    endResetModel();

    if (m_session) {
        connect(m_session, &PresentationSession::slidesChanged,
                this, &SlideThumbnailModel::onSlidesChanged);
        connect(m_session, &PresentationSession::currentSlideChanged,
                this, [this](int position, int) { onCurrentSlideChanged(position); });
    }
}

QPixmap SlideThumbnailModel::thumbnailForSlide(int slideId) const
{
    auto it = m_pixmapCache.constFind(slideId);
    if (it != m_pixmapCache.constEnd()) {
        return it.value();
    }

    const QImage image = m_session
        ? m_session->images().image(slideId, SlideImageCache::Kind::Thumbnail)
        : QImage();
    if (image.isNull()) {
        return QPixmap();
    }

    QPixmap pixmap = QPixmap::fromImage(image);
    m_pixmapCache.insert(slideId, pixmap);
    return pixmap;
}

void SlideThumbnailModel::onSlidesChanged()
{
    beginResetModel();
    m_currentPosition = m_session ? m_session->currentPosition() : 0;
    endResetModel();
}

void SlideThumbnailModel::onCurrentSlideChanged(int position)
{
    if (position == m_currentPosition) {
        return;
    }

    const int previous = m_currentPosition;
    m_currentPosition = position;

    const QVector<int> roles = {IsCurrentSlideRole};
    if (previous >= 0 && previous < rowCount()) {
        emit dataChanged(index(previous), index(previous), roles);
    }
    if (position >= 0 && position < rowCount()) {
        emit dataChanged(index(position), index(position), roles);
    }
}
