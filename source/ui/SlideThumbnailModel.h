#ifndef SLIDETHUMBNAILMODEL_H
#define SLIDETHUMBNAILMODEL_H

#include <QAbstractListModel>
#include <QHash>
#include <QPixmap>

class PresentationSession;

/**
 * @brief QAbstractListModel exposing the slide order to a QListView.
 *
 * One row per position in the presentation sequence. Provides:
 * - Slide id, source page, thumbnail and current-slide state per row
 * - Drag-and-drop reordering via MIME data (the move itself is left to
 *   the owner through slideDropped())
 * - Dropping PDF files from outside (filesDropped())
 *
 * Thumbnails come from the session's image cache; converted pixmaps are
 * cached here by slide id, so reordering never converts them again.
 */
class SlideThumbnailModel : public QAbstractListModel {
    Q_OBJECT

public:
    /**
     * @brief Custom roles for slide data.
     */
    enum Roles {
        SlidePositionRole = Qt::UserRole + 1,   ///< Position in the sequence (0-based)
        SlideIdRole,                            ///< Global slide id
        SourcePageRole,                         ///< Page in the source PDF (0-based)
        ThumbnailRole,                          ///< QPixmap thumbnail
        IsCurrentSlideRole,                     ///< bool: is this the current slide?
        AspectRatioRole                         ///< qreal: thumbnail height/width
    };

    /// MIME type for internal slide moves
    static constexpr const char* MIME_TYPE = "application/x-pdfpresenter-slide-position";

    explicit SlideThumbnailModel(QObject* parent = nullptr);

    // ===== QAbstractListModel Interface =====

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;
    QHash<int, QByteArray> roleNames() const override;

    // ===== Drag-and-Drop Support =====

    Qt::DropActions supportedDropActions() const override;
    QStringList mimeTypes() const override;
    QMimeData* mimeData(const QModelIndexList& indexes) const override;
    bool canDropMimeData(const QMimeData* data, Qt::DropAction action,
                         int row, int column, const QModelIndex& parent) const override;
    bool dropMimeData(const QMimeData* data, Qt::DropAction action,
                      int row, int column, const QModelIndex& parent) override;

    // ===== Session Binding =====

    /**
     * @brief Bind to a session (not owned) and follow its changes.
     */
    void setSession(PresentationSession* session);
    PresentationSession* session() const { return m_session; }

    /**
     * @brief Cached thumbnail for a slide id, converting on first use.
     */
    QPixmap thumbnailForSlide(int slideId) const;

signals:
    /**
     * @brief Emitted when a slide was dropped to a new position.
     * @param fromPosition Original position.
     * @param toPosition Target position (already adjusted for the removal).
     */
    void slideDropped(int fromPosition, int toPosition);

    /**
     * @brief Emitted when PDF files are dropped onto the list.
     */
    void filesDropped(const QStringList& paths);

public slots:
    /// Rebuild all rows (slides added, removed or moved).
    void onSlidesChanged();

    /// Update the current-slide highlight.
    void onCurrentSlideChanged(int position);

private:
    PresentationSession* m_session = nullptr;
    int m_currentPosition = 0;
    mutable QHash<int, QPixmap> m_pixmapCache;  ///< Slide id -> converted thumbnail
};

#endif // SLIDETHUMBNAILMODEL_H
