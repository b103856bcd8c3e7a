#ifndef SLIDEORGANIZER_H
#define SLIDEORGANIZER_H

#include <QWidget>

class QListView;
class PresentationSession;
class SlideThumbnailModel;
class SlideThumbnailDelegate;

/**
 * @brief Grid of slide thumbnails for arranging the presentation.
 *
 * Shows every slide of the session in sequence order and lets the user
 * reorder them by drag-and-drop, remove them (hover button, Delete key or
 * context menu) and pick the current slide by clicking.
 *
 * Features:
 * - QListView in wrapping left-to-right flow with custom model and delegate
 * - Auto-scroll to the current slide when it is not visible
 * - Accepts PDF files dropped from the folder browser or the desktop
 *
 * Usage:
 * 1. MainWindow creates the organizer as its central widget
 * 2. Call setSession()
 * 3. Connect the request signals to the session
 */
class SlideOrganizer : public QWidget {
    Q_OBJECT

public:
    explicit SlideOrganizer(QWidget* parent = nullptr);
    ~SlideOrganizer() override;

    /**
     * @brief Bind to a session (not owned).
     */
    void setSession(PresentationSession* session);
    PresentationSession* session() const { return m_session; }

    /**
     * @brief Set the thumbnail width used for tile layout.
     */
    void setThumbnailWidth(int width);

    /**
     * @brief Set dark mode for theming.
     */
    void setDarkMode(bool dark);

    /**
     * @brief Position of the selected tile, or -1.
     */
    int selectedPosition() const;

    /**
     * @brief Scroll to make the current slide visible.
     */
    void scrollToCurrentSlide();

signals:
    /**
     * @brief User clicked a tile.
     */
    void slideClicked(int position);

    /**
     * @brief User dragged a slide to a new position.
     */
    void slideDropped(int fromPosition, int toPosition);

    /**
     * @brief User asked to remove a slide.
     */
    void removeRequested(int position);

    /**
     * @brief PDF files were dropped onto the grid.
     */
    void filesDropped(const QStringList& paths);

public slots:
    /**
     * @brief Follow the current slide (highlight + scroll).
     */
    void onCurrentSlideChanged(int position);

protected:
    void keyPressEvent(QKeyEvent* event) override;

private slots:
    void onItemClicked(const QModelIndex& index);
    void onContextMenuRequested(const QPoint& pos);

private:
    void setupUI();
    void setupConnections();
    void configureListView();
    void applyTheme();

    QListView* m_listView = nullptr;
    SlideThumbnailModel* m_model = nullptr;
    SlideThumbnailDelegate* m_delegate = nullptr;

    PresentationSession* m_session = nullptr;
    bool m_darkMode = false;
};

#endif // SLIDEORGANIZER_H
