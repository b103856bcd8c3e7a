#ifndef SLIDETHUMBNAILDELEGATE_H
#define SLIDETHUMBNAILDELEGATE_H

#include <QStyledItemDelegate>
#include <QColor>

/**
 * @brief Custom delegate for rendering slide tiles in the organizer grid.
 *
 * Renders each item as:
 * 1. Thumbnail image (or placeholder if not rendered)
 * 2. Border (thin neutral for normal, thick accent for the current slide)
 * 3. Label below ("#N (Page p)")
 * 4. Remove button in the top-right corner while hovered
 */
class SlideThumbnailDelegate : public QStyledItemDelegate {
    Q_OBJECT

public:
    explicit SlideThumbnailDelegate(QObject* parent = nullptr);

    void paint(QPainter* painter, const QStyleOptionViewItem& option,
               const QModelIndex& index) const override;

    QSize sizeHint(const QStyleOptionViewItem& option,
                   const QModelIndex& index) const override;

    /**
     * @brief Set the thumbnail width.
     * @param width Thumbnail width in pixels.
     */
    void setThumbnailWidth(int width);
    int thumbnailWidth() const { return m_thumbnailWidth; }

    /**
     * @brief Set dark mode for theming.
     */
    void setDarkMode(bool dark);
    bool isDarkMode() const { return m_darkMode; }

    /**
     * @brief Thumbnail rect inside an item rect.
     * @param aspectRatio Height / width, or negative for the default.
     */
    QRect thumbnailRect(const QRect& itemRect, qreal aspectRatio = -1.0) const;

    /**
     * @brief Hit area of the remove button for an item rect.
     */
    QRect removeButtonRect(const QRect& itemRect, qreal aspectRatio = -1.0) const;

signals:
    /**
     * @brief The remove button of a tile was clicked.
     */
    void removeRequested(int position);

protected:
    bool editorEvent(QEvent* event, QAbstractItemModel* model,
                     const QStyleOptionViewItem& option, const QModelIndex& index) override;

private:
    qreal aspectRatioFor(const QModelIndex& index) const;

    void drawPlaceholder(QPainter* painter, const QRect& thumbRect) const;
    void drawBorder(QPainter* painter, const QRect& thumbRect, bool isCurrentSlide) const;
    void drawRemoveButton(QPainter* painter, const QRect& buttonRect) const;

    QColor accentColor() const;
    QColor neutralBorderColor() const;
    QColor placeholderColor() const;
    QColor textColor() const;
    QColor backgroundColor(bool isSelected, bool isHovered) const;

    int m_thumbnailWidth = 200;
    bool m_darkMode = false;
    qreal m_defaultAspectRatio = 0.75;  // 4:3 slides

    // Visual constants
    static constexpr int VERTICAL_PADDING = 8;
    static constexpr int HORIZONTAL_PADDING = 8;
    static constexpr int BORDER_RADIUS = 4;
    static constexpr int BORDER_WIDTH_NORMAL = 1;
    static constexpr int BORDER_WIDTH_CURRENT = 3;
    static constexpr int LABEL_HEIGHT = 24;
    static constexpr int ITEM_SPACING = 8;
    static constexpr int REMOVE_BUTTON_SIZE = 22;
    static constexpr int MAX_TILE_ASPECT = 2;   ///< Very tall slides are cropped in the grid
};

#endif // SLIDETHUMBNAILDELEGATE_H
