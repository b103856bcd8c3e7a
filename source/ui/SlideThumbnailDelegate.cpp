#include "SlideThumbnailDelegate.h"
#include "SlideThumbnailModel.h"

#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>

// ============================================================================
// Constructor
// ============================================================================

SlideThumbnailDelegate::SlideThumbnailDelegate(QObject* parent)
    : QStyledItemDelegate(parent)
{
}

// ============================================================================
// Size Hint
// ============================================================================

QSize SlideThumbnailDelegate::sizeHint(const QStyleOptionViewItem& option,
                                       const QModelIndex& index) const
{
    Q_UNUSED(option);

    const int thumbHeight = static_cast<int>(m_thumbnailWidth * aspectRatioFor(index));

    // Total item height: padding + thumbnail + spacing + label + padding
    const int totalHeight = VERTICAL_PADDING + thumbHeight + ITEM_SPACING +
                            LABEL_HEIGHT + VERTICAL_PADDING;
    const int totalWidth = HORIZONTAL_PADDING + m_thumbnailWidth + HORIZONTAL_PADDING;

    return QSize(totalWidth, totalHeight);
}

// ============================================================================
// Paint
// ============================================================================

void SlideThumbnailDelegate::paint(QPainter* painter, const QStyleOptionViewItem& option,
                                   const QModelIndex& index) const
{
    painter->save();
    painter->setRenderHint(QPainter::Antialiasing, true);
    painter->setRenderHint(QPainter::TextAntialiasing, true);

    const QPixmap thumbnail = index.data(SlideThumbnailModel::ThumbnailRole).value<QPixmap>();
    const bool isCurrentSlide = index.data(SlideThumbnailModel::IsCurrentSlideRole).toBool();
    const QString label = index.data(Qt::DisplayRole).toString();
    const qreal aspectRatio = aspectRatioFor(index);

    const bool isSelected = option.state & QStyle::State_Selected;
    const bool isHovered = option.state & QStyle::State_MouseOver;

    const QRect thumbRect = thumbnailRect(option.rect, aspectRatio);
    const QRect labelRect(option.rect.left(), thumbRect.bottom() + ITEM_SPACING,
                          option.rect.width(), LABEL_HEIGHT);

    // 1. Background (selection/hover feedback)
    if (isSelected || isHovered) {
        painter->fillRect(option.rect, backgroundColor(isSelected, isHovered));
    }

    // 2. Thumbnail or placeholder
    if (!thumbnail.isNull()) {
        QPainterPath clipPath;
        clipPath.addRoundedRect(thumbRect, BORDER_RADIUS, BORDER_RADIUS);

        painter->save();
        painter->setClipPath(clipPath);

        // Tall slides are shown from the top, cropped to the tile
        const qreal scale = static_cast<qreal>(thumbRect.width()) / thumbnail.width();
        const QRectF source(0, 0, thumbnail.width(), thumbRect.height() / scale);
        painter->drawPixmap(QRectF(thumbRect), thumbnail, source);

        painter->restore();
    } else {
        drawPlaceholder(painter, thumbRect);
    }

    // 3. Border
    drawBorder(painter, thumbRect, isCurrentSlide);

    // 4. Label
    painter->setPen(textColor());
    QFont font = option.font;
    font.setPixelSize(12);
    painter->setFont(font);
    painter->drawText(labelRect, Qt::AlignHCenter | Qt::AlignTop, label);

    // 5. Remove button
    if (isHovered) {
        drawRemoveButton(painter, removeButtonRect(option.rect, aspectRatio));
    }

    painter->restore();
}

bool SlideThumbnailDelegate::editorEvent(QEvent* event, QAbstractItemModel* model,
                                         const QStyleOptionViewItem& option,
                                         const QModelIndex& index)
{
    if (event->type() == QEvent::MouseButtonRelease && index.isValid()) {
        auto* mouseEvent = static_cast<QMouseEvent*>(event);
        if (mouseEvent->button() == Qt::LeftButton &&
            removeButtonRect(option.rect, aspectRatioFor(index)).contains(mouseEvent->position().toPoint())) {
            emit removeRequested(index.row());
            return true;
        }
    }
    return QStyledItemDelegate::editorEvent(event, model, option, index);
}

// ============================================================================
// Settings
// ============================================================================

void SlideThumbnailDelegate::setThumbnailWidth(int width)
{
    if (width > 0) {
        m_thumbnailWidth = width;
    }
}

void SlideThumbnailDelegate::setDarkMode(bool dark)
{
    m_darkMode = dark;
}

QRect SlideThumbnailDelegate::thumbnailRect(const QRect& itemRect, qreal aspectRatio) const
{
    if (aspectRatio < 0) {
        aspectRatio = m_defaultAspectRatio;
    }

    const int thumbHeight = static_cast<int>(m_thumbnailWidth * aspectRatio);
    const int thumbX = itemRect.left() + (itemRect.width() - m_thumbnailWidth) / 2;
    const int thumbY = itemRect.top() + VERTICAL_PADDING;

    return QRect(thumbX, thumbY, m_thumbnailWidth, thumbHeight);
}

QRect SlideThumbnailDelegate::removeButtonRect(const QRect& itemRect, qreal aspectRatio) const
{
    const QRect thumbRect = thumbnailRect(itemRect, aspectRatio);
    return QRect(thumbRect.right() - REMOVE_BUTTON_SIZE - 4, thumbRect.top() + 4,
                 REMOVE_BUTTON_SIZE, REMOVE_BUTTON_SIZE);
}

// ============================================================================
// Private Helpers
// ============================================================================

qreal SlideThumbnailDelegate::aspectRatioFor(const QModelIndex& index) const
{
    if (index.isValid()) {
        const QVariant ratioVar = index.data(SlideThumbnailModel::AspectRatioRole);
        if (ratioVar.isValid()) {
            return qBound<qreal>(0.1, ratioVar.toReal(), MAX_TILE_ASPECT);
        }
    }
    return m_defaultAspectRatio;
}

void SlideThumbnailDelegate::drawPlaceholder(QPainter* painter, const QRect& thumbRect) const
{
    QPainterPath path;
    path.addRoundedRect(thumbRect, BORDER_RADIUS, BORDER_RADIUS);
    painter->fillPath(path, placeholderColor());

    // Three dots in the center
    painter->setPen(Qt::NoPen);
    painter->setBrush(m_darkMode ? QColor(100, 100, 100) : QColor(180, 180, 180));

    const int dotSize = 6;
    const int dotSpacing = 12;
    const int totalWidth = dotSize * 3 + dotSpacing * 2;
    const int startX = thumbRect.center().x() - totalWidth / 2;
    const int y = thumbRect.center().y();

    for (int i = 0; i < 3; ++i) {
        const int x = startX + i * (dotSize + dotSpacing);
        painter->drawEllipse(QPoint(x + dotSize / 2, y), dotSize / 2, dotSize / 2);
    }
}

void SlideThumbnailDelegate::drawBorder(QPainter* painter, const QRect& thumbRect,
                                        bool isCurrentSlide) const
{
    const int borderWidth = isCurrentSlide ? BORDER_WIDTH_CURRENT : BORDER_WIDTH_NORMAL;

    QPen pen(isCurrentSlide ? accentColor() : neutralBorderColor());
    pen.setWidth(borderWidth);
    painter->setPen(pen);
    painter->setBrush(Qt::NoBrush);

    // Inset rect by half border width for proper drawing
    const qreal inset = borderWidth / 2.0;
    const QRectF borderRect = QRectF(thumbRect).adjusted(inset, inset, -inset, -inset);
    painter->drawRoundedRect(borderRect, BORDER_RADIUS, BORDER_RADIUS);
}

void SlideThumbnailDelegate::drawRemoveButton(QPainter* painter, const QRect& buttonRect) const
{
    painter->setPen(Qt::NoPen);
    painter->setBrush(QColor(200, 60, 60, 220));
    painter->drawEllipse(buttonRect);

    QPen pen(Qt::white);
    pen.setWidth(2);
    painter->setPen(pen);
    const QRect cross = buttonRect.adjusted(7, 7, -7, -7);
    painter->drawLine(cross.topLeft(), cross.bottomRight());
    painter->drawLine(cross.topRight(), cross.bottomLeft());
}

QColor SlideThumbnailDelegate::accentColor() const
{
    return m_darkMode ? QColor(100, 149, 237) : QColor(66, 133, 244);
}

QColor SlideThumbnailDelegate::neutralBorderColor() const
{
    return m_darkMode ? QColor(80, 80, 80) : QColor(200, 200, 200);
}

QColor SlideThumbnailDelegate::placeholderColor() const
{
    return m_darkMode ? QColor(50, 50, 55) : QColor(230, 230, 235);
}

QColor SlideThumbnailDelegate::textColor() const
{
    return m_darkMode ? QColor(200, 200, 200) : QColor(80, 80, 80);
}

QColor SlideThumbnailDelegate::backgroundColor(bool isSelected, bool isHovered) const
{
    if (m_darkMode) {
        if (isSelected) {
            return QColor(60, 60, 65);
        } else if (isHovered) {
            return QColor(50, 50, 55);
        }
    } else {
        if (isSelected) {
            return QColor(230, 240, 250);
        } else if (isHovered) {
            return QColor(240, 245, 250);
        }
    }
    return Qt::transparent;
}
