#pragma once

// ============================================================================
// SamplePdf - Writes small real PDF files for tests
// ============================================================================
// Each page gets its own size (in points) and a large page label, so tests
// can recognize pages after reordering and export by measuring them.
// ============================================================================

#include <QFont>
#include <QMarginsF>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QString>
#include <QVector>
#include <QSizeF>

namespace SamplePdf {

/**
 * @brief Write a PDF with one page per entry in @p pageSizes.
 * @param path Output file.
 * @param pageSizes Page sizes in points.
 * @return True if the file was written.
 */
inline bool write(const QString& path, const QVector<QSizeF>& pageSizes)
{
    if (pageSizes.isEmpty()) {
        return false;
    }

    QPdfWriter writer(path);
    writer.setResolution(72);
    writer.setPageMargins(QMarginsF(0, 0, 0, 0));
    writer.setPageSize(QPageSize(pageSizes.first(), QPageSize::Point, QString(),
                                 QPageSize::ExactMatch));

    QPainter painter;
    if (!painter.begin(&writer)) {
        return false;
    }

    QFont font = painter.font();
    font.setPointSize(48);
    painter.setFont(font);

    for (int i = 0; i < pageSizes.size(); ++i) {
        if (i > 0) {
            writer.setPageSize(QPageSize(pageSizes.at(i), QPageSize::Point, QString(),
                                         QPageSize::ExactMatch));
            writer.newPage();
        }
        const QSizeF size = pageSizes.at(i);
        painter.drawRect(QRectF(QPointF(10, 10), size - QSizeF(20, 20)));
        painter.drawText(QRectF(QPointF(0, 0), size), Qt::AlignCenter,
                         QStringLiteral("Page %1").arg(i + 1));
    }

    return painter.end();
}

/**
 * @brief Page sizes that differ only in height: base + i * step.
 */
inline QVector<QSizeF> steppedSizes(int count, qreal width, qreal baseHeight, qreal step)
{
    QVector<QSizeF> sizes;
    for (int i = 0; i < count; ++i) {
        sizes.append(QSizeF(width, baseHeight + i * step));
    }
    return sizes;
}

} // namespace SamplePdf
