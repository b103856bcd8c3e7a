#pragma once

// ============================================================================
// MockPdfProvider - Deterministic in-memory PdfProvider for tests
// ============================================================================
// Renders flat images whose size follows the requested dpi, so tests can
// exercise the slide model without PDF files on disk.
//
// Usage:
//   PageRegistry registry(MockPdfProvider::factory({{"/a.pdf", 3}}));
// ============================================================================

#include "PdfProvider.h"

#include <QColor>
#include <QFileInfo>
#include <QHash>
#include <QVector>

#include <functional>
#include <memory>

class MockPdfProvider : public PdfProvider {
public:
    /**
     * @brief Create a mock document.
     * @param path Reported file path.
     * @param pageSizes One entry per page, in points.
     */
    MockPdfProvider(const QString& path, const QVector<QSizeF>& pageSizes)
        : m_path(path)
        , m_pageSizes(pageSizes)
    {
    }

    bool isValid() const override { return !m_pageSizes.isEmpty(); }
    bool isLocked() const override { return false; }
    int pageCount() const override { return m_pageSizes.size(); }
    QString title() const override { return QFileInfo(m_path).completeBaseName(); }
    QString filePath() const override { return m_path; }

    QSizeF pageSize(int pageIndex) const override
    {
        if (pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
            return QSizeF();
        }
        return m_pageSizes.at(pageIndex);
    }

    QImage renderPageToImage(int pageIndex, qreal dpi) const override
    {
        QSizeF pts = pageSize(pageIndex);
        if (pts.isEmpty() || dpi <= 0) {
            return QImage();
        }
        ++m_renderCount;
        const qreal scale = dpi / 72.0;
        QImage image(qRound(pts.width() * scale), qRound(pts.height() * scale),
                     QImage::Format_ARGB32);
        image.fill(QColor::fromHsv((pageIndex * 40) % 360, 80, 240));
        return image;
    }

    /// Number of renderPageToImage() calls that produced an image.
    int renderCount() const { return m_renderCount; }

    /// Landscape 4:3 slide in points.
    static QSizeF slideSize() { return QSizeF(720, 540); }

    /**
     * @brief Provider factory for PageRegistry.
     * @param documents Map of path to page count. Unknown paths fail to open.
     */
    static std::function<std::unique_ptr<PdfProvider>(const QString&)>
    factory(const QHash<QString, int>& documents)
    {
        return [documents](const QString& path) -> std::unique_ptr<PdfProvider> {
            const QString key = QFileInfo(path).absoluteFilePath();
            for (auto it = documents.constBegin(); it != documents.constEnd(); ++it) {
                if (QFileInfo(it.key()).absoluteFilePath() == key && it.value() > 0) {
                    return std::make_unique<MockPdfProvider>(path,
                        QVector<QSizeF>(it.value(), slideSize()));
                }
            }
            return nullptr;
        };
    }

    /**
     * @brief Factory for documents with explicit page sizes.
     */
    static std::function<std::unique_ptr<PdfProvider>(const QString&)>
    factoryWithSizes(const QHash<QString, QVector<QSizeF>>& documents)
    {
        return [documents](const QString& path) -> std::unique_ptr<PdfProvider> {
            const QString key = QFileInfo(path).absoluteFilePath();
            for (auto it = documents.constBegin(); it != documents.constEnd(); ++it) {
                if (QFileInfo(it.key()).absoluteFilePath() == key && !it.value().isEmpty()) {
                    return std::make_unique<MockPdfProvider>(path, it.value());
                }
            }
            return nullptr;
        };
    }

private:
    QString m_path;
    QVector<QSizeF> m_pageSizes;
    mutable int m_renderCount = 0;
};
