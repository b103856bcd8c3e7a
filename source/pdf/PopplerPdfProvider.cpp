// ============================================================================
// PopplerPdfProvider - Implementation
// ============================================================================

#include "PopplerPdfProvider.h"

#include <QDebug>

// ===== Constructor =====

PopplerPdfProvider::PopplerPdfProvider(const QString& pdfPath)
    : m_path(pdfPath)
{
    m_document = Poppler::Document::load(pdfPath);

    if (!m_document) {
        qWarning() << "PopplerPdfProvider: Failed to open" << pdfPath;
        return;
    }

    if (m_document->isLocked()) {
        qWarning() << "PopplerPdfProvider:" << pdfPath << "is password protected";
        return;
    }

    // Apply rendering hints for high-quality output
    m_document->setRenderHint(Poppler::Document::Antialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextAntialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextHinting, true);
    m_document->setRenderHint(Poppler::Document::TextSlightHinting, true);

    qDebug() << "PopplerPdfProvider: Loaded" << pdfPath << "with" << m_document->numPages() << "pages";
}

// ===== Document Info =====

bool PopplerPdfProvider::isValid() const
{
    return m_document != nullptr && !m_document->isLocked() && m_document->numPages() > 0;
}

bool PopplerPdfProvider::isLocked() const
{
    return m_document != nullptr && m_document->isLocked();
}

int PopplerPdfProvider::pageCount() const
{
    return m_document ? m_document->numPages() : 0;
}

QString PopplerPdfProvider::title() const
{
    return m_document ? m_document->title() : QString();
}

QString PopplerPdfProvider::filePath() const
{
    return m_path;
}

// ===== Page Info =====

QSizeF PopplerPdfProvider::pageSize(int pageIndex) const
{
    auto page = getPage(pageIndex);
    if (!page) {
        return QSizeF();
    }
    return page->pageSizeF();
}

// ===== Rendering =====

QImage PopplerPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    auto page = getPage(pageIndex);
    if (!page || dpi <= 0) {
        return QImage();
    }
    QImage image = page->renderToImage(dpi, dpi);
    if (image.isNull()) {
        qWarning() << "PopplerPdfProvider: Render failed for page" << pageIndex;
    }
    return image;
}

// ===== Helpers =====

std::unique_ptr<Poppler::Page> PopplerPdfProvider::getPage(int pageIndex) const
{
    if (!m_document || pageIndex < 0 || pageIndex >= m_document->numPages()) {
        return nullptr;
    }
    return std::unique_ptr<Poppler::Page>(m_document->page(pageIndex));
}
