// ============================================================================
// PageRegistry - Implementation
// ============================================================================

#include "PageRegistry.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QObject>

PageRegistry::PageRegistry(PdfBackend backend)
    : m_factory([backend](const QString& path) { return PdfProvider::open(path, backend); })
{
}

PageRegistry::PageRegistry(ProviderFactory factory)
    : m_factory(std::move(factory))
{
}

// ===== Documents =====

QString PageRegistry::normalizedPath(const QString& path)
{
    if (path.isEmpty()) {
        return QString();
    }
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

const PdfProvider* PageRegistry::registerDocument(const QString& path, QString* errorMsg)
{
    const QString key = normalizedPath(path);
    if (key.isEmpty()) {
        if (errorMsg) *errorMsg = QObject::tr("No file path given.");
        return nullptr;
    }

    auto it = m_documentIndexByPath.constFind(key);
    if (it != m_documentIndexByPath.constEnd()) {
        qDebug() << "PageRegistry: Reusing open document" << key;
        return m_documents[static_cast<size_t>(it.value())].get();
    }

    std::unique_ptr<PdfProvider> provider = m_factory ? m_factory(key) : nullptr;

    if (!provider || !provider->isValid()) {
        QString reason;
        if (provider && provider->isLocked()) {
            reason = QObject::tr("The file is password protected.");
        } else if (!QFileInfo::exists(key) && !provider) {
            reason = QObject::tr("The file does not exist.");
        } else {
            reason = QObject::tr("The file is not a readable PDF document.");
        }
        qWarning() << "PageRegistry: Failed to load" << key << "-" << reason;
        if (errorMsg) *errorMsg = reason;
        return nullptr;
    }

    m_documents.push_back(std::move(provider));
    const int index = static_cast<int>(m_documents.size()) - 1;
    m_documentIndexByPath.insert(key, index);

    qDebug() << "PageRegistry: Registered" << key
             << "pages:" << m_documents.back()->pageCount();
    return m_documents.back().get();
}

const PdfProvider* PageRegistry::document(const QString& path) const
{
    auto it = m_documentIndexByPath.constFind(normalizedPath(path));
    if (it == m_documentIndexByPath.constEnd()) {
        return nullptr;
    }
    return m_documents[static_cast<size_t>(it.value())].get();
}

QStringList PageRegistry::documentPaths() const
{
    QStringList paths;
    paths.reserve(static_cast<int>(m_documents.size()));
    for (const auto& doc : m_documents) {
        paths.append(normalizedPath(doc->filePath()));
    }
    return paths;
}

int PageRegistry::indexOfDocument(const PdfProvider* document) const
{
    if (!document) {
        return -1;
    }
    for (size_t i = 0; i < m_documents.size(); ++i) {
        if (m_documents[i].get() == document) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// ===== Slides =====

QVector<int> PageRegistry::addPages(const PdfProvider* document, int count)
{
    QVector<int> ids;

    const int documentIndex = indexOfDocument(document);
    if (documentIndex < 0) {
        qWarning() << "PageRegistry: addPages() called with an unregistered document";
        return ids;
    }

    if (count > document->pageCount()) {
        qWarning() << "PageRegistry: Requested" << count << "pages but document has"
                   << document->pageCount();
        count = document->pageCount();
    }
    if (count <= 0) {
        return ids;
    }

    ids.reserve(count);
    for (int page = 0; page < count; ++page) {
        const int id = m_nextId++;
        m_slides.insert(id, SlideEntry{documentIndex, page});
        ids.append(id);
    }
    return ids;
}

QVector<int> PageRegistry::addAllPages(const PdfProvider* document)
{
    return addPages(document, document ? document->pageCount() : 0);
}

SlideSource PageRegistry::resolve(int slideId) const
{
    auto it = m_slides.constFind(slideId);
    if (it == m_slides.constEnd()) {
        qWarning() << "PageRegistry: Unknown slide id" << slideId;
        return SlideSource();
    }

    const PdfProvider* doc = m_documents[static_cast<size_t>(it->documentIndex)].get();

    SlideSource source;
    source.document = doc;
    source.documentPath = normalizedPath(doc->filePath());
    source.pageIndex = it->pageIndex;
    return source;
}
