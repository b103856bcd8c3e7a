// ============================================================================
// PresentationSession - Implementation
// ============================================================================

#include "PresentationSession.h"
#include "PauseableTimer.h"
#include "PresentationSync.h"

#include <QDebug>
#include <QFileInfo>
#include <QUrl>

PresentationSession::PresentationSession(const PresenterSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_registry(settings.backend)
    , m_images(&m_registry)
{
    init();
}

PresentationSession::PresentationSession(PageRegistry::ProviderFactory factory,
                                         const PresenterSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_registry(std::move(factory))
    , m_images(&m_registry)
{
    init();
}

PresentationSession::~PresentationSession() = default;

void PresentationSession::init()
{
    m_sync = new PresentationSync(&m_order, &m_images, this);
    m_timer = new PauseableTimer(this);
    m_timer->setUpdateInterval(m_settings.timerIntervalMs);

    m_exporter.setSlides(&m_order, &m_registry);

    connect(m_sync, &PresentationSync::currentSlideChanged,
            this, &PresentationSession::onSyncSlideChanged);
    connect(&m_exporter, &MuPdfExporter::progressUpdated,
            this, &PresentationSession::exportProgress);
}

// ============================================================================
// Import
// ============================================================================

QString PresentationSession::localPathFromInput(const QString& input)
{
    const QString trimmed = input.trimmed();
    if (trimmed.startsWith(QLatin1String("file:"), Qt::CaseInsensitive)) {
        return QUrl(trimmed).toLocalFile();
    }
    return trimmed;
}

ImportReport PresentationSession::importFiles(const QStringList& paths)
{
    ImportReport report;

    for (const QString& input : paths) {
        const QString path = localPathFromInput(input);

        QString error;
        const PdfProvider* doc = m_registry.registerDocument(path, &error);
        if (!doc) {
            report.failedFiles.append(path);
            report.errorMessages.append(error);
            continue;
        }

        const QVector<int> ids = m_registry.addAllPages(doc);
        m_order.append(ids);
        for (int id : ids) {
            m_images.renderThumbnail(id, m_settings.thumbnailWidth);
        }

        report.addedSlideIds += ids;
        report.importedFiles.append(PageRegistry::normalizedPath(path));
        m_settings.addRecentImport(PageRegistry::normalizedPath(path));

        if (m_primaryPath.isEmpty()) {
            m_primaryPath = PageRegistry::normalizedPath(path);
            if (!m_notes.load(m_primaryPath)) {
                report.notesError = tr("Could not read notes file %1")
                                        .arg(NotesStore::notesPathFor(m_primaryPath));
            }
            m_notesModified = false;
        }
    }

    qDebug() << "PresentationSession: Imported" << report.addedSlideIds.size() << "slides from"
             << report.importedFiles.size() << "files," << report.failedFiles.size() << "failed";

    if (!report.addedSlideIds.isEmpty()) {
        if (m_presenting) {
            renderProjectionImages(m_images.projectionWidth());
        }
        emit slidesChanged();
        m_sync->resync();
    }

    if (report.hasFailures()) {
        emit importFailed(report.failedFiles, report.errorMessages);
    }

    return report;
}

QString PresentationSession::title() const
{
    if (m_primaryPath.isEmpty()) {
        return QString();
    }
    const PdfProvider* doc = m_registry.document(m_primaryPath);
    const QString docTitle = doc ? doc->title().trimmed() : QString();
    return docTitle.isEmpty() ? QFileInfo(m_primaryPath).completeBaseName() : docTitle;
}

// ============================================================================
// Slide Order
// ============================================================================

bool PresentationSession::removeSlide(int position)
{
    if (!m_order.remove(position)) {
        return false;
    }
    emit slidesChanged();
    m_sync->resync();
    return true;
}

bool PresentationSession::moveSlide(int from, int to)
{
    if (!m_order.move(from, to)) {
        return false;
    }
    emit slidesChanged();
    m_sync->resync();
    return true;
}

QImage PresentationSession::thumbnail(int position) const
{
    return m_images.image(m_order.slideIdAt(position), SlideImageCache::Kind::Thumbnail);
}

QString PresentationSession::slideLabel(int position) const
{
    const int slideId = m_order.slideIdAt(position);
    if (slideId < 0) {
        return QString();
    }
    const SlideSource source = m_registry.resolve(slideId);
    return tr("#%1 (Page %2)").arg(position + 1).arg(source.pageIndex + 1);
}

// ============================================================================
// Navigation
// ============================================================================

bool PresentationSession::jumpTo(int position)
{
    return m_sync->jumpTo(position);
}

bool PresentationSession::next()
{
    return m_sync->next();
}

bool PresentationSession::previous()
{
    return m_sync->previous();
}

void PresentationSession::onSyncSlideChanged(int position, int slideId)
{
    emit currentSlideChanged(position, slideId);
    emit currentNotesChanged(m_notes.note(slideId));
}

// ============================================================================
// Notes
// ============================================================================

QString PresentationSession::currentNotes() const
{
    return m_notes.note(m_order.currentSlideId());
}

void PresentationSession::setCurrentNotes(const QString& text)
{
    const int slideId = m_order.currentSlideId();
    if (slideId < 0 || m_notes.note(slideId) == text) {
        return;
    }
    m_notes.setNote(slideId, text);
    m_notesModified = true;
}

bool PresentationSession::saveNotes(QString* errorMsg)
{
    if (m_primaryPath.isEmpty()) {
        if (errorMsg) *errorMsg = tr("No document loaded.");
        return false;
    }
    if (!m_notes.save(m_primaryPath)) {
        if (errorMsg) {
            *errorMsg = tr("Could not write notes file %1")
                            .arg(NotesStore::notesPathFor(m_primaryPath));
        }
        return false;
    }
    m_notesModified = false;
    return true;
}

// ============================================================================
// Export
// ============================================================================

PdfExportResult PresentationSession::exportPdf(const PdfExportOptions& options)
{
    PdfExportOptions effective = options;
    if (effective.title.isEmpty()) {
        effective.title = title();
    }
    return m_exporter.exportPdf(effective);
}

// ============================================================================
// Presentation Mode
// ============================================================================

int PresentationSession::renderProjectionImages(int targetWidth)
{
    if (targetWidth <= 0) {
        targetWidth = m_settings.fallbackProjectionWidth;
    }
    const int rendered = m_images.renderProjectionImages(m_order.slideIds(), targetWidth);

    // Tall/short status may have changed
    m_sync->resync();
    return rendered;
}

void PresentationSession::enterPresentationMode(int targetWidth)
{
    if (m_order.isEmpty()) {
        qWarning() << "PresentationSession: Nothing to present";
        return;
    }

    renderProjectionImages(targetWidth);
    m_presenting = true;
    m_sync->jumpTo(m_order.currentPosition());

    qInfo() << "PresentationSession: Presentation started with" << m_order.count() << "slides";
    emit presentationModeChanged(true);
}

void PresentationSession::leavePresentationMode()
{
    if (!m_presenting) {
        return;
    }
    m_presenting = false;
    m_timer->stop();
    m_images.clear(SlideImageCache::Kind::Projection);

    qInfo() << "PresentationSession: Presentation ended";
    emit presentationModeChanged(false);
}
