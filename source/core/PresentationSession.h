#pragma once

// ============================================================================
// PresentationSession - Owns the slide model of one running application
// ============================================================================
// The session is the single context object the windows talk to. It owns:
// - PageRegistry     open PDFs and slide id allocation
// - SlideOrder       presentation sequence and current position
// - NotesStore       speaker notes of the primary document
// - SlideImageCache  thumbnails and projection images
// - PresentationSync shared presenter/projector navigation state
// - PauseableTimer   presentation stopwatch
//
// All operations run on the UI thread. Invalid positions are ignored (the
// call returns false); load and export errors are returned to the caller and
// also emitted as signals for the UI.
// ============================================================================

#include "NotesStore.h"
#include "PageRegistry.h"
#include "PresenterSettings.h"
#include "SlideImageCache.h"
#include "SlideOrder.h"
#include "../pdf/MuPdfExporter.h"

#include <QImage>
#include <QObject>
#include <QStringList>
#include <QVector>

class PauseableTimer;
class PresentationSync;

/**
 * @brief Outcome of a (possibly partial) batch import.
 */
struct ImportReport {
    QVector<int> addedSlideIds;     ///< New slide ids, in presentation order
    QStringList importedFiles;      ///< Files that contributed slides
    QStringList failedFiles;        ///< Files that could not be opened
    QStringList errorMessages;      ///< Reason per entry of failedFiles
    QString notesError;             ///< Set if the notes sidecar was unreadable

    bool hasFailures() const { return !failedFiles.isEmpty(); }
};

class PresentationSession : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Session opening PDFs with the backend named in @p settings.
     */
    explicit PresentationSession(const PresenterSettings& settings = PresenterSettings(),
                                 QObject* parent = nullptr);

    /**
     * @brief Session with a custom provider factory (mock providers in tests).
     */
    PresentationSession(PageRegistry::ProviderFactory factory,
                        const PresenterSettings& settings = PresenterSettings(),
                        QObject* parent = nullptr);

    ~PresentationSession() override;

    // ===== Collaborators =====

    const PageRegistry& registry() const { return m_registry; }
    const SlideOrder& slideOrder() const { return m_order; }
    const NotesStore& notes() const { return m_notes; }
    const SlideImageCache& images() const { return m_images; }
    PresentationSync* sync() const { return m_sync; }
    PauseableTimer* timer() const { return m_timer; }
    PresenterSettings& settings() { return m_settings; }
    const PresenterSettings& settings() const { return m_settings; }

    // ===== Import =====

    /**
     * @brief Import every page of each file, in order.
     * @param paths Local paths or file:// URLs.
     * @return What was added and which files failed. A failing file never
     *         stops the rest of the batch.
     */
    ImportReport importFiles(const QStringList& paths);

    /**
     * @brief Convert a file:// URL to a local path; other input is returned as is.
     */
    static QString localPathFromInput(const QString& input);

    /**
     * @brief The first successfully imported PDF; holds the notes sidecar.
     */
    QString primaryDocumentPath() const { return m_primaryPath; }

    /**
     * @brief Title for windows and export metadata.
     */
    QString title() const;

    // ===== Slide Order =====

    int slideCount() const { return m_order.count(); }
    int currentPosition() const { return m_order.currentPosition(); }
    int currentSlideId() const { return m_order.currentSlideId(); }

    bool removeSlide(int position);
    bool moveSlide(int from, int to);

    /**
     * @brief Thumbnail of the slide at a position (null if not rendered).
     */
    QImage thumbnail(int position) const;

    /**
     * @brief Organizer label: "#<position> (Page <source page>)", both 1-based.
     */
    QString slideLabel(int position) const;

    // ===== Navigation =====

    bool jumpTo(int position);
    bool next();
    bool previous();

    // ===== Notes =====

    QString currentNotes() const;
    void setCurrentNotes(const QString& text);
    bool hasUnsavedNotes() const { return m_notesModified; }

    /**
     * @brief Write notes to "<primary document>.notes".
     * @param errorMsg Filled on failure.
     */
    bool saveNotes(QString* errorMsg = nullptr);

    // ===== Export =====

    /**
     * @brief Export the current slide order to a new PDF.
     *
     * The title option defaults to title() when empty.
     */
    PdfExportResult exportPdf(const PdfExportOptions& options);

    /// Stop a running export after the current page (from a progress handler).
    void cancelExport() { m_exporter.cancel(); }

    // ===== Presentation Mode =====

    /**
     * @brief Render projection images and reset navigation to the top of
     *        the current slide.
     * @param targetWidth Projector width; the configured fallback is used
     *        when <= 0.
     */
    void enterPresentationMode(int targetWidth);
    void leavePresentationMode();
    bool isPresenting() const { return m_presenting; }

    /**
     * @brief Re-render projection images, e.g. after the projector resized.
     * @return Number of slides rendered.
     */
    int renderProjectionImages(int targetWidth);

signals:
    void slidesChanged();
    void currentSlideChanged(int position, int slideId);
    void currentNotesChanged(const QString& text);
    void importFailed(const QStringList& files, const QStringList& messages);
    void presentationModeChanged(bool presenting);
    void exportProgress(int current, int total);

private slots:
    void onSyncSlideChanged(int position, int slideId);

private:
    void init();

    PresenterSettings m_settings;
    PageRegistry m_registry;
    SlideOrder m_order;
    NotesStore m_notes;
    SlideImageCache m_images;
    MuPdfExporter m_exporter;
    PresentationSync* m_sync = nullptr;
    PauseableTimer* m_timer = nullptr;

    QString m_primaryPath;
    bool m_presenting = false;
    bool m_notesModified = false;
};
