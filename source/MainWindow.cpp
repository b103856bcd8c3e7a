#include "MainWindow.h"
#include "core/PresentationSession.h"
#include "core/PresenterSettings.h"
#include "pdf/MuPdfExporter.h"
#include "ui/PresenterWindow.h"
#include "ui/SlideOrganizer.h"
#include "ui/sidebars/FolderBrowserPanel.h"

#include <QAction>
#include <QCloseEvent>
#include <QDebug>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QLocale>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QProgressDialog>
#include <QSplitter>
#include <QStatusBar>
#include <QToolBar>
#include <QUrl>

// ============================================================================
// Constructor / Destructor
// ============================================================================

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
{
    m_session = new PresentationSession(PresenterSettings::loadDefault(), this);

    setupUi();
    setupActions();
    setupMenus();
    setupConnections();

    setAcceptDrops(true);
    updateActions();
    updateWindowTitle();
    resize(1200, 800);
}

MainWindow::~MainWindow()
{
    // Presenter window must not outlive the session it shows
    delete m_presenter;
}

// ============================================================================
// Setup
// ============================================================================

void MainWindow::setupUi()
{
    m_folderPanel = new FolderBrowserPanel(this);
    m_organizer = new SlideOrganizer(this);
    m_organizer->setSession(m_session);

    QSplitter* splitter = new QSplitter(Qt::Horizontal, this);
    splitter->addWidget(m_folderPanel);
    splitter->addWidget(m_organizer);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 4);
    setCentralWidget(splitter);

    const QString lastDirectory = m_session->settings().lastDirectory;
    if (!lastDirectory.isEmpty()) {
        m_folderPanel->setRootFolder(lastDirectory);
    }

    m_slideCountLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_slideCountLabel);
}

void MainWindow::setupActions()
{
    m_importAction = new QAction(tr("&Import PDF..."), this);
    m_importAction->setShortcut(QKeySequence::Open);
    connect(m_importAction, &QAction::triggered, this, &MainWindow::showImportDialog);

    m_openFolderAction = new QAction(tr("Open &Folder..."), this);
    m_openFolderAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_O));
    connect(m_openFolderAction, &QAction::triggered, this, &MainWindow::showOpenFolderDialog);

    m_removeAction = new QAction(tr("&Remove Slide"), this);
    connect(m_removeAction, &QAction::triggered, this, &MainWindow::removeSelectedSlide);

    m_exportAction = new QAction(tr("&Export PDF..."), this);
    m_exportAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_E));
    connect(m_exportAction, &QAction::triggered, this, &MainWindow::exportPdf);

    m_saveNotesAction = new QAction(tr("&Save Notes"), this);
    m_saveNotesAction->setShortcut(QKeySequence::Save);
    connect(m_saveNotesAction, &QAction::triggered, this, &MainWindow::saveNotes);

    m_presentAction = new QAction(tr("&Present"), this);
    m_presentAction->setShortcut(QKeySequence(Qt::Key_F5));
    connect(m_presentAction, &QAction::triggered, this, &MainWindow::startPresentation);

    m_quitAction = new QAction(tr("&Quit"), this);
    m_quitAction->setShortcut(QKeySequence::Quit);
    connect(m_quitAction, &QAction::triggered, this, &QWidget::close);
}

void MainWindow::setupMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(m_importAction);
    fileMenu->addAction(m_openFolderAction);
    m_recentMenu = fileMenu->addMenu(tr("Recent Imports"));
    fileMenu->addSeparator();
    fileMenu->addAction(m_exportAction);
    fileMenu->addAction(m_saveNotesAction);
    fileMenu->addSeparator();
    fileMenu->addAction(m_quitAction);

    QMenu* slidesMenu = menuBar()->addMenu(tr("&Slides"));
    slidesMenu->addAction(m_removeAction);
    slidesMenu->addSeparator();
    slidesMenu->addAction(m_presentAction);

    QToolBar* toolbar = addToolBar(tr("Main"));
    toolbar->setObjectName("mainToolbar");
    toolbar->setMovable(false);
    toolbar->addAction(m_importAction);
    toolbar->addAction(m_openFolderAction);
    toolbar->addSeparator();
    toolbar->addAction(m_removeAction);
    toolbar->addAction(m_exportAction);
    toolbar->addAction(m_saveNotesAction);
    toolbar->addSeparator();
    toolbar->addAction(m_presentAction);

    updateRecentMenu();
}

void MainWindow::setupConnections()
{
    connect(m_session, &PresentationSession::slidesChanged,
            this, &MainWindow::onSlidesChanged);
    connect(m_session, &PresentationSession::importFailed,
            this, &MainWindow::onImportFailed);
    connect(m_session, &PresentationSession::currentNotesChanged,
            this, &MainWindow::updateActions);
    connect(m_session, &PresentationSession::presentationModeChanged,
            this, &MainWindow::updateActions);

    connect(m_organizer, &SlideOrganizer::slideClicked,
            m_session, &PresentationSession::jumpTo);
    connect(m_organizer, &SlideOrganizer::slideDropped,
            m_session, &PresentationSession::moveSlide);
    connect(m_organizer, &SlideOrganizer::removeRequested,
            this, &MainWindow::removeSlide);
    connect(m_organizer, &SlideOrganizer::filesDropped,
            this, &MainWindow::importFiles);

    connect(m_folderPanel, &FolderBrowserPanel::filesActivated,
            this, &MainWindow::importFiles);
}

// ============================================================================
// Import
// ============================================================================

void MainWindow::importFiles(const QStringList& paths)
{
    if (paths.isEmpty()) {
        return;
    }

    const ImportReport report = m_session->importFiles(paths);

    if (!report.importedFiles.isEmpty()) {
        statusBar()->showMessage(tr("Imported %n slide(s)", nullptr, int(report.addedSlideIds.size())), 5000);
        m_session->settings().lastDirectory = QFileInfo(report.importedFiles.last()).absolutePath();
        m_session->settings().saveDefault();
        updateRecentMenu();
    }

    if (!report.notesError.isEmpty()) {
        QMessageBox::warning(this, tr("Notes"),
                             tr("The notes file could not be read:\n%1").arg(report.notesError));
    }
}

void MainWindow::onImportFailed(const QStringList& files, const QStringList& messages)
{
    QStringList lines;
    for (int i = 0; i < files.size(); ++i) {
        const QString message = i < messages.size() ? messages.at(i) : QString();
        lines << QString("%1: %2").arg(QFileInfo(files.at(i)).fileName(), message);
    }
    QMessageBox::warning(this, tr("Import Failed"),
                         tr("Some files could not be imported:\n\n%1").arg(lines.join("\n")));
}

void MainWindow::showImportDialog()
{
    const QStringList paths = QFileDialog::getOpenFileNames(
        this, tr("Import PDF"), m_session->settings().lastDirectory,
        tr("PDF Files (*.pdf)"));
    importFiles(paths);
}

void MainWindow::showOpenFolderDialog()
{
    const QString folder = QFileDialog::getExistingDirectory(
        this, tr("Open Folder"), m_session->settings().lastDirectory);
    if (folder.isEmpty()) {
        return;
    }

    if (m_folderPanel->setRootFolder(folder)) {
        m_session->settings().lastDirectory = folder;
        m_session->settings().saveDefault();
    }
}

void MainWindow::updateRecentMenu()
{
    m_recentMenu->clear();

    const QStringList recent = m_session->settings().recentImports;
    for (const QString& path : recent) {
        QAction* action = m_recentMenu->addAction(QFileInfo(path).fileName());
        action->setToolTip(path);
        connect(action, &QAction::triggered, this, [this, path]() {
            importFiles(QStringList{path});
        });
    }
    m_recentMenu->setEnabled(!recent.isEmpty());
}

// ============================================================================
// Slides
// ============================================================================

void MainWindow::removeSlide(int position)
{
    if (m_session->slideCount() <= 1) {
        statusBar()->showMessage(tr("The last slide cannot be removed"), 5000);
        return;
    }
    if (!m_session->removeSlide(position)) {
        qWarning() << "MainWindow: Could not remove slide at position" << position;
    }
}

void MainWindow::removeSelectedSlide()
{
    int position = m_organizer->selectedPosition();
    if (position < 0) {
        position = m_session->currentPosition();
    }
    removeSlide(position);
}

void MainWindow::onSlidesChanged()
{
    updateActions();
    updateWindowTitle();
}

// ============================================================================
// Export / Notes
// ============================================================================

void MainWindow::exportPdf()
{
    const int count = m_session->slideCount();
    if (count == 0) {
        QMessageBox::information(this, tr("Export PDF"), tr("There are no slides to export."));
        return;
    }

    QString defaultName = m_session->title();
    if (defaultName.isEmpty()) {
        defaultName = "presentation";
    }
    QString exportPath = QFileDialog::getSaveFileName(
        this, tr("Export PDF"),
        m_session->settings().lastDirectory + "/" + defaultName + "_arranged.pdf",
        tr("PDF Files (*.pdf)"));
    if (exportPath.isEmpty()) {
        return;
    }
    if (!exportPath.endsWith(".pdf", Qt::CaseInsensitive)) {
        exportPath += ".pdf";
    }

    bool ok = false;
    const QString range = QInputDialog::getText(
        this, tr("Export PDF"),
        tr("Slides to export (e.g. 1-5, 8), empty for all %1:").arg(count),
        QLineEdit::Normal, QString(), &ok).trimmed();
    if (!ok) {
        return;
    }
    if (!range.isEmpty() && MuPdfExporter::parsePageRange(range, count).isEmpty()) {
        QMessageBox::warning(this, tr("Export PDF"), tr("Invalid slide range: %1").arg(range));
        return;
    }

    PdfExportOptions options;
    options.outputPath = exportPath;
    options.slideRange = range;

    QProgressDialog progress(tr("Exporting slides..."), tr("Cancel"), 0, count, this);
    progress.setWindowModality(Qt::WindowModal);
    progress.setMinimumDuration(500);
    QMetaObject::Connection progressConnection = connect(
        m_session, &PresentationSession::exportProgress, &progress,
        [&progress](int current, int total) {
            progress.setMaximum(total);
            progress.setValue(current);
        });
    connect(&progress, &QProgressDialog::canceled, m_session, &PresentationSession::cancelExport);

    const PdfExportResult result = m_session->exportPdf(options);
    disconnect(progressConnection);
    progress.reset();

    if (result.success) {
        statusBar()->showMessage(
            tr("Exported %1 slides (%2)").arg(result.pagesExported)
                .arg(QLocale().formattedDataSize(result.fileSizeBytes)), 5000);
        QMessageBox::information(this, tr("Export Complete"),
                                 tr("Exported %1 slides to:\n%2").arg(result.pagesExported).arg(exportPath));
    } else if (result.cancelled) {
        statusBar()->showMessage(tr("Export cancelled"), 3000);
    } else {
        QMessageBox::critical(this, tr("Export Failed"), result.errorMessage);
    }
}

void MainWindow::saveNotes()
{
    QString error;
    if (m_session->saveNotes(&error)) {
        statusBar()->showMessage(tr("Notes saved"), 3000);
    } else {
        QMessageBox::warning(this, tr("Save Notes"), tr("Could not save notes:\n%1").arg(error));
    }
    updateActions();
}

bool MainWindow::confirmUnsavedNotes()
{
    if (!m_session->hasUnsavedNotes()) {
        return true;
    }

    const QMessageBox::StandardButton answer = QMessageBox::question(
        this, tr("Unsaved Notes"),
        tr("The notes have been changed. Save them?"),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
        QMessageBox::Save);

    if (answer == QMessageBox::Cancel) {
        return false;
    }
    if (answer == QMessageBox::Save) {
        QString error;
        if (!m_session->saveNotes(&error)) {
            QMessageBox::warning(this, tr("Save Notes"), tr("Could not save notes:\n%1").arg(error));
            return false;
        }
    }
    return true;
}

// ============================================================================
// Presentation
// ============================================================================

void MainWindow::startPresentation()
{
    if (m_presenter) {
        m_presenter->raise();
        m_presenter->activateWindow();
        return;
    }

    if (m_session->slideCount() == 0) {
        QMessageBox::information(this, tr("Present"), tr("Import a PDF before presenting."));
        return;
    }

    m_presenter = new PresenterWindow(m_session);
    m_presenter->setAttribute(Qt::WA_DeleteOnClose);
    connect(m_presenter, &PresenterWindow::presentationEnded, this, &MainWindow::updateActions);
    m_presenter->start();

    if (!m_session->isPresenting()) {
        m_presenter->close();
    }
}

// ============================================================================
// State
// ============================================================================

void MainWindow::updateActions()
{
    const int count = m_session->slideCount();
    m_removeAction->setEnabled(count > 1);
    m_exportAction->setEnabled(count > 0);
    m_presentAction->setEnabled(count > 0 && !m_session->isPresenting());
    m_saveNotesAction->setEnabled(!m_session->primaryDocumentPath().isEmpty());
    m_slideCountLabel->setText(tr("%n slide(s)", nullptr, count));
}

void MainWindow::updateWindowTitle()
{
    const QString title = m_session->title();
    setWindowTitle(title.isEmpty() ? QString("PdfPresenter")
                                   : QString("%1 - PdfPresenter").arg(title));
}

// ============================================================================
// Events
// ============================================================================

QStringList MainWindow::pdfPathsFromMimeData(const QMimeData* mimeData)
{
    QStringList paths;
    if (!mimeData || !mimeData->hasUrls()) {
        return paths;
    }
    for (const QUrl& url : mimeData->urls()) {
        if (url.isLocalFile() && url.toLocalFile().endsWith(".pdf", Qt::CaseInsensitive)) {
            paths.append(url.toLocalFile());
        }
    }
    return paths;
}

void MainWindow::dragEnterEvent(QDragEnterEvent* event)
{
    if (!pdfPathsFromMimeData(event->mimeData()).isEmpty()) {
        event->acceptProposedAction();
    }
}

void MainWindow::dropEvent(QDropEvent* event)
{
    const QStringList paths = pdfPathsFromMimeData(event->mimeData());
    if (paths.isEmpty()) {
        return;
    }
    event->acceptProposedAction();
    importFiles(paths);
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    if (m_presenter) {
        m_presenter->close();
        if (m_presenter && m_presenter->isVisible()) {
            event->ignore();
            return;
        }
    }

    if (!confirmUnsavedNotes()) {
        event->ignore();
        return;
    }

    m_session->settings().saveDefault();
    event->accept();
}
