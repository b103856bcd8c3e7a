#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QPointer>

class QAction;
class QLabel;
class QMenu;
class QMimeData;
class FolderBrowserPanel;
class PresentationSession;
class PresenterWindow;
class SlideOrganizer;

/**
 * @brief Organizer window: import PDFs, arrange slides, export, present.
 *
 * Layout: folder browser on the left, slide grid in the center. PDF files
 * can be imported from the file dialog, the folder browser, the recent
 * list, or by dropping them on the window.
 *
 * Owns the PresentationSession shared by all windows.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    PresentationSession* session() const { return m_session; }

    /**
     * @brief Import PDF files (paths or file:// URLs) and report failures.
     */
    void importFiles(const QStringList& paths);

public slots:
    void showImportDialog();
    void showOpenFolderDialog();
    void removeSlide(int position);
    void removeSelectedSlide();
    void exportPdf();
    void saveNotes();
    void startPresentation();

protected:
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dropEvent(QDropEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onSlidesChanged();
    void onImportFailed(const QStringList& files, const QStringList& messages);
    void updateRecentMenu();

private:
    void setupUi();
    void setupActions();
    void setupMenus();
    void setupConnections();
    void updateActions();
    void updateWindowTitle();
    bool confirmUnsavedNotes();
    static QStringList pdfPathsFromMimeData(const QMimeData* mimeData);

    PresentationSession* m_session = nullptr;
    SlideOrganizer* m_organizer = nullptr;
    FolderBrowserPanel* m_folderPanel = nullptr;
    QPointer<PresenterWindow> m_presenter;

    QAction* m_importAction = nullptr;
    QAction* m_openFolderAction = nullptr;
    QAction* m_removeAction = nullptr;
    QAction* m_exportAction = nullptr;
    QAction* m_saveNotesAction = nullptr;
    QAction* m_presentAction = nullptr;
    QAction* m_quitAction = nullptr;
    QMenu* m_recentMenu = nullptr;
    QLabel* m_slideCountLabel = nullptr;
};

#endif // MAINWINDOW_H
