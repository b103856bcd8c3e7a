#ifndef PRESENTERWINDOW_H
#define PRESENTERWINDOW_H

#include <QWidget>

class QLabel;
class QPlainTextEdit;
class QPushButton;
class QScreen;
class PresentationSession;
class ProjectorWindow;
class SlideView;

/**
 * @brief Speaker-facing window of a running presentation.
 *
 * Shows the current slide as the audience sees it, the next slide, the
 * elapsed time with start/pause/reset controls, and an editable notes
 * field for the current slide. Owns the ProjectorWindow.
 *
 * Creating the window puts the session into presentation mode; closing it
 * ends presentation mode and closes the projector.
 */
class PresenterWindow : public QWidget {
    Q_OBJECT

public:
    explicit PresenterWindow(PresentationSession* session, QWidget* parent = nullptr);
    ~PresenterWindow() override;

    /**
     * @brief Render the projection set and show both windows.
     *
     * The projector goes full screen on a secondary screen when one is
     * available, otherwise it opens as a normal window.
     */
    void start();

    ProjectorWindow* projector() const { return m_projector; }

signals:
    /**
     * @brief Presentation ended (window closed).
     */
    void presentationEnded();

protected:
    void keyPressEvent(QKeyEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onCurrentSlideChanged(int position, int slideId);
    void onCurrentNotesChanged(const QString& text);
    void onNotesEdited();
    void onTimeChanged(const QString& text);
    void onRunningChanged(bool running);
    void onTimerButtonClicked();
    void saveNotes();

private:
    void setupUI();
    void setupConnections();
    void updateSlideInfo();
    QScreen* projectorScreen() const;

    PresentationSession* m_session = nullptr;  ///< Not owned
    ProjectorWindow* m_projector = nullptr;     ///< Owned (child window)

    SlideView* m_preview = nullptr;
    QLabel* m_nextSlideLabel = nullptr;
    QLabel* m_slideCounterLabel = nullptr;
    QLabel* m_timeLabel = nullptr;
    QPushButton* m_timerButton = nullptr;
    QPushButton* m_resetButton = nullptr;
    QPushButton* m_previousButton = nullptr;
    QPushButton* m_nextButton = nullptr;
    QPushButton* m_saveNotesButton = nullptr;
    QPlainTextEdit* m_notesEdit = nullptr;

    static constexpr int NEXT_PREVIEW_WIDTH = 240;
};

#endif // PRESENTERWINDOW_H
