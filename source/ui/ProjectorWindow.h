#ifndef PROJECTORWINDOW_H
#define PROJECTORWINDOW_H

#include "SlideView.h"

class QTimer;

/**
 * @brief Audience-facing window showing only the current slide.
 *
 * Its size is the viewport PresentationSync uses to decide which slides
 * are tall. When the window is resized the projection images are
 * re-rendered at the new width once resizing settles.
 *
 * Keys: F / F11 toggle full screen, Esc / Q end the presentation,
 * arrows, PageUp/PageDown and Space navigate.
 */
class ProjectorWindow : public SlideView {
    Q_OBJECT

public:
    explicit ProjectorWindow(PresentationSession* session, QWidget* parent = nullptr);

    /**
     * @brief Toggle between full screen and a normal window.
     */
    void toggleFullScreen();

signals:
    /**
     * @brief User asked to end the presentation (Esc / Q / window closed).
     */
    void closeRequested();

protected:
    void resizeEvent(QResizeEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onResizeSettled();

private:
    QTimer* m_resizeTimer = nullptr;

    static constexpr int RESIZE_RENDER_DELAY_MS = 250;
};

#endif // PROJECTORWINDOW_H
