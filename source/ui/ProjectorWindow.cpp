#include "ProjectorWindow.h"
#include "../core/PresentationSession.h"
#include "../core/PresentationSync.h"

#include <QCloseEvent>
#include <QDebug>
#include <QKeyEvent>
#include <QTimer>

ProjectorWindow::ProjectorWindow(PresentationSession* session, QWidget* parent)
    : SlideView(session, parent)
{
    setWindowFlag(Qt::Window, true);
    setBackgroundColor(Qt::black);
    setCursor(Qt::BlankCursor);
    setFocusPolicy(Qt::StrongFocus);

    if (m_session) {
        setWindowTitle(tr("Projector - %1").arg(m_session->title()));
    }

    // Re-render once resizing settles
    m_resizeTimer = new QTimer(this);
    m_resizeTimer->setSingleShot(true);
    m_resizeTimer->setInterval(RESIZE_RENDER_DELAY_MS);
    connect(m_resizeTimer, &QTimer::timeout, this, &ProjectorWindow::onResizeSettled);
}

void ProjectorWindow::toggleFullScreen()
{
    if (isFullScreen()) {
        showNormal();
    } else {
        showFullScreen();
    }
}

// ============================================================================
// Events
// ============================================================================

void ProjectorWindow::resizeEvent(QResizeEvent* event)
{
    SlideView::resizeEvent(event);
    if (m_session) {
        m_session->sync()->setViewportSize(size());
    }
    m_resizeTimer->start();
}

void ProjectorWindow::onResizeSettled()
{
    if (!m_session || !m_session->isPresenting()) {
        return;
    }
    if (m_session->images().projectionWidth() != width()) {
        qDebug() << "ProjectorWindow: Re-rendering slides at width" << width();
        m_session->renderProjectionImages(width());
    }
}

void ProjectorWindow::keyPressEvent(QKeyEvent* event)
{
    if (!m_session) {
        SlideView::keyPressEvent(event);
        return;
    }

    switch (event->key()) {
        case Qt::Key_F:
        case Qt::Key_F11:
            toggleFullScreen();
            break;
        case Qt::Key_Escape:
        case Qt::Key_Q:
            emit closeRequested();
            break;
        case Qt::Key_Right:
        case Qt::Key_Down:
        case Qt::Key_PageDown:
        case Qt::Key_Space:
            m_session->next();
            break;
        case Qt::Key_Left:
        case Qt::Key_Up:
        case Qt::Key_PageUp:
        case Qt::Key_Backspace:
            m_session->previous();
            break;
        case Qt::Key_Home:
            m_session->jumpTo(0);
            break;
        case Qt::Key_End:
            m_session->jumpTo(m_session->slideCount() - 1);
            break;
        default:
            SlideView::keyPressEvent(event);
            return;
    }
    event->accept();
}

void ProjectorWindow::mouseDoubleClickEvent(QMouseEvent* event)
{
    Q_UNUSED(event);
    toggleFullScreen();
}

void ProjectorWindow::closeEvent(QCloseEvent* event)
{
    // The presenter window decides when the projector goes away
    event->ignore();
    emit closeRequested();
}
