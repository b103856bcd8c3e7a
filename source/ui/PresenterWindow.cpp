#include "PresenterWindow.h"
#include "ProjectorWindow.h"
#include "SlideView.h"
#include "../core/PauseableTimer.h"
#include "../core/PresentationSession.h"
#include "../core/PresentationSync.h"

#include <QCloseEvent>
#include <QDebug>
#include <QGuiApplication>
#include <QHBoxLayout>
#include <QKeyEvent>
#include <QLabel>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QScreen>
#include <QShortcut>
#include <QSignalBlocker>
#include <QSplitter>
#include <QVBoxLayout>

// ============================================================================
// Constructor / Destructor
// ============================================================================

PresenterWindow::PresenterWindow(PresentationSession* session, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
{
    setWindowFlag(Qt::Window, true);
    setWindowTitle(tr("Presenter - %1").arg(m_session->title()));

    m_projector = new ProjectorWindow(m_session, this);

    setupUI();
    setupConnections();
}

PresenterWindow::~PresenterWindow()
{
    // Projector is a child window, deleted with us
}

// ============================================================================
// Setup
// ============================================================================

void PresenterWindow::setupUI()
{
    // Left: what the audience sees
    m_preview = new SlideView(m_session, this);
    m_preview->setBackgroundColor(QColor(30, 30, 30));

    // Right: next slide, timer, navigation
    QWidget* sidePanel = new QWidget(this);
    QVBoxLayout* sideLayout = new QVBoxLayout(sidePanel);

    QLabel* nextTitle = new QLabel(tr("Next"), sidePanel);
    m_nextSlideLabel = new QLabel(sidePanel);
    m_nextSlideLabel->setFixedWidth(NEXT_PREVIEW_WIDTH);
    m_nextSlideLabel->setMinimumHeight(NEXT_PREVIEW_WIDTH * 3 / 4);
    m_nextSlideLabel->setAlignment(Qt::AlignHCenter | Qt::AlignTop);
    m_nextSlideLabel->setStyleSheet("QLabel { background-color: #1e1e1e; color: #a0a0a0; }");

    m_timeLabel = new QLabel(PauseableTimer::formatTime(0), sidePanel);
    QFont timeFont = m_timeLabel->font();
    timeFont.setPointSize(36);
    timeFont.setBold(true);
    m_timeLabel->setFont(timeFont);
    m_timeLabel->setAlignment(Qt::AlignCenter);

    m_timerButton = new QPushButton(tr("Start"), sidePanel);
    m_resetButton = new QPushButton(tr("Reset"), sidePanel);
    QHBoxLayout* timerButtons = new QHBoxLayout();
    timerButtons->addWidget(m_timerButton);
    timerButtons->addWidget(m_resetButton);

    m_slideCounterLabel = new QLabel(sidePanel);
    m_slideCounterLabel->setAlignment(Qt::AlignCenter);

    m_previousButton = new QPushButton(tr("Previous"), sidePanel);
    m_nextButton = new QPushButton(tr("Next"), sidePanel);
    QHBoxLayout* navButtons = new QHBoxLayout();
    navButtons->addWidget(m_previousButton);
    navButtons->addWidget(m_nextButton);

    // Buttons must not steal the arrow keys
    for (QPushButton* button : {m_timerButton, m_resetButton, m_previousButton, m_nextButton}) {
        button->setFocusPolicy(Qt::NoFocus);
    }

    sideLayout->addWidget(nextTitle);
    sideLayout->addWidget(m_nextSlideLabel);
    sideLayout->addSpacing(12);
    sideLayout->addWidget(m_timeLabel);
    sideLayout->addLayout(timerButtons);
    sideLayout->addSpacing(12);
    sideLayout->addWidget(m_slideCounterLabel);
    sideLayout->addLayout(navButtons);
    sideLayout->addStretch();

    QWidget* top = new QWidget(this);
    QHBoxLayout* topLayout = new QHBoxLayout(top);
    topLayout->setContentsMargins(0, 0, 0, 0);
    topLayout->addWidget(m_preview, 1);
    topLayout->addWidget(sidePanel);

    // Bottom: notes
    QWidget* notesPanel = new QWidget(this);
    QVBoxLayout* notesLayout = new QVBoxLayout(notesPanel);
    notesLayout->setContentsMargins(0, 0, 0, 0);
    QHBoxLayout* notesHeader = new QHBoxLayout();
    notesHeader->addWidget(new QLabel(tr("Notes"), notesPanel));
    notesHeader->addStretch();
    m_saveNotesButton = new QPushButton(tr("Save Notes"), notesPanel);
    m_saveNotesButton->setFocusPolicy(Qt::NoFocus);
    notesHeader->addWidget(m_saveNotesButton);
    m_notesEdit = new QPlainTextEdit(notesPanel);
    m_notesEdit->setPlaceholderText(tr("Notes for this slide"));
    QFont notesFont = m_notesEdit->font();
    notesFont.setPointSize(14);
    m_notesEdit->setFont(notesFont);
    notesLayout->addLayout(notesHeader);
    notesLayout->addWidget(m_notesEdit);

    QSplitter* splitter = new QSplitter(Qt::Vertical, this);
    splitter->addWidget(top);
    splitter->addWidget(notesPanel);
    splitter->setStretchFactor(0, 3);
    splitter->setStretchFactor(1, 1);

    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->addWidget(splitter);

    m_notesEdit->setPlainText(m_session->currentNotes());
    updateSlideInfo();
    onRunningChanged(m_session->timer()->isRunning());
    m_timeLabel->setText(m_session->timer()->elapsedText());

    resize(1200, 800);
}

void PresenterWindow::setupConnections()
{
    connect(m_session, &PresentationSession::currentSlideChanged,
            this, &PresenterWindow::onCurrentSlideChanged);
    connect(m_session, &PresentationSession::currentNotesChanged,
            this, &PresenterWindow::onCurrentNotesChanged);
    connect(m_session, &PresentationSession::slidesChanged,
            this, &PresenterWindow::updateSlideInfo);
    connect(m_session->sync(), &PresentationSync::verticalOffsetChanged,
            this, &PresenterWindow::updateSlideInfo);

    PauseableTimer* timer = m_session->timer();
    connect(timer, &PauseableTimer::timeChanged, this, &PresenterWindow::onTimeChanged);
    connect(timer, &PauseableTimer::runningChanged, this, &PresenterWindow::onRunningChanged);
    connect(m_timerButton, &QPushButton::clicked, this, &PresenterWindow::onTimerButtonClicked);
    connect(m_resetButton, &QPushButton::clicked, timer, &PauseableTimer::reset);

    connect(m_previousButton, &QPushButton::clicked, m_session, &PresentationSession::previous);
    connect(m_nextButton, &QPushButton::clicked, m_session, &PresentationSession::next);

    connect(m_notesEdit, &QPlainTextEdit::textChanged, this, &PresenterWindow::onNotesEdited);
    connect(m_saveNotesButton, &QPushButton::clicked, this, &PresenterWindow::saveNotes);
    new QShortcut(QKeySequence::Save, this, this, &PresenterWindow::saveNotes);

    connect(m_projector, &ProjectorWindow::closeRequested, this, &QWidget::close);
}

// ============================================================================
// Presentation
// ============================================================================

QScreen* PresenterWindow::projectorScreen() const
{
    const QList<QScreen*> screens = QGuiApplication::screens();
    QScreen* primary = QGuiApplication::primaryScreen();
    for (QScreen* screen : screens) {
        if (screen != primary) {
            return screen;
        }
    }
    return primary;
}

void PresenterWindow::start()
{
    QScreen* screen = projectorScreen();
    const bool dedicatedScreen = screen && screen != QGuiApplication::primaryScreen();

    // Render at the width the projector will have
    const int targetWidth = dedicatedScreen ? screen->geometry().width() : 0;
    m_session->enterPresentationMode(targetWidth);
    if (!m_session->isPresenting()) {
        qWarning() << "PresenterWindow: Presentation could not start";
        return;
    }

    if (dedicatedScreen) {
        m_projector->setGeometry(screen->geometry());
        m_projector->showFullScreen();
    } else {
        // Single screen: a window the user can drag to the projector
        const int width = m_session->settings().fallbackProjectionWidth;
        m_projector->resize(qMin(width, 1024), qMin(width, 1024) * 3 / 4);
        m_projector->show();
    }

    show();
    raise();
    activateWindow();
    setFocus();
}

// ============================================================================
// Slots
// ============================================================================

void PresenterWindow::onCurrentSlideChanged(int position, int slideId)
{
    Q_UNUSED(position);
    Q_UNUSED(slideId);
    updateSlideInfo();
}

void PresenterWindow::onCurrentNotesChanged(const QString& text)
{
    if (m_notesEdit->toPlainText() == text) {
        return;
    }
    QSignalBlocker blocker(m_notesEdit);
    m_notesEdit->setPlainText(text);
}

void PresenterWindow::onNotesEdited()
{
    m_session->setCurrentNotes(m_notesEdit->toPlainText());
}

void PresenterWindow::onTimeChanged(const QString& text)
{
    m_timeLabel->setText(text);
}

void PresenterWindow::onRunningChanged(bool running)
{
    m_timerButton->setText(running ? tr("Pause") : tr("Start"));
}

void PresenterWindow::onTimerButtonClicked()
{
    PauseableTimer* timer = m_session->timer();
    if (timer->isRunning()) {
        timer->stop();
    } else {
        timer->start();
    }
}

void PresenterWindow::saveNotes()
{
    QString error;
    if (!m_session->saveNotes(&error)) {
        QMessageBox::warning(this, tr("Save Notes"),
                             tr("Could not save notes:\n%1").arg(error));
    }
}

void PresenterWindow::updateSlideInfo()
{
    const int position = m_session->currentPosition();
    const int count = m_session->slideCount();
    m_slideCounterLabel->setText(tr("Slide %1 / %2").arg(count > 0 ? position + 1 : 0).arg(count));

    m_previousButton->setEnabled(position > 0 || m_session->sync()->verticalOffset() > 0.0);
    m_nextButton->setEnabled(position < count - 1 || m_session->sync()->isCurrentSlideTall());

    if (position + 1 < count) {
        const QImage next = m_session->thumbnail(position + 1);
        if (!next.isNull()) {
            m_nextSlideLabel->setPixmap(QPixmap::fromImage(
                next.scaledToWidth(NEXT_PREVIEW_WIDTH, Qt::SmoothTransformation)));
        } else {
            m_nextSlideLabel->setText(m_session->slideLabel(position + 1));
        }
    } else {
        m_nextSlideLabel->setPixmap(QPixmap());
        m_nextSlideLabel->setText(tr("End of presentation"));
    }
}

// ============================================================================
// Events
// ============================================================================

void PresenterWindow::keyPressEvent(QKeyEvent* event)
{
    // The notes editor keeps its own keys while focused
    switch (event->key()) {
        case Qt::Key_Right:
        case Qt::Key_Down:
        case Qt::Key_PageDown:
        case Qt::Key_Space:
            m_session->next();
            break;
        case Qt::Key_Left:
        case Qt::Key_Up:
        case Qt::Key_PageUp:
            m_session->previous();
            break;
        case Qt::Key_F:
        case Qt::Key_F11:
            m_projector->toggleFullScreen();
            break;
        case Qt::Key_Escape:
            if (m_notesEdit->hasFocus()) {
                setFocus();
            } else {
                close();
            }
            break;
        default:
            QWidget::keyPressEvent(event);
            return;
    }
    event->accept();
}

void PresenterWindow::closeEvent(QCloseEvent* event)
{
    if (m_session->hasUnsavedNotes()) {
        const QMessageBox::StandardButton answer = QMessageBox::question(
            this, tr("Unsaved Notes"),
            tr("The notes have been changed. Save them before ending the presentation?"),
            QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
            QMessageBox::Save);

        if (answer == QMessageBox::Cancel) {
            event->ignore();
            return;
        }
        if (answer == QMessageBox::Save) {
            QString error;
            if (!m_session->saveNotes(&error)) {
                QMessageBox::warning(this, tr("Save Notes"),
                                     tr("Could not save notes:\n%1").arg(error));
                event->ignore();
                return;
            }
        }
    }

    m_projector->hide();
    m_session->leavePresentationMode();
    emit presentationEnded();
    event->accept();
}
