// ============================================================================
// NotesStore - Implementation
// ============================================================================

#include "NotesStore.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <QTextStream>

void NotesStore::setNote(int slideId, const QString& text)
{
    m_edited = true;
    if (text.isEmpty()) {
        m_notes.remove(slideId);
    } else {
        m_notes.insert(slideId, text);
    }
}

// ===== Format =====

QString NotesStore::notesPathFor(const QString& pdfPath)
{
    return pdfPath + QLatin1String(FILE_SUFFIX);
}

QString NotesStore::slideKey(int slideId)
{
    return QLatin1String(MARKER_PREFIX) + QString::number(slideId);
}

bool NotesStore::isMarkerLine(const QString& line)
{
    return line.trimmed().startsWith(QLatin1String(MARKER_PREFIX));
}

int NotesStore::slideIdFromKey(const QString& line)
{
    const QString trimmed = line.trimmed();
    if (!trimmed.startsWith(QLatin1String(MARKER_PREFIX))) {
        return -1;
    }
    bool ok = false;
    const int id = trimmed.mid(static_cast<int>(qstrlen(MARKER_PREFIX))).toInt(&ok);
    return (ok && id >= 0) ? id : -1;
}

QMap<int, QString> NotesStore::parse(const QString& content)
{
    QMap<int, QString> notes;

    int currentId = -1;
    QString currentText;

    auto flush = [&]() {
        if (currentId < 0) {
            return;
        }
        // Drop the record separator written by serialize()
        if (currentText.endsWith(QLatin1Char('\n'))) {
            currentText.chop(1);
        }
        if (!currentText.isEmpty()) {
            notes.insert(currentId, currentText);
        }
    };

    const QStringList lines = content.split(QLatin1Char('\n'));
    for (int i = 0; i < lines.size(); ++i) {
        const QString& line = lines.at(i);
        const bool lastPiece = (i == lines.size() - 1);

        if (isMarkerLine(line)) {
            flush();
            currentId = slideIdFromKey(line);
            currentText.clear();
            if (currentId < 0) {
                qWarning() << "NotesStore: Ignoring record with invalid marker" << line.trimmed();
            }
            continue;
        }

        if (currentId < 0) {
            continue;   // text before the first marker or after a bad one
        }

        currentText += line;
        if (!lastPiece) {
            currentText += QLatin1Char('\n');
        }
    }
    flush();

    return notes;
}

QString NotesStore::serialize(const QMap<int, QString>& notes)
{
    QString out;
    for (auto it = notes.constBegin(); it != notes.constEnd(); ++it) {
        out += slideKey(it.key());
        out += QLatin1Char('\n');
        out += it.value();
        out += QLatin1Char('\n');
    }
    return out;
}

// ===== File I/O =====

bool NotesStore::load(const QString& pdfPath)
{
    const QString path = notesPathFor(pdfPath);

    if (!QFileInfo::exists(path)) {
        qDebug() << "NotesStore: No notes file at" << path;
        m_notes.clear();
        m_edited = false;
        return true;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "NotesStore::load: Failed to open file for reading:" << path;
        return false;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);
    const QString content = in.readAll();
    file.close();

    m_notes = parse(content);
    m_edited = false;
    qDebug() << "NotesStore: Loaded" << m_notes.size() << "notes from" << path;
    return true;
}

bool NotesStore::save(const QString& pdfPath) const
{
    const QString path = notesPathFor(pdfPath);

    if (m_notes.isEmpty()) {
        if (!m_edited || !QFileInfo::exists(path)) {
            qDebug() << "NotesStore: No notes to save";
            return true;
        }
        // Every note was cleared; an old sidecar would bring them back
        if (!QFile::remove(path)) {
            qWarning() << "NotesStore::save: Failed to remove emptied notes file:" << path;
            return false;
        }
        qDebug() << "NotesStore: Removed emptied notes file" << path;
        return true;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "NotesStore::save: Failed to open file for writing:" << path;
        return false;
    }

    QTextStream out(&file);
    out.setEncoding(QStringConverter::Utf8);
    out << serialize(m_notes);
    out.flush();

    if (out.status() != QTextStream::Ok || file.error() != QFileDevice::NoError) {
        qWarning() << "NotesStore::save: Write failed:" << path << file.errorString();
        return false;
    }

    file.close();
    qDebug() << "NotesStore: Saved" << m_notes.size() << "notes to" << path;
    return true;
}
