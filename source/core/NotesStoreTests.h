#pragma once

// ============================================================================
// NotesStoreTests - Unit tests for the NotesStore class
// ============================================================================

#include "NotesStore.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTextStream>

namespace NotesStoreTests {

/**
 * @brief Save then load restores every note exactly.
 */
inline bool testRoundTrip()
{
    qDebug() << "=== Test: notes round trip ===";

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        qDebug() << "FAIL: Could not create temp dir";
        return false;
    }
    const QString pdfPath = tempDir.filePath("talk.pdf");

    NotesStore store;
    store.setNote(0, QStringLiteral("Welcome everyone"));
    store.setNote(3, QStringLiteral("Line one\nLine two\n\n  indented line four"));
    store.setNote(12, QStringLiteral("ends with newline\n"));
    store.setNote(7, QStringLiteral("Ümlaut and emoji ✓"));

    if (!store.save(pdfPath)) {
        qDebug() << "FAIL: save() failed";
        return false;
    }
    if (!QFileInfo::exists(pdfPath + ".notes")) {
        qDebug() << "FAIL: Sidecar should be written next to the PDF";
        return false;
    }

    NotesStore loaded;
    if (!loaded.load(pdfPath)) {
        qDebug() << "FAIL: load() failed";
        return false;
    }

    bool success = true;
    for (int id : store.slideIds()) {
        if (loaded.note(id) != store.note(id)) {
            qDebug() << "FAIL: Note" << id << "differs after round trip:" << loaded.note(id);
            success = false;
        }
    }
    if (loaded.count() != store.count()) {
        qDebug() << "FAIL: Expected" << store.count() << "notes, got" << loaded.count();
        success = false;
    }

    if (success) {
        qDebug() << "  - Multi-line notes round trip: OK";
    }
    return success;
}

/**
 * @brief Absent sidecar yields an empty store, not an error.
 */
inline bool testMissingFile()
{
    qDebug() << "=== Test: missing notes file ===";

    QTemporaryDir tempDir;
    NotesStore store;
    store.setNote(1, QStringLiteral("stale"));

    if (!store.load(tempDir.filePath("nothing-here.pdf")) || !store.isEmpty()) {
        qDebug() << "FAIL: Missing sidecar should load as an empty store";
        return false;
    }

    // Nothing to save: succeed without creating a file
    if (!store.save(tempDir.filePath("nothing-here.pdf")) ||
        QFileInfo::exists(tempDir.filePath("nothing-here.pdf.notes"))) {
        qDebug() << "FAIL: Saving an empty store should be a no-op";
        return false;
    }

    qDebug() << "  - Missing sidecar: OK";
    return true;
}

/**
 * @brief Parser handles hand-edited files.
 */
inline bool testParse()
{
    qDebug() << "=== Test: parse ===";
    bool success = true;

    const QString content = QStringLiteral(
        "preamble is ignored\n"
        "==XXslide2\n"
        "two\n"
        "==XXslidebogus\n"
        "dropped\n"
        "==XXslide5\n"
        "five a\n"
        "five b");   // no trailing newline

    const QMap<int, QString> notes = NotesStore::parse(content);
    if (notes.size() != 2 || notes.value(2) != "two" || notes.value(5) != "five a\nfive b") {
        qDebug() << "FAIL: Unexpected parse result" << notes;
        success = false;
    }

    if (NotesStore::slideKey(42) != "==XXslide42" || NotesStore::slideIdFromKey("  ==XXslide42 ") != 42 ||
        NotesStore::slideIdFromKey("slide42") != -1) {
        qDebug() << "FAIL: Marker helpers are wrong";
        success = false;
    }

    if (NotesStore::serialize({{1, "a"}, {0, "b\nc"}}) != "==XXslide0\nb\nc\n==XXslide1\na\n") {
        qDebug() << "FAIL: serialize should write records in id order";
        success = false;
    }

    if (success) {
        qDebug() << "  - Marker parsing: OK";
    }
    return success;
}

/**
 * @brief Empty text removes a note.
 */
inline bool testSetNote()
{
    qDebug() << "=== Test: setNote ===";

    NotesStore store;
    store.setNote(4, QStringLiteral("x"));
    store.setNote(4, QString());

    if (store.hasNote(4) || !store.note(4).isEmpty()) {
        qDebug() << "FAIL: Empty text should remove the note";
        return false;
    }

    qDebug() << "  - setNote: OK";
    return true;
}

/**
 * @brief Write failure is reported.
 */
inline bool testSaveFailure()
{
    qDebug() << "=== Test: save failure ===";

    NotesStore store;
    store.setNote(0, QStringLiteral("unsaved"));

    if (store.save(QStringLiteral("/nonexistent-dir-for-notes/talk.pdf"))) {
        qDebug() << "FAIL: Saving into a missing directory should fail";
        return false;
    }
    if (store.note(0) != "unsaved") {
        qDebug() << "FAIL: A failed save must keep the notes in memory";
        return false;
    }

    qDebug() << "  - Save failure reported: OK";
    return true;
}

/**
 * @brief Clearing the only note and saving must not let it reappear.
 */
inline bool testClearLastNote()
{
    qDebug() << "=== Test: clear last note ===";

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        qDebug() << "FAIL: Could not create temp dir";
        return false;
    }
    const QString pdfPath = tempDir.filePath("talk.pdf");

    QFile sidecar(NotesStore::notesPathFor(pdfPath));
    if (!sidecar.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qDebug() << "FAIL: Could not write sidecar";
        return false;
    }
    sidecar.write("==XXslide0\nhello\n");
    sidecar.close();

    NotesStore store;
    if (!store.load(pdfPath) || store.note(0) != "hello") {
        qDebug() << "FAIL: Sidecar note not loaded";
        return false;
    }

    store.setNote(0, QString());
    if (!store.save(pdfPath)) {
        qDebug() << "FAIL: save() after clearing failed";
        return false;
    }

    NotesStore reloaded;
    if (!reloaded.load(pdfPath)) {
        qDebug() << "FAIL: Reload failed";
        return false;
    }
    if (!reloaded.note(0).isEmpty() || !reloaded.isEmpty()) {
        qDebug() << "FAIL: Cleared note came back:" << reloaded.note(0);
        return false;
    }

    // Loading without edits and saving leaves other sidecars alone
    QFile other(NotesStore::notesPathFor(tempDir.filePath("other.pdf")));
    if (!other.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qDebug() << "FAIL: Could not write second sidecar";
        return false;
    }
    other.write("==XXslide2\nkept\n");
    other.close();

    NotesStore untouched;
    if (!untouched.save(tempDir.filePath("other.pdf"))
        || !QFileInfo::exists(other.fileName())) {
        qDebug() << "FAIL: Saving an unedited empty store must not touch the sidecar";
        return false;
    }

    qDebug() << "  - Cleared notes stay cleared: OK";
    return true;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running NotesStore Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testRoundTrip();
    qDebug() << "";

    allPass &= testMissingFile();
    qDebug() << "";

    allPass &= testParse();
    qDebug() << "";

    allPass &= testSetNote();
    qDebug() << "";

    allPass &= testSaveFailure();
    qDebug() << "";

    allPass &= testClearLastNote();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL NOTES TESTS PASSED!";
    } else {
        qDebug() << "SOME NOTES TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace NotesStoreTests
