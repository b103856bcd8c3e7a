#pragma once

// ============================================================================
// NotesStore - Speaker notes keyed by global slide id
// ============================================================================
// Notes belong to a slide's content, not to its position in the deck, so
// they are keyed by the global slide id and survive reordering.
//
// Notes are persisted next to the primary PDF as "<pdf-path>.notes":
//   ==XXslide0
//   First line of the note for slide 0
//   Second line
//   ==XXslide3
//   Note for slide 3
//
// A record is a marker line followed by every line up to the next marker.
// save() writes "marker\ntext\n" per record; load() strips that single
// trailing separator again, so multi-line text round-trips exactly.
// ============================================================================

#include <QList>
#include <QMap>
#include <QString>

class NotesStore {
public:
    /// Marker prefix that starts each record.
    static constexpr const char* MARKER_PREFIX = "==XXslide";

    /// Sidecar extension appended to the PDF path.
    static constexpr const char* FILE_SUFFIX = ".notes";

    // ===== Notes =====

    /**
     * @brief Note for a slide, or an empty string if none.
     */
    QString note(int slideId) const { return m_notes.value(slideId); }

    /**
     * @brief Set the note for a slide. An empty text removes the entry.
     */
    void setNote(int slideId, const QString& text);

    bool hasNote(int slideId) const { return m_notes.contains(slideId); }
    int count() const { return m_notes.size(); }
    bool isEmpty() const { return m_notes.isEmpty(); }
    QList<int> slideIds() const { return m_notes.keys(); }
    void clear() { m_notes.clear(); m_edited = false; }

    // ===== File I/O =====

    /**
     * @brief Replace the store with the sidecar of a PDF.
     * @param pdfPath Path of the PDF (not of the .notes file).
     * @return True on success, including when no sidecar exists (empty store).
     *         False if the sidecar exists but can't be read; the store is
     *         left unchanged in that case.
     */
    bool load(const QString& pdfPath);

    /**
     * @brief Write all notes to the sidecar of a PDF.
     * @param pdfPath Path of the PDF (not of the .notes file).
     * @return True on success or if there is nothing to save.
     *
     * If every note was cleared since the last load(), an existing sidecar
     * is removed so the cleared notes don't come back on the next load.
     */
    bool save(const QString& pdfPath) const;

    // ===== Format =====

    /// "<pdfPath>.notes"
    static QString notesPathFor(const QString& pdfPath);

    /// "==XXslide<id>"
    static QString slideKey(int slideId);

    /**
     * @brief Parse a slide id out of a marker line.
     * @return The id, or -1 if the line is not a valid marker.
     */
    static int slideIdFromKey(const QString& line);

    static bool isMarkerLine(const QString& line);

    static QMap<int, QString> parse(const QString& content);
    static QString serialize(const QMap<int, QString>& notes);

private:
    QMap<int, QString> m_notes;     ///< Slide id -> note text (ordered for save)
    bool m_edited = false;          ///< setNote() called since the last load()
};
