#pragma once

// ============================================================================
// AnnotationStore - Per-image annotation records and their persistence
// ============================================================================
// One AnnotationSet per image, keyed by the image file name. Records are
// written as <image base name>.json into a caller-chosen directory. A record
// whose list became empty is removed from disk on save, so no file on disk
// ever holds zero annotations.
// ============================================================================

#include "../annotations/AnnotationSet.h"

#include <QMap>
#include <QSize>
#include <QString>
#include <QStringList>

/**
 * @brief In-memory annotations for a folder of images, with a dirty flag.
 *
 * Mutations set the dirty flag; only a save without errors clears it.
 */
class AnnotationStore {
public:
    /**
     * @brief Outcome of save().
     */
    struct SaveResult {
        int savedCount = 0;     ///< Records written
        int deletedCount = 0;   ///< Stale records removed
        int errorCount = 0;     ///< Records that could not be written/removed
        QStringList errors;     ///< One message per failure

        bool success() const { return errorCount == 0; }
    };

    /**
     * @brief Outcome of load().
     */
    enum class LoadStatus {
        Loaded,         ///< Record read from disk
        AlreadyLoaded,  ///< Image already has an in-memory record; disk not touched
        NotFound,       ///< No record on disk (not an error)
        ParseError      ///< Record exists but could not be read
    };

    AnnotationStore() = default;

    // ===== Mutation =====

    /**
     * @brief Append an annotation to an image's record.
     *
     * Creates the record on first use, capturing @p imageSize as the
     * record's original size (also filled in if a loaded record lacked one).
     * Invalid annotations are rejected without any state change: empty
     * label, wrong point count, or a zero-extent rectangle/line.
     *
     * @param reason Optional rejection reason.
     * @return True if the annotation was appended.
     */
    bool append(const QString& imageId, const Annotation& annotation,
                QSize imageSize, QString* reason = nullptr);

    /**
     * @brief Remove the annotation at @p index. Out-of-range is a no-op.
     * @return True if something was removed.
     */
    bool deleteAt(const QString& imageId, int index);

    /**
     * @brief Remove all annotations of an image but keep its record.
     *
     * If the image has no record yet an empty one is created, so the next
     * save removes any stale file for it. Marks the store dirty.
     *
     * @return False only if @p imageId is empty.
     */
    bool clear(const QString& imageId, QSize imageSize = QSize());

    /**
     * @brief Forget every record without touching disk (e.g. when switching folders).
     */
    void reset();

    // ===== Persistence =====

    /**
     * @brief Write every record into @p targetDir.
     *
     * Non-empty records are written atomically; empty ones have their file
     * removed if present. A failure on one image is recorded and the loop
     * continues with the next.
     *
     * Images differing only by extension (a.jpg, a.png) share a.json. An
     * empty record never deletes a file another image still writes; a second
     * non-empty record for the same file is reported as an error.
     */
    SaveResult save(const QString& targetDir);

    /**
     * @brief Load an image's record from @p recordDir if one exists.
     *
     * Images that already have an in-memory record are left alone so
     * unsaved edits are not overwritten when navigating back to an image.
     */
    LoadStatus load(const QString& imageId, const QString& recordDir,
                    QString* errorMessage = nullptr);

    // ===== Queries =====

    bool isDirty() const { return m_dirty; }
    bool contains(const QString& imageId) const { return m_records.contains(imageId); }
    QStringList imageIds() const { return m_records.keys(); }

    /// @return The image's annotations in paint order (empty if none).
    QVector<Annotation> annotations(const QString& imageId) const;

    /// @return The image's record (empty set if none).
    AnnotationSet annotationSet(const QString& imageId) const;

    /**
     * @brief Record file name for an image: "photo.png" -> "photo.json".
     */
    static QString recordFileName(const QString& imageId);

private:
    QMap<QString, AnnotationSet> m_records;
    bool m_dirty = false;
};
