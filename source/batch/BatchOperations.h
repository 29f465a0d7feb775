#ifndef BATCHOPERATIONS_H
#define BATCHOPERATIONS_H

/**
 * @file BatchOperations.h
 * @brief Batch conversion between annotation records and mask rasters.
 *
 * Both directions walk a directory in file name order, one item at a
 * time. A failing item is recorded and the loop moves on; the cancellation
 * flag and the result callback are checked between items.
 */

#include "../annotations/ClassTable.h"

#include <QString>
#include <QStringList>
#include <QList>
#include <functional>
#include <atomic>

namespace BatchOps {

// =============================================================================
// Results
// =============================================================================

enum class FileStatus {
    Success,
    Skipped,        ///< Nothing to write (no annotations) or cancelled
    Error
};

/**
 * @brief Why an item failed, or why the batch never started.
 */
enum class ErrorKind {
    None,
    PathError,              ///< Batch-level: directory or class table unusable
    SchemaError,            ///< Record is not JSON or has no "annotations" array
    ImageSizeUnavailable,   ///< No stored size and no readable source image
    InvalidOption,          ///< e.g. non-positive line thickness
    ReadFailed,
    WriteFailed
};

/**
 * @brief Outcome of converting one record or mask.
 *
 * An item is Success even when some annotations in it were dropped; each
 * dropped annotation is listed in @c warnings.
 */
struct FileResult {
    QString inputPath;
    QString outputPath;             ///< Empty unless something was (or would be) written
    FileStatus status = FileStatus::Error;
    ErrorKind errorKind = ErrorKind::None;  ///< Set when status is Error
    QString message;                ///< Failure or skip reason
    QStringList warnings;
    int annotationCount = 0;        ///< Annotations painted or extracted
};

struct BatchResult {
    QList<FileResult> results;      ///< In processing order
    int successCount = 0;
    int skippedCount = 0;
    int errorCount = 0;
    qint64 elapsedMs = 0;

    /// Non-empty when the batch never started (missing input directory,
    /// unusable output directory, empty class table).
    QString errorMessage;
    ErrorKind errorKind = ErrorKind::None;

    bool pathError() const { return errorKind == ErrorKind::PathError; }
    bool hasErrors() const { return pathError() || errorCount > 0; }
    int totalCount() const { return successCount + skippedCount + errorCount; }

    int warningCount() const {
        int n = 0;
        for (const FileResult& r : results) {
            n += r.warnings.size();
        }
        return n;
    }
};

/**
 * @brief Called before each item with its 1-based position.
 */
using ProgressCallback = std::function<void(int current, int total,
                                            const QString& currentFile,
                                            const QString& status)>;

/**
 * @brief Called after each item so results can be printed as they arrive.
 * @return false to stop; the remaining items are not visited.
 */
using ResultCallback = std::function<bool(int current, int total,
                                         const FileResult& result)>;

// =============================================================================
// Options
// =============================================================================

struct MaskGenerationOptions {
    QString annotationDir;          ///< Directory of *.json records
    QString imageDir;               ///< Source images, used when a record has no original_size
    QString outputDir;              ///< Receives <base>_mask.png
    ClassTable classTable;          ///< Label -> class id
    int lineThickness = 5;          ///< Stroke width for lines and freehand
    bool displayScaling = true;     ///< Spread class ids over 0..255 for viewing
    bool dryRun = false;            ///< Convert, but write and delete nothing
};

struct AnnotationExtractionOptions {
    QString maskDir;                ///< Directory of mask rasters
    QString outputDir;              ///< Receives <base>.json ("_mask" stripped)
    ClassTable classTable;          ///< Raster value -> label
    bool includeBackground = false; ///< Also trace the background class
    double minContourArea = 4.0;    ///< Smaller contours are dropped as noise
    bool dryRun = false;            ///< Convert, but write and delete nothing
};

// =============================================================================
// Directory batches
// =============================================================================

/**
 * @brief Rasterize every annotation record in a directory.
 *
 * Records are visited in file name order. Each record is parsed, its size
 * resolved (stored original_size, else the matching source image in
 * imageDir), painted and written atomically as <base>_mask.png.
 *
 * Per-record failures (unreadable record, no size, write error) are
 * reported as FileStatus::Error. Skipped annotations (unknown label, bad
 * point count) become warnings on an otherwise successful item.
 *
 * A missing annotation directory fails the whole batch with zero items
 * (BatchResult::errorMessage).
 *
 * All callbacks and the flag are optional.
 */
BatchResult generateMasks(const MaskGenerationOptions& options,
                          ProgressCallback progress = nullptr,
                          std::atomic<bool>* cancelled = nullptr,
                          ResultCallback resultCb = nullptr);

/**
 * @brief Extract annotation records from every mask in a directory.
 *
 * Masks are read as 8-bit grayscale, decomposed per class into outer
 * contours and written as <base>.json, where a trailing "_mask" is
 * stripped from the base name.
 *
 * A mask that yields no annotations is reported as FileStatus::Skipped;
 * no file is written for it and a previous output of the same name is
 * removed, so no record on disk ever holds zero annotations.
 *
 */
BatchResult extractAnnotations(const AnnotationExtractionOptions& options,
                               ProgressCallback progress = nullptr,
                               std::atomic<bool>* cancelled = nullptr,
                               ResultCallback resultCb = nullptr);

// =============================================================================
// Single items
// =============================================================================

/**
 * @brief Rasterize one record into options.outputDir.
 *
 * Honors dryRun. Does not create the output directory.
 */
FileResult generateMask(const QString& recordPath, const MaskGenerationOptions& options);

/**
 * @brief Extract one mask into options.outputDir.
 *
 * Honors dryRun. Does not create the output directory.
 */
FileResult extractAnnotation(const QString& maskPath,
                             const AnnotationExtractionOptions& options);

// =============================================================================
// Output naming
// =============================================================================

/**
 * @brief Output path of the mask generated from a record.
 *
 * Example: "/in/photo.json" + "/out" -> "/out/photo_mask.png"
 */
QString maskOutputPath(const QString& recordPath, const QString& outputDir);

/**
 * @brief Output path of the record extracted from a mask.
 *
 * Example: "/in/photo_mask.png" + "/out" -> "/out/photo.json"
 */
QString recordOutputPath(const QString& maskPath, const QString& outputDir);

} // namespace BatchOps

#endif // BATCHOPERATIONS_H
