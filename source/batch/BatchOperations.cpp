#include "BatchOperations.h"
#include "ImageDiscovery.h"

#include "../annotations/AnnotationSet.h"
#include "../raster/ContourExtractor.h"
#include "../raster/MaskRasterizer.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QImageReader>
#include <QSaveFile>
#include <QElapsedTimer>
#include <QObject>
#include <QDebug>

/**
 * @file BatchOperations.cpp
 * @brief Implementation of batch mask generation and annotation extraction.
 *
 * @see BatchOperations.h for API documentation
 */

namespace BatchOps {

namespace {

const char* MASK_SUFFIX = "_mask";

using ItemFunction = std::function<FileResult(const QString& inputPath)>;

/**
 * @brief Shared sequential loop: progress, cancellation, counting, result callback.
 */
void processFiles(const QStringList& files, const QString& statusText,
                  const ItemFunction& process, BatchResult& result,
                  ProgressCallback progress, std::atomic<bool>* cancelled,
                  ResultCallback resultCb)
{
    const int total = files.size();

    for (int i = 0; i < total; ++i) {
        const QString& inputPath = files.at(i);
        FileResult fr;

        // Check cancellation
        if (cancelled && cancelled->load()) {
            fr.inputPath = inputPath;
            fr.status = FileStatus::Skipped;
            fr.message = QObject::tr("Cancelled");
            result.results.append(fr);
            result.skippedCount++;
            continue;
        }

        // Report progress
        if (progress) {
            progress(i + 1, total, inputPath, statusText);
        }

        fr = process(inputPath);

        switch (fr.status) {
            case FileStatus::Success: result.successCount++; break;
            case FileStatus::Skipped: result.skippedCount++; break;
            case FileStatus::Error:   result.errorCount++;   break;
        }
        result.results.append(fr);

        if (resultCb && !resultCb(i + 1, total, fr)) {
            break;
        }
    }
}

bool writeMask(const QImage& mask, const QString& path, QString* errorMessage)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        *errorMessage = QObject::tr("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    if (!mask.save(&file, "PNG")) {
        file.cancelWriting();
        *errorMessage = QObject::tr("Failed to encode mask %1").arg(path);
        return false;
    }
    if (!file.commit()) {
        *errorMessage = QObject::tr("Cannot commit %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

/**
 * @brief Validate the output directory and create it unless this is a dry run.
 */
bool prepareOutputDir(const QString& outputDir, bool dryRun, QString* errorMessage)
{
    if (outputDir.isEmpty()) {
        *errorMessage = QObject::tr("No output directory specified");
        return false;
    }
    QFileInfo info(outputDir);
    if (info.exists() && !info.isDir()) {
        *errorMessage = QObject::tr("Output path is not a directory: %1").arg(outputDir);
        return false;
    }
    if (!info.exists() && !dryRun && !QDir().mkpath(outputDir)) {
        *errorMessage = QObject::tr("Failed to create output directory: %1").arg(outputDir);
        return false;
    }
    return true;
}

} // namespace

// =============================================================================
// Utility Functions
// =============================================================================

QString maskOutputPath(const QString& recordPath, const QString& outputDir)
{
    const QString base = QFileInfo(recordPath).completeBaseName();
    return QDir(outputDir).filePath(base + QLatin1String(MASK_SUFFIX) + QStringLiteral(".png"));
}

QString recordOutputPath(const QString& maskPath, const QString& outputDir)
{
    QString base = QFileInfo(maskPath).completeBaseName();
    if (base.endsWith(QLatin1String(MASK_SUFFIX))) {
        base.chop(static_cast<int>(qstrlen(MASK_SUFFIX)));
    }
    return QDir(outputDir).filePath(base + QStringLiteral(".json"));
}

// =============================================================================
// Mask Generation
// =============================================================================

FileResult generateMask(const QString& recordPath, const MaskGenerationOptions& options)
{
    FileResult fr;
    fr.inputPath = recordPath;
    fr.outputPath = maskOutputPath(recordPath, options.outputDir);

    AnnotationSet set;
    QVector<AnnotationIssue> issues;
    QString err;
    if (!AnnotationSet::loadFromFile(recordPath, &set, &issues, &err)) {
        fr.status = FileStatus::Error;
        fr.errorKind = QFileInfo(recordPath).isReadable() ? ErrorKind::SchemaError
                                                          : ErrorKind::ReadFailed;
        fr.message = err;
        fr.outputPath.clear();
        return fr;
    }
    for (const AnnotationIssue& issue : issues) {
        fr.warnings << issue.toString();
    }

    // The source image is only needed when the record has no size of its own
    QString sourceImage;
    if (set.originalSize.isEmpty() && !options.imageDir.isEmpty()) {
        sourceImage = findMatchingImage(options.imageDir, QFileInfo(recordPath).completeBaseName());
    }

    const MaskRasterizer::RasterizeResult raster =
        MaskRasterizer::rasterize(set, options.classTable, options.lineThickness, sourceImage);
    for (const AnnotationIssue& issue : raster.issues) {
        if (issue.kind != AnnotationIssue::Kind::ImageSizeUnavailable) {
            fr.warnings << issue.toString();
        }
    }
    if (!raster.success) {
        fr.status = FileStatus::Error;
        fr.errorKind = options.lineThickness > 0 ? ErrorKind::ImageSizeUnavailable
                                                 : ErrorKind::InvalidOption;
        fr.message = raster.errorMessage;
        fr.outputPath.clear();
        return fr;
    }
    fr.annotationCount = raster.paintedCount;

    if (options.dryRun) {
        fr.status = FileStatus::Success;
        fr.message = QObject::tr("Would write: %1").arg(fr.outputPath);
        return fr;
    }

    const QImage mask = options.displayScaling
        ? MaskRasterizer::toDisplayMask(raster.mask, options.classTable)
        : raster.mask;

    if (!writeMask(mask, fr.outputPath, &err)) {
        fr.status = FileStatus::Error;
        fr.errorKind = ErrorKind::WriteFailed;
        fr.message = err;
        fr.outputPath.clear();
        return fr;
    }

    fr.status = FileStatus::Success;
    return fr;
}

BatchResult generateMasks(const MaskGenerationOptions& options,
                          ProgressCallback progress,
                          std::atomic<bool>* cancelled,
                          ResultCallback resultCb)
{
    BatchResult result;
    QElapsedTimer timer;
    timer.start();

    if (!QFileInfo(options.annotationDir).isDir()) {
        result.errorKind = ErrorKind::PathError;
        result.errorMessage = QObject::tr("Annotation directory not found: %1").arg(options.annotationDir);
        result.elapsedMs = timer.elapsed();
        return result;
    }
    if (!options.imageDir.isEmpty() && !QFileInfo(options.imageDir).isDir()) {
        result.errorKind = ErrorKind::PathError;
        result.errorMessage = QObject::tr("Image directory not found: %1").arg(options.imageDir);
        result.elapsedMs = timer.elapsed();
        return result;
    }
    if (options.classTable.isEmpty()) {
        result.errorKind = ErrorKind::PathError;
        result.errorMessage = QObject::tr("Class table is empty");
        result.elapsedMs = timer.elapsed();
        return result;
    }

    QString err;
    if (!prepareOutputDir(options.outputDir, options.dryRun, &err)) {
        result.errorKind = ErrorKind::PathError;
        result.errorMessage = err;
        result.elapsedMs = timer.elapsed();
        return result;
    }

    const QStringList records = discoverFiles(options.annotationDir, { QStringLiteral("json") });

    processFiles(records, QObject::tr("Rasterizing..."),
                 [&options](const QString& path) { return generateMask(path, options); },
                 result, progress, cancelled, resultCb);

    result.elapsedMs = timer.elapsed();

#ifdef QT_DEBUG
    qDebug() << "[BatchOps] generateMasks complete:"
             << result.successCount << "success,"
             << result.skippedCount << "skipped,"
             << result.errorCount << "errors,"
             << result.elapsedMs << "ms";
#endif

    return result;
}

// =============================================================================
// Annotation Extraction
// =============================================================================

FileResult extractAnnotation(const QString& maskPath,
                             const AnnotationExtractionOptions& options)
{
    FileResult fr;
    fr.inputPath = maskPath;
    fr.outputPath = recordOutputPath(maskPath, options.outputDir);

    QImageReader reader(maskPath);
    const QImage raster = reader.read();
    if (raster.isNull()) {
        fr.status = FileStatus::Error;
        fr.errorKind = ErrorKind::ReadFailed;
        fr.message = QObject::tr("Failed to read mask: %1").arg(reader.errorString());
        fr.outputPath.clear();
        return fr;
    }

    ContourExtractor::ExtractOptions extractOpts;
    extractOpts.includeBackground = options.includeBackground;
    extractOpts.minArea = options.minContourArea;

    const ContourExtractor::ExtractResult extracted =
        ContourExtractor::extract(raster, options.classTable, extractOpts);
    fr.annotationCount = extracted.set.count();
    if (extracted.droppedCount > 0) {
        fr.warnings << QObject::tr("%n contour(s) smaller than the minimum area dropped",
                                   nullptr, extracted.droppedCount);
    }

    if (extracted.set.isEmpty()) {
        // Never leave a record with zero annotations behind
        fr.status = FileStatus::Skipped;
        fr.message = QObject::tr("No annotations found");
        if (QFile::exists(fr.outputPath)) {
            if (options.dryRun) {
                fr.message = QObject::tr("No annotations found, would remove %1").arg(fr.outputPath);
            } else if (!QFile::remove(fr.outputPath)) {
                fr.status = FileStatus::Error;
                fr.errorKind = ErrorKind::WriteFailed;
                fr.message = QObject::tr("Cannot remove stale record %1").arg(fr.outputPath);
                return fr;
            }
        }
        fr.outputPath.clear();
        return fr;
    }

    if (options.dryRun) {
        fr.status = FileStatus::Success;
        fr.message = QObject::tr("Would write: %1").arg(fr.outputPath);
        return fr;
    }

    QString err;
    if (!extracted.set.saveToFile(fr.outputPath, &err)) {
        fr.status = FileStatus::Error;
        fr.errorKind = ErrorKind::WriteFailed;
        fr.message = err;
        fr.outputPath.clear();
        return fr;
    }

    fr.status = FileStatus::Success;
    return fr;
}

BatchResult extractAnnotations(const AnnotationExtractionOptions& options,
                               ProgressCallback progress,
                               std::atomic<bool>* cancelled,
                               ResultCallback resultCb)
{
    BatchResult result;
    QElapsedTimer timer;
    timer.start();

    if (!QFileInfo(options.maskDir).isDir()) {
        result.errorKind = ErrorKind::PathError;
        result.errorMessage = QObject::tr("Mask directory not found: %1").arg(options.maskDir);
        result.elapsedMs = timer.elapsed();
        return result;
    }
    if (options.classTable.isEmpty()) {
        result.errorKind = ErrorKind::PathError;
        result.errorMessage = QObject::tr("Class table is empty");
        result.elapsedMs = timer.elapsed();
        return result;
    }

    QString err;
    if (!prepareOutputDir(options.outputDir, options.dryRun, &err)) {
        result.errorKind = ErrorKind::PathError;
        result.errorMessage = err;
        result.elapsedMs = timer.elapsed();
        return result;
    }

    const QStringList masks = discoverFiles(options.maskDir, maskImageExtensions());

    processFiles(masks, QObject::tr("Extracting..."),
                 [&options](const QString& path) { return extractAnnotation(path, options); },
                 result, progress, cancelled, resultCb);

    result.elapsedMs = timer.elapsed();

#ifdef QT_DEBUG
    qDebug() << "[BatchOps] extractAnnotations complete:"
             << result.successCount << "success,"
             << result.skippedCount << "skipped,"
             << result.errorCount << "errors,"
             << result.elapsedMs << "ms";
#endif

    return result;
}

} // namespace BatchOps
