// ============================================================================
// RasterTests - Unit tests for mask rasterization and contour extraction
// ============================================================================
// Run with: masklabel --test-raster
// ============================================================================

#pragma once

#include "MaskRasterizer.h"
#include "ContourExtractor.h"

#include <QTemporaryDir>
#include <cstdio>

/**
 * @brief Test suite for MaskRasterizer and ContourExtractor.
 *
 * Uses the default class table: object = 2, person = 3, lines = 1.
 */
class RasterTests {
public:

    static int pixel(const QImage& gray, int x, int y) {
        return gray.constScanLine(y)[x];
    }

    static AnnotationSet sized(int w, int h) {
        AnnotationSet set;
        set.originalSize = QSize(w, h);
        return set;
    }

    // ===== Rasterization =====

    /**
     * @brief A rectangle covers [x1, x2) x [y1, y2) exactly.
     */
    static bool testRectangleCoverage() {
        printf("  testRectangleCoverage... ");

        AnnotationSet set = sized(100, 100);
        set.annotations << Annotation::rectangle("object", QPointF(10, 10), QPointF(50, 50));

        const MaskRasterizer::RasterizeResult r =
            MaskRasterizer::rasterize(set, ClassTable::defaultTable(), 5);
        if (!r.success || r.mask.size() != QSize(100, 100) || r.mask.format() != QImage::Format_Grayscale8) {
            printf("FAILED: rasterize should give a 100x100 gray mask\n");
            return false;
        }
        for (int y = 0; y < 100; ++y) {
            for (int x = 0; x < 100; ++x) {
                const bool inside = x >= 10 && x < 50 && y >= 10 && y < 50;
                if (pixel(r.mask, x, y) != (inside ? 2 : 0)) {
                    printf("FAILED: pixel (%d,%d) = %d\n", x, y, pixel(r.mask, x, y));
                    return false;
                }
            }
        }

        printf("PASSED\n");
        return true;
    }

    static bool testLaterAnnotationsOnTop() {
        printf("  testLaterAnnotationsOnTop... ");

        AnnotationSet set = sized(60, 60);
        set.annotations << Annotation::rectangle("object", QPointF(0, 0), QPointF(40, 40))
                        << Annotation::rectangle("person", QPointF(20, 20), QPointF(60, 60));

        const MaskRasterizer::RasterizeResult r =
            MaskRasterizer::rasterize(set, ClassTable::defaultTable(), 5);
        if (pixel(r.mask, 5, 5) != 2 || pixel(r.mask, 30, 30) != 3 || pixel(r.mask, 55, 55) != 3) {
            printf("FAILED: overlap should take the later class\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief A freehand stroke is an open polyline: its inside stays background.
     */
    static bool testFreehandOpenAndUnfilled() {
        printf("  testFreehandOpenAndUnfilled... ");

        AnnotationSet set = sized(100, 100);
        set.annotations << Annotation::freehand("path", { QPointF(10, 10), QPointF(50, 90), QPointF(90, 10) });

        const MaskRasterizer::RasterizeResult r =
            MaskRasterizer::rasterize(set, ClassTable::defaultTable(), 3);
        if (!r.success || r.paintedCount != 1) {
            printf("FAILED: freehand should be painted\n");
            return false;
        }
        // On the stroke
        if (pixel(r.mask, 30, 50) != 7 || pixel(r.mask, 50, 89) != 7) {
            printf("FAILED: stroke pixels missing\n");
            return false;
        }
        // Inside the V and on the would-be closing edge
        if (pixel(r.mask, 50, 40) != 0 || pixel(r.mask, 50, 10) != 0) {
            printf("FAILED: freehand was filled or closed\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testLineThickness() {
        printf("  testLineThickness... ");

        AnnotationSet set = sized(100, 100);
        set.annotations << Annotation::line("lines", QPointF(10, 50), QPointF(90, 50));

        const MaskRasterizer::RasterizeResult r =
            MaskRasterizer::rasterize(set, ClassTable::defaultTable(), 9);
        if (pixel(r.mask, 50, 50) != 1 || pixel(r.mask, 50, 47) != 1 || pixel(r.mask, 50, 53) != 1) {
            printf("FAILED: thick line should cover +-3 pixels\n");
            return false;
        }
        if (pixel(r.mask, 50, 40) != 0 || pixel(r.mask, 50, 60) != 0) {
            printf("FAILED: line is too thick\n");
            return false;
        }

        const MaskRasterizer::RasterizeResult bad =
            MaskRasterizer::rasterize(set, ClassTable::defaultTable(), 0);
        if (bad.success || bad.errorMessage.isEmpty()) {
            printf("FAILED: zero thickness should fail\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Unknown labels and bad arity are warnings; the rest is still painted.
     */
    static bool testUnknownLabelSkipped() {
        printf("  testUnknownLabelSkipped... ");

        AnnotationSet set = sized(40, 40);
        set.annotations << Annotation::rectangle("unicorn", QPointF(0, 0), QPointF(20, 20))
                        << Annotation(QStringLiteral("lines"), Annotation::Type::Line, { QPointF(1, 1) })
                        << Annotation::rectangle("object", QPointF(20, 20), QPointF(40, 40));

        const MaskRasterizer::RasterizeResult r =
            MaskRasterizer::rasterize(set, ClassTable::defaultTable(), 5);
        if (!r.success || r.paintedCount != 1 || r.issues.size() != 2) {
            printf("FAILED: expected 1 painted and 2 issues, got %d and %d\n",
                   r.paintedCount, r.issues.size());
            return false;
        }
        if (r.issues[0].kind != AnnotationIssue::Kind::UnknownLabel || r.issues[0].annotationIndex != 0
            || r.issues[1].kind != AnnotationIssue::Kind::SchemaError) {
            printf("FAILED: wrong issue kinds\n");
            return false;
        }
        if (pixel(r.mask, 5, 5) != 0 || pixel(r.mask, 30, 30) != 2) {
            printf("FAILED: wrong pixels\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testDeterministic() {
        printf("  testDeterministic... ");

        AnnotationSet set = sized(80, 60);
        set.annotations << Annotation::rectangle("object", QPointF(3.4, 7.6), QPointF(41.5, 33.2))
                        << Annotation::line("lines", QPointF(0, 0), QPointF(79, 59))
                        << Annotation::freehand("path", { QPointF(5, 50), QPointF(20, 40), QPointF(70, 55) });

        const ClassTable table = ClassTable::defaultTable();
        const QImage a = MaskRasterizer::rasterize(set, table, 4).mask;
        const QImage b = MaskRasterizer::rasterize(set, table, 4).mask;
        if (a.isNull() || a != b) {
            printf("FAILED: identical input gave different masks\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Without original_size the source image supplies the size.
     */
    static bool testSizeFallback() {
        printf("  testSizeFallback... ");

        QTemporaryDir tmp;
        const QString imagePath = tmp.filePath("source.png");
        QImage source(30, 20, QImage::Format_RGB32);
        source.fill(Qt::white);
        if (!source.save(imagePath)) {
            printf("FAILED: cannot write source image\n");
            return false;
        }

        AnnotationSet set;
        set.annotations << Annotation::rectangle("object", QPointF(1, 1), QPointF(5, 5));

        const MaskRasterizer::RasterizeResult withImage =
            MaskRasterizer::rasterize(set, ClassTable::defaultTable(), 5, imagePath);
        if (!withImage.success || withImage.mask.size() != QSize(30, 20)) {
            printf("FAILED: size should come from the source image\n");
            return false;
        }

        const MaskRasterizer::RasterizeResult without =
            MaskRasterizer::rasterize(set, ClassTable::defaultTable(), 5);
        if (without.success || without.issues.isEmpty()
            || without.issues.first().kind != AnnotationIssue::Kind::ImageSizeUnavailable) {
            printf("FAILED: missing size should fail with ImageSizeUnavailable\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testDisplayMask() {
        printf("  testDisplayMask... ");

        AnnotationSet set = sized(10, 10);
        set.annotations << Annotation::rectangle("lines", QPointF(0, 0), QPointF(5, 10))
                        << Annotation::rectangle("path", QPointF(5, 0), QPointF(10, 10));

        const ClassTable table = ClassTable::defaultTable();
        const QImage display = MaskRasterizer::toDisplayMask(
            MaskRasterizer::rasterize(set, table, 1).mask, table);
        if (pixel(display, 2, 2) != 36 || pixel(display, 7, 7) != 255) {
            printf("FAILED: display values %d %d\n", pixel(display, 2, 2), pixel(display, 7, 7));
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== Contour extraction =====

    static bool testExtractEmptyMask() {
        printf("  testExtractEmptyMask... ");

        QImage mask(50, 50, QImage::Format_Grayscale8);
        mask.fill(0);
        const ContourExtractor::ExtractResult r =
            ContourExtractor::extract(mask, ClassTable::defaultTable());
        if (!r.set.isEmpty() || !r.perClass.isEmpty()) {
            printf("FAILED: all-background mask should give no annotations\n");
            return false;
        }
        if (r.set.originalSize != QSize(50, 50)) {
            printf("FAILED: original size not recorded\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief A filled square yields one outline; a lone pixel is noise.
     */
    static bool testExtractSquareDropsNoise() {
        printf("  testExtractSquareDropsNoise... ");

        QImage mask(100, 100, QImage::Format_Grayscale8);
        mask.fill(0);
        for (int y = 20; y < 60; ++y) {
            uchar* row = mask.scanLine(y);
            for (int x = 20; x < 60; ++x) {
                row[x] = 2;
            }
        }
        mask.scanLine(80)[80] = 3;

        const ContourExtractor::ExtractResult r =
            ContourExtractor::extract(mask, ClassTable::defaultTable());
        if (r.set.count() != 1 || r.droppedCount != 1) {
            printf("FAILED: expected 1 contour and 1 dropped, got %d and %d\n",
                   r.set.count(), r.droppedCount);
            return false;
        }
        const Annotation& a = r.set.annotations.first();
        if (a.label != "object" || a.type != Annotation::Type::Freehand) {
            printf("FAILED: contour should be a freehand 'object'\n");
            return false;
        }
        if (a.boundingRect() != QRectF(QPointF(20, 20), QPointF(59, 59))) {
            printf("FAILED: contour bounds wrong\n");
            return false;
        }
        if (r.perClass.size() != 1 || r.perClass.first().first != "object" || r.perClass.first().second != 1) {
            printf("FAILED: per-class summary wrong\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testExtractSkipsUnmappedValues() {
        printf("  testExtractSkipsUnmappedValues... ");

        QImage mask(40, 40, QImage::Format_Grayscale8);
        mask.fill(0);
        for (int y = 5; y < 25; ++y) {
            uchar* row = mask.scanLine(y);
            for (int x = 5; x < 25; ++x) {
                row[x] = 99;
            }
        }

        const ContourExtractor::ExtractResult r =
            ContourExtractor::extract(mask, ClassTable::defaultTable());
        if (!r.set.isEmpty()) {
            printf("FAILED: value without a class should be ignored\n");
            return false;
        }

        ContourExtractor::ExtractOptions withBackground;
        withBackground.includeBackground = true;
        const ContourExtractor::ExtractResult bg =
            ContourExtractor::extract(mask, ClassTable::defaultTable(), withBackground);
        if (bg.set.isEmpty() || bg.set.annotations.first().label != "background") {
            printf("FAILED: background should be traced when requested\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== Run All Unit Tests =====

    static bool runAllTests() {
        printf("\n=== Raster Unit Tests ===\n\n");

        int passed = 0;
        int failed = 0;

        auto runTest = [&](bool (*test)(), const char* name) {
            if (test()) {
                passed++;
            } else {
                failed++;
                printf("  [FAILED] %s\n", name);
            }
        };

        runTest(testRectangleCoverage, "testRectangleCoverage");
        runTest(testLaterAnnotationsOnTop, "testLaterAnnotationsOnTop");
        runTest(testFreehandOpenAndUnfilled, "testFreehandOpenAndUnfilled");
        runTest(testLineThickness, "testLineThickness");
        runTest(testUnknownLabelSkipped, "testUnknownLabelSkipped");
        runTest(testDeterministic, "testDeterministic");
        runTest(testSizeFallback, "testSizeFallback");
        runTest(testDisplayMask, "testDisplayMask");
        runTest(testExtractEmptyMask, "testExtractEmptyMask");
        runTest(testExtractSquareDropsNoise, "testExtractSquareDropsNoise");
        runTest(testExtractSkipsUnmappedValues, "testExtractSkipsUnmappedValues");

        printf("\n%d passed, %d failed\n", passed, failed);
        return failed == 0;
    }
};
