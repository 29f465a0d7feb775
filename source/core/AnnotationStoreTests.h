// ============================================================================
// AnnotationStoreTests - Unit tests for per-image records and their files
// ============================================================================
// Run with: masklabel --test-store
// ============================================================================

#pragma once

#include "AnnotationStore.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <cstdio>

/**
 * @brief Test suite for AnnotationStore.
 */
class AnnotationStoreTests {
public:

    static Annotation box(const QString& label = QStringLiteral("object")) {
        return Annotation::rectangle(label, QPointF(10, 10), QPointF(50, 50));
    }

    static bool testAppendValidates() {
        printf("  testAppendValidates... ");

        AnnotationStore store;
        QString reason;
        if (store.append("a.png", Annotation::rectangle("", QPointF(0, 0), QPointF(9, 9)), QSize(100, 100), &reason)) {
            printf("FAILED: unlabeled annotation accepted\n");
            return false;
        }
        if (store.append("a.png", Annotation::rectangle("object", QPointF(5, 5), QPointF(5.4, 40)), QSize(100, 100), &reason)) {
            printf("FAILED: zero-width rectangle accepted\n");
            return false;
        }
        if (store.append("a.png", Annotation(QStringLiteral("lines"), Annotation::Type::Line, { QPointF(1, 1) }),
                         QSize(100, 100), &reason)) {
            printf("FAILED: one-point line accepted\n");
            return false;
        }
        if (store.isDirty() || store.contains("a.png")) {
            printf("FAILED: rejected appends must not change state\n");
            return false;
        }

        if (!store.append("a.png", box(), QSize(100, 80))) {
            printf("FAILED: valid rectangle rejected\n");
            return false;
        }
        if (!store.isDirty() || store.annotationSet("a.png").originalSize != QSize(100, 80)) {
            printf("FAILED: append should mark dirty and capture the image size\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testDeleteOutOfRange() {
        printf("  testDeleteOutOfRange... ");

        AnnotationStore store;
        store.append("a.png", box("object"), QSize(100, 100));
        store.append("a.png", box("person"), QSize(100, 100));

        if (store.deleteAt("a.png", 2) || store.deleteAt("a.png", -1) || store.deleteAt("b.png", 0)) {
            printf("FAILED: out-of-range delete should be a no-op\n");
            return false;
        }
        if (!store.deleteAt("a.png", 0) || store.annotations("a.png").size() != 1
            || store.annotations("a.png").first().label != "person") {
            printf("FAILED: delete removed the wrong entry\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Saving writes non-empty records and removes emptied ones.
     */
    static bool testSaveRemovesEmptyRecords() {
        printf("  testSaveRemovesEmptyRecords... ");

        QTemporaryDir tmp;
        if (!tmp.isValid()) {
            printf("FAILED: no temp dir\n");
            return false;
        }
        const QString dir = tmp.filePath("json_data");

        AnnotationStore store;
        store.append("a.png", box(), QSize(100, 100));
        store.append("b.jpg", box(), QSize(100, 100));

        AnnotationStore::SaveResult first = store.save(dir);
        if (!first.success() || first.savedCount != 2 || store.isDirty()) {
            printf("FAILED: first save should write 2 records and clear dirty\n");
            return false;
        }
        if (!QFile::exists(QDir(dir).filePath("a.json")) || !QFile::exists(QDir(dir).filePath("b.json"))) {
            printf("FAILED: record files missing\n");
            return false;
        }

        store.deleteAt("b.jpg", 0);
        AnnotationStore::SaveResult second = store.save(dir);
        if (!second.success() || second.deletedCount != 1 || second.savedCount != 1) {
            printf("FAILED: second save should keep a.json and remove b.json\n");
            return false;
        }
        if (QFile::exists(QDir(dir).filePath("b.json"))) {
            printf("FAILED: empty record left on disk\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static QByteArray readAll(const QString& path) {
        QFile f(path);
        return f.open(QIODevice::ReadOnly) ? f.readAll() : QByteArray();
    }

    /**
     * @brief A second save with no edits in between rewrites identical bytes.
     */
    static bool testSaveTwiceIsIdentical() {
        printf("  testSaveTwiceIsIdentical... ");

        QTemporaryDir tmp;
        const QString dir = tmp.path();

        AnnotationStore store;
        store.append("a.png", box("object"), QSize(120, 90));
        store.append("a.png", Annotation::line("lines", QPointF(1.5, 2), QPointF(80, 60.25)), QSize(120, 90));
        store.append("b.png", Annotation::freehand("path", { QPointF(3, 3), QPointF(7, 9), QPointF(12, 4) }),
                     QSize(64, 48));

        if (!store.save(dir).success() || store.isDirty()) {
            printf("FAILED: first save should succeed and clear dirty\n");
            return false;
        }
        const QByteArray a1 = readAll(QDir(dir).filePath("a.json"));
        const QByteArray b1 = readAll(QDir(dir).filePath("b.json"));

        const AnnotationStore::SaveResult second = store.save(dir);
        if (!second.success() || second.savedCount != 2 || store.isDirty()) {
            printf("FAILED: second save should rewrite both records\n");
            return false;
        }
        if (a1.isEmpty() || b1.isEmpty()
            || readAll(QDir(dir).filePath("a.json")) != a1
            || readAll(QDir(dir).filePath("b.json")) != b1) {
            printf("FAILED: record bytes changed between saves\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief a.jpg and a.png share a.json; clearing one never deletes the other's file.
     */
    static bool testSharedRecordFileNotDeleted() {
        printf("  testSharedRecordFileNotDeleted... ");

        QTemporaryDir tmp;
        const QString dir = tmp.path();
        const QString path = QDir(dir).filePath("a.json");

        AnnotationStore store;
        store.append("a.jpg", box("object"), QSize(100, 100));
        store.clear("a.png", QSize(100, 100));

        const AnnotationStore::SaveResult saved = store.save(dir);
        if (!saved.success() || saved.savedCount != 1 || saved.deletedCount != 0) {
            printf("FAILED: expected one write and no delete\n");
            return false;
        }
        AnnotationSet onDisk;
        if (!AnnotationSet::loadFromFile(path, &onDisk) || onDisk.annotations.size() != 1) {
            printf("FAILED: a.json lost the annotations of a.jpg\n");
            return false;
        }

        // Both images annotated: only the first is written, the clash is an error
        store.append("a.png", box("person"), QSize(100, 100));
        const AnnotationStore::SaveResult clash = store.save(dir);
        if (clash.success() || clash.errorCount != 1 || clash.savedCount != 1 || !store.isDirty()) {
            printf("FAILED: two records for one file should be reported\n");
            return false;
        }
        if (!AnnotationSet::loadFromFile(path, &onDisk) || onDisk.annotations.size() != 1
            || onDisk.annotations.first().label != "object") {
            printf("FAILED: a.json should still hold the a.jpg record\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Clearing an image never loaded in memory still removes its stale file.
     */
    static bool testClearRemovesStaleFile() {
        printf("  testClearRemovesStaleFile... ");

        QTemporaryDir tmp;
        const QString dir = tmp.path();

        AnnotationSet stale;
        stale.annotations << box();
        stale.saveToFile(QDir(dir).filePath("c.json"));

        AnnotationStore store;
        if (!store.clear("c.png", QSize(10, 10)) || !store.isDirty()) {
            printf("FAILED: clear should succeed and mark dirty\n");
            return false;
        }
        if (store.clear(QString())) {
            printf("FAILED: clear without an image should fail\n");
            return false;
        }
        store.save(dir);
        if (QFile::exists(QDir(dir).filePath("c.json"))) {
            printf("FAILED: stale record survived the save\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Loading keeps unsaved in-memory edits and reports broken files.
     */
    static bool testLoadStatuses() {
        printf("  testLoadStatuses... ");

        QTemporaryDir tmp;
        const QString dir = tmp.path();

        AnnotationSet onDisk;
        onDisk.originalSize = QSize(64, 64);
        onDisk.annotations << box("object") << box("person");
        onDisk.saveToFile(QDir(dir).filePath("d.json"));

        QFile broken(QDir(dir).filePath("e.json"));
        broken.open(QIODevice::WriteOnly);
        broken.write("{ not json");
        broken.close();

        AnnotationStore store;
        if (store.load("d.png", dir) != AnnotationStore::LoadStatus::Loaded
            || store.annotations("d.png").size() != 2) {
            printf("FAILED: d.json should load with 2 annotations\n");
            return false;
        }
        if (store.isDirty()) {
            printf("FAILED: loading must not mark dirty\n");
            return false;
        }

        store.deleteAt("d.png", 0);
        if (store.load("d.png", dir) != AnnotationStore::LoadStatus::AlreadyLoaded
            || store.annotations("d.png").size() != 1) {
            printf("FAILED: reload should keep the in-memory edit\n");
            return false;
        }

        QString err;
        if (store.load("e.png", dir, &err) != AnnotationStore::LoadStatus::ParseError || err.isEmpty()) {
            printf("FAILED: broken record should report a parse error\n");
            return false;
        }
        if (store.load("f.png", dir) != AnnotationStore::LoadStatus::NotFound) {
            printf("FAILED: missing record should be NotFound\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testRecordFileName() {
        printf("  testRecordFileName... ");

        if (AnnotationStore::recordFileName("photo.png") != "photo.json"
            || AnnotationStore::recordFileName("scan.v2.TIFF") != "scan.v2.json") {
            printf("FAILED: unexpected record file names\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== Run All Unit Tests =====

    static bool runAllTests() {
        printf("\n=== AnnotationStore Unit Tests ===\n\n");

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

        runTest(testAppendValidates, "testAppendValidates");
        runTest(testDeleteOutOfRange, "testDeleteOutOfRange");
        runTest(testSaveRemovesEmptyRecords, "testSaveRemovesEmptyRecords");
        runTest(testSaveTwiceIsIdentical, "testSaveTwiceIsIdentical");
        runTest(testSharedRecordFileNotDeleted, "testSharedRecordFileNotDeleted");
        runTest(testClearRemovesStaleFile, "testClearRemovesStaleFile");
        runTest(testLoadStatuses, "testLoadStatuses");
        runTest(testRecordFileName, "testRecordFileName");

        printf("\n%d passed, %d failed\n", passed, failed);
        return failed == 0;
    }
};
