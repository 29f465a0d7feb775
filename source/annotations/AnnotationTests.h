// ============================================================================
// AnnotationTests - Unit tests for records, their parsing and class tables
// ============================================================================
// Run with: masklabel --test-annotations
// ============================================================================

#pragma once

#include "Annotation.h"
#include "AnnotationSet.h"
#include "ClassTable.h"

#include <QJsonDocument>
#include <QTemporaryDir>
#include <cstdio>

/**
 * @brief Test suite for Annotation, AnnotationSet and ClassTable.
 */
class AnnotationTests {
public:

    static QJsonObject parseObject(const char* json) {
        return QJsonDocument::fromJson(QByteArray(json)).object();
    }

    // ===== Annotation =====

    /**
     * @brief Pairs, flat scalars and a bare [x, y] all decode to points.
     */
    static bool testCoordinateLayouts() {
        printf("  testCoordinateLayouts... ");

        Annotation a;
        if (!Annotation::fromJson(parseObject(
                R"({"label":"object","type":"rectangle","coordinates_original":[[10,20],[30,40]]})"), &a)
            || a.points.size() != 2 || a.points[1] != QPointF(30, 40)) {
            printf("FAILED: pair layout\n");
            return false;
        }

        Annotation b;
        if (!Annotation::fromJson(parseObject(
                R"({"label":"lines","type":"line","coordinates_original":[1.5,2,3,4.5]})"), &b)
            || b.points.size() != 2 || b.points[0] != QPointF(1.5, 2) || b.points[1] != QPointF(3, 4.5)) {
            printf("FAILED: flat layout\n");
            return false;
        }

        Annotation c;
        if (!Annotation::fromJson(parseObject(
                R"({"label":"marker","type":"freehand","coordinates_original":[7,8]})"), &c)
            || c.points.size() != 1 || c.points[0] != QPointF(7, 8) || !c.hasValidArity()) {
            printf("FAILED: single point layout\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testSchemaErrors() {
        printf("  testSchemaErrors... ");

        Annotation a;
        QString err;
        if (Annotation::fromJson(parseObject(
                R"({"type":"rectangle","coordinates_original":[[0,0],[1,1]]})"), &a, &err)) {
            printf("FAILED: missing label accepted\n");
            return false;
        }
        if (Annotation::fromJson(parseObject(
                R"({"label":"x","type":"circle","coordinates_original":[[0,0],[1,1]]})"), &a, &err)) {
            printf("FAILED: unknown type accepted\n");
            return false;
        }
        if (Annotation::fromJson(parseObject(
                R"({"label":"x","type":"line","coordinates_original":[1,2,3]})"), &a, &err)) {
            printf("FAILED: odd scalar count accepted\n");
            return false;
        }
        if (Annotation::fromJson(parseObject(
                R"({"label":"x","type":"line","coordinates_original":[[1,2],[3]]})"), &a, &err)) {
            printf("FAILED: short pair accepted\n");
            return false;
        }
        if (err.isEmpty()) {
            printf("FAILED: no error message\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testRectangleNormalizedAndDegenerate() {
        printf("  testRectangleNormalizedAndDegenerate... ");

        const Annotation r = Annotation::rectangle("object", QPointF(50, 40), QPointF(10, 20));
        if (r.points[0] != QPointF(10, 20) || r.points[1] != QPointF(50, 40)) {
            printf("FAILED: rectangle not normalized\n");
            return false;
        }
        if (r.isDegenerate()) {
            printf("FAILED: 40x20 rectangle marked degenerate\n");
            return false;
        }
        if (!Annotation::rectangle("object", QPointF(10, 10), QPointF(10.5, 30)).isDegenerate()) {
            printf("FAILED: half-pixel-wide rectangle should be degenerate\n");
            return false;
        }
        if (!Annotation::line("lines", QPointF(3, 3), QPointF(3.2, 3.2)).isDegenerate()) {
            printf("FAILED: sub-pixel line should be degenerate\n");
            return false;
        }
        if (Annotation(QStringLiteral("x"), Annotation::Type::Line, { QPointF(0, 0) }).hasValidArity()) {
            printf("FAILED: one-point line has valid arity\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testOutlineDistance() {
        printf("  testOutlineDistance... ");

        const QVector<QPointF> rect = { QPointF(0, 0), QPointF(100, 100) };
        // Center of a rectangle is far from its outline
        if (Annotation::outlineDistance(Annotation::Type::Rectangle, rect, QPointF(50, 50)) < 49.9) {
            printf("FAILED: interior should not be near the outline\n");
            return false;
        }
        if (Annotation::outlineDistance(Annotation::Type::Rectangle, rect, QPointF(100, 50)) > 1e-9) {
            printf("FAILED: point on right edge should have distance 0\n");
            return false;
        }
        const QVector<QPointF> poly = { QPointF(0, 0), QPointF(10, 0), QPointF(10, 10) };
        if (qAbs(Annotation::outlineDistance(Annotation::Type::Freehand, poly, QPointF(13, 5)) - 3.0) > 1e-9) {
            printf("FAILED: polyline distance should be 3\n");
            return false;
        }
        // Open polyline: the closing segment (10,10)->(0,0) does not exist
        if (Annotation::outlineDistance(Annotation::Type::Freehand, poly, QPointF(4, 5)) < 4.9) {
            printf("FAILED: freehand must not be closed\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== AnnotationSet =====

    /**
     * @brief Bad entries are skipped and reported; the rest survive in order.
     */
    static bool testSetSkipsBadEntries() {
        printf("  testSetSkipsBadEntries... ");

        const QJsonObject obj = parseObject(R"({
            "original_size": [640, 480],
            "annotations": [
                {"label":"object","type":"rectangle","coordinates_original":[[1,1],[5,5]]},
                {"label":"object","type":"blob","coordinates_original":[[1,1]]},
                42,
                {"label":"lines","type":"line","coordinates_original":[0,0,9,9]}
            ]})");

        AnnotationSet set;
        QVector<AnnotationIssue> issues;
        if (!AnnotationSet::fromJson(obj, &set, &issues)) {
            printf("FAILED: record should parse\n");
            return false;
        }
        if (set.count() != 2 || set.annotations[0].label != "object" || set.annotations[1].label != "lines") {
            printf("FAILED: expected 2 surviving entries in order, got %d\n", set.count());
            return false;
        }
        if (issues.size() != 2 || issues[0].annotationIndex != 1 || issues[1].annotationIndex != 2) {
            printf("FAILED: expected issues for entries 1 and 2\n");
            return false;
        }
        if (set.originalSize != QSize(640, 480)) {
            printf("FAILED: original_size not read\n");
            return false;
        }

        AnnotationSet none;
        if (AnnotationSet::fromJson(parseObject(R"({"shapes": []})"), &none)) {
            printf("FAILED: record without annotations accepted\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testSetFileRoundTrip() {
        printf("  testSetFileRoundTrip... ");

        QTemporaryDir dir;
        if (!dir.isValid()) {
            printf("FAILED: no temp dir\n");
            return false;
        }
        const QString path = dir.filePath("photo.json");

        AnnotationSet set;
        set.originalSize = QSize(200, 100);
        set.annotations << Annotation::rectangle("object", QPointF(1, 2), QPointF(30, 40))
                        << Annotation::freehand("path", { QPointF(0, 0), QPointF(5, 5), QPointF(9, 2) });

        QString err;
        if (!set.saveToFile(path, &err)) {
            printf("FAILED: save: %s\n", qPrintable(err));
            return false;
        }

        AnnotationSet loaded;
        if (!AnnotationSet::loadFromFile(path, &loaded, nullptr, &err)) {
            printf("FAILED: load: %s\n", qPrintable(err));
            return false;
        }
        if (loaded.count() != 2 || loaded.originalSize != QSize(200, 100)
            || loaded.annotations[1].type != Annotation::Type::Freehand
            || loaded.annotations[1].points != set.annotations[1].points) {
            printf("FAILED: reloaded record differs\n");
            return false;
        }

        AnnotationSet missing;
        if (AnnotationSet::loadFromFile(dir.filePath("absent.json"), &missing, nullptr, &err)) {
            printf("FAILED: missing file loaded\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== ClassTable =====

    static bool testClassTableRejectsConflicts() {
        printf("  testClassTableRejectsConflicts... ");

        ClassTable t;
        if (!t.addClass(0, "background") || !t.addClass(1, "lines") || !t.addClass(2, "object")) {
            printf("FAILED: valid classes rejected\n");
            return false;
        }
        QString err;
        if (t.addClass(1, "person", &err) || err.isEmpty()) {
            printf("FAILED: duplicate id accepted\n");
            return false;
        }
        if (t.addClass(3, "object")) {
            printf("FAILED: duplicate label accepted\n");
            return false;
        }
        if (t.addClass(256, "big") || t.addClass(-1, "neg")) {
            printf("FAILED: out-of-range id accepted\n");
            return false;
        }
        if (t.addClass(4, "   ")) {
            printf("FAILED: blank label accepted\n");
            return false;
        }
        if (t.size() != 3 || t.idForLabel("object") != 2 || t.labelForId(1) != "lines"
            || t.idForLabel("person") != -1) {
            printf("FAILED: table changed by rejected inserts\n");
            return false;
        }

        ClassTable bg;
        if (bg.addClass(0, "lines")) {
            printf("FAILED: id 0 bound to a non-background label\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool testParseMapping() {
        printf("  testParseMapping... ");

        bool ok = false;
        QString err;
        const ClassTable t = ClassTable::parseMapping(
            "# comment\n0, background\n\n1, lines\n 2 ,object \n", &err, &ok);
        if (!ok || t.size() != 3 || t.idForLabel("object") != 2) {
            printf("FAILED: valid mapping rejected: %s\n", qPrintable(err));
            return false;
        }

        ClassTable::parseMapping("1, lines\nfoo\n", &err, &ok);
        if (ok || !err.startsWith("line 2")) {
            printf("FAILED: malformed line should be reported as line 2, got '%s'\n", qPrintable(err));
            return false;
        }
        ClassTable::parseMapping("1, lines\n2, lines\n", &err, &ok);
        if (ok || !err.contains("duplicate")) {
            printf("FAILED: duplicate label should be rejected\n");
            return false;
        }
        ClassTable::parseMapping("x, lines\n", &err, &ok);
        if (ok) {
            printf("FAILED: non-integer value accepted\n");
            return false;
        }
        ClassTable::parseMapping("\n# only comments\n", &err, &ok);
        if (ok) {
            printf("FAILED: empty mapping accepted\n");
            return false;
        }

        const ClassTable again = ClassTable::parseMapping(t.toMappingText(), nullptr, &ok);
        if (!ok || again.size() != t.size()) {
            printf("FAILED: toMappingText output does not parse back\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Display values spread ids over 0..255 and never collapse.
     */
    static bool testDisplayScaling() {
        printf("  testDisplayScaling... ");

        const ClassTable def = ClassTable::defaultTable();
        if (def.size() != 8 || def.nonBackgroundCount() != 7) {
            printf("FAILED: default table should have background + 7 classes\n");
            return false;
        }
        // 7 classes: id 1 -> round(255/7) = 36, id 7 -> 255
        if (def.displayValue(0) != 0 || def.displayValue(1) != 36 || def.displayValue(7) != 255) {
            printf("FAILED: unexpected display values %d %d %d\n",
                   def.displayValue(0), def.displayValue(1), def.displayValue(7));
            return false;
        }

        bool ok = false;
        const ClassTable scaled = def.displayScaled(nullptr, &ok);
        if (!ok || scaled.idForLabel("lines") != 36 || scaled.idForLabel("path") != 255) {
            printf("FAILED: displayScaled table wrong\n");
            return false;
        }

        // 1 class with id 200: round(200 * 255 / 1) clamps to 255
        ClassTable sparse;
        sparse.addClass(200, "object");
        if (sparse.displayValue(200) != 255) {
            printf("FAILED: display value should clamp to 255\n");
            return false;
        }

        // Two ids that both clamp to 255 collapse and must be rejected
        ClassTable crowded;
        crowded.addClass(1, "a");
        crowded.addClass(2, "b");
        crowded.addClass(3, "c");
        crowded.addClass(4, "d");
        crowded.addClass(100, "e");
        crowded.addClass(101, "f");
        QString err;
        crowded.displayScaled(&err, &ok);
        if (ok || err.isEmpty()) {
            printf("FAILED: collapsing display values accepted\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== Run All Unit Tests =====

    static bool runAllTests() {
        printf("\n=== Annotation Unit Tests ===\n\n");

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

        runTest(testCoordinateLayouts, "testCoordinateLayouts");
        runTest(testSchemaErrors, "testSchemaErrors");
        runTest(testRectangleNormalizedAndDegenerate, "testRectangleNormalizedAndDegenerate");
        runTest(testOutlineDistance, "testOutlineDistance");
        runTest(testSetSkipsBadEntries, "testSetSkipsBadEntries");
        runTest(testSetFileRoundTrip, "testSetFileRoundTrip");
        runTest(testClassTableRejectsConflicts, "testClassTableRejectsConflicts");
        runTest(testParseMapping, "testParseMapping");
        runTest(testDisplayScaling, "testDisplayScaling");

        printf("\n%d passed, %d failed\n", passed, failed);
        return failed == 0;
    }
};
