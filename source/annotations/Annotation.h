#pragma once

// ============================================================================
// Annotation - A labeled shape drawn over an image
// ============================================================================
// Coordinates are always stored in original-image pixel space, so a record
// stays valid no matter how the image was zoomed or panned while drawing.
// ============================================================================

#include <QString>
#include <QVector>
#include <QPointF>
#include <QRectF>
#include <QLineF>
#include <QJsonObject>
#include <QJsonArray>
#include <QtMath>
#include <limits>

/**
 * @brief A single annotation: a label, a shape type and its point list.
 *
 * Rectangles and lines carry exactly two points. A rectangle is stored
 * normalized (top-left, bottom-right). Freehand strokes carry one or more
 * points and are always treated as open polylines.
 */
struct Annotation {
    /**
     * @brief Shape kinds an annotation can take.
     */
    enum class Type {
        Rectangle,
        Line,
        Freehand
    };

    QString label;                  ///< Class label (must be non-empty)
    Type type = Type::Rectangle;    ///< Shape kind
    QVector<QPointF> points;        ///< Points in original-image pixels

    Annotation() = default;
    Annotation(const QString& lbl, Type t, const QVector<QPointF>& pts)
        : label(lbl), type(t), points(pts) {}

    /**
     * @brief Build a rectangle from two opposite corners, normalized.
     */
    static Annotation rectangle(const QString& lbl, const QPointF& a, const QPointF& b) {
        return Annotation(lbl, Type::Rectangle,
                          { QPointF(qMin(a.x(), b.x()), qMin(a.y(), b.y())),
                            QPointF(qMax(a.x(), b.x()), qMax(a.y(), b.y())) });
    }

    static Annotation line(const QString& lbl, const QPointF& a, const QPointF& b) {
        return Annotation(lbl, Type::Line, { a, b });
    }

    static Annotation freehand(const QString& lbl, const QVector<QPointF>& pts) {
        return Annotation(lbl, Type::Freehand, pts);
    }

    /**
     * @brief Check the point count against the shape type.
     * @return True if rectangle/line have exactly 2 points and freehand has at least 1.
     */
    bool hasValidArity() const {
        switch (type) {
            case Type::Rectangle:
            case Type::Line:
                return points.size() == 2;
            case Type::Freehand:
                return !points.isEmpty();
        }
        return false;
    }

    /**
     * @brief Check whether the shape has a drawable extent.
     *
     * Rectangles need at least one pixel on both axes, lines at least one
     * pixel of length. Freehand strokes are never degenerate once they
     * have a point.
     */
    bool isDegenerate() const {
        if (!hasValidArity()) {
            return true;
        }
        switch (type) {
            case Type::Rectangle:
                return qAbs(points[1].x() - points[0].x()) < 1.0 ||
                       qAbs(points[1].y() - points[0].y()) < 1.0;
            case Type::Line:
                return QLineF(points[0], points[1]).length() < 1.0;
            case Type::Freehand:
                return false;
        }
        return true;
    }

    QRectF boundingRect() const {
        if (points.isEmpty()) {
            return QRectF();
        }
        qreal minX = points[0].x(), maxX = minX;
        qreal minY = points[0].y(), maxY = minY;
        for (const QPointF& pt : points) {
            minX = qMin(minX, pt.x());
            maxX = qMax(maxX, pt.x());
            minY = qMin(minY, pt.y());
            maxY = qMax(maxY, pt.y());
        }
        return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
    }

    /**
     * @brief Distance from @p p to the outline of a shape given by @p pts.
     *
     * Rectangles are measured against their four edges (not the interior),
     * lines against the segment, freehand against the open polyline.
     * The points may be in any space, as long as @p p is in the same one.
     */
    static qreal outlineDistance(Type t, const QVector<QPointF>& pts, const QPointF& p) {
        if (pts.isEmpty()) {
            return std::numeric_limits<qreal>::max();
        }
        if (pts.size() == 1) {
            return QLineF(p, pts[0]).length();
        }
        if (t == Type::Rectangle) {
            const QPointF tl = pts[0], br = pts[1];
            const QPointF tr(br.x(), tl.y()), bl(tl.x(), br.y());
            return qMin(qMin(distanceToSegment(p, tl, tr), distanceToSegment(p, tr, br)),
                        qMin(distanceToSegment(p, br, bl), distanceToSegment(p, bl, tl)));
        }
        qreal best = std::numeric_limits<qreal>::max();
        for (int i = 1; i < pts.size(); ++i) {
            best = qMin(best, distanceToSegment(p, pts[i - 1], pts[i]));
        }
        return best;
    }

    static qreal distanceToSegment(const QPointF& p, const QPointF& a, const QPointF& b) {
        QPointF ab = b - a;
        QPointF ap = p - a;
        qreal lenSq = ab.x() * ab.x() + ab.y() * ab.y();
        if (lenSq < 0.0001) return QLineF(p, a).length();
        qreal t = qBound(0.0, (ap.x() * ab.x() + ap.y() * ab.y()) / lenSq, 1.0);
        QPointF closest = a + t * ab;
        return QLineF(p, closest).length();
    }

    // ===== Type names =====

    static QString typeToString(Type t) {
        switch (t) {
            case Type::Rectangle: return QStringLiteral("rectangle");
            case Type::Line:      return QStringLiteral("line");
            case Type::Freehand:  return QStringLiteral("freehand");
        }
        return QString();
    }

    static bool typeFromString(const QString& name, Type* out) {
        if (name == QLatin1String("rectangle")) {
            *out = Type::Rectangle;
        } else if (name == QLatin1String("line")) {
            *out = Type::Line;
        } else if (name == QLatin1String("freehand")) {
            *out = Type::Freehand;
        } else {
            return false;
        }
        return true;
    }

    // ===== Serialization =====

    /**
     * @brief Serialize to JSON. Points are always written as [x, y] pairs.
     */
    QJsonObject toJson() const {
        QJsonObject obj;
        obj["label"] = label;
        obj["type"] = typeToString(type);

        QJsonArray coords;
        for (const QPointF& pt : points) {
            coords.append(QJsonArray{ pt.x(), pt.y() });
        }
        obj["coordinates_original"] = coords;
        return obj;
    }

    /**
     * @brief Parse an annotation from JSON.
     *
     * Accepts coordinates as a list of [x, y] pairs, as a flat list of
     * scalars ([x1, y1, x2, y2]) or, for a single point, as a bare [x, y].
     * Arity against the type is not checked here; see hasValidArity().
     *
     * @param obj JSON object to parse.
     * @param out Receives the annotation on success.
     * @param errorMessage Optional description of the schema problem.
     * @return True if all required fields were present and well-formed.
     */
    static bool fromJson(const QJsonObject& obj, Annotation* out, QString* errorMessage = nullptr) {
        auto fail = [errorMessage](const QString& msg) {
            if (errorMessage) {
                *errorMessage = msg;
            }
            return false;
        };

        if (!obj.contains("label") || !obj["label"].isString()) {
            return fail(QStringLiteral("missing or non-string 'label'"));
        }
        if (!obj.contains("type") || !obj["type"].isString()) {
            return fail(QStringLiteral("missing or non-string 'type'"));
        }
        Type t;
        if (!typeFromString(obj["type"].toString(), &t)) {
            return fail(QStringLiteral("unknown annotation type '%1'").arg(obj["type"].toString()));
        }
        if (!obj.contains("coordinates_original") || !obj["coordinates_original"].isArray()) {
            return fail(QStringLiteral("missing 'coordinates_original'"));
        }

        QVector<QPointF> pts;
        if (!parsePoints(obj["coordinates_original"].toArray(), &pts)) {
            return fail(QStringLiteral("malformed 'coordinates_original'"));
        }

        out->label = obj["label"].toString();
        out->type = t;
        out->points = pts;
        return true;
    }

    /**
     * @brief Decode a coordinate array in any accepted layout.
     */
    static bool parsePoints(const QJsonArray& arr, QVector<QPointF>* out) {
        out->clear();
        if (arr.isEmpty()) {
            return true;
        }

        if (arr.at(0).isArray()) {
            // [[x, y], [x, y], ...]
            for (const QJsonValue& v : arr) {
                if (!v.isArray()) {
                    return false;
                }
                const QJsonArray pair = v.toArray();
                if (pair.size() != 2 || !pair.at(0).isDouble() || !pair.at(1).isDouble()) {
                    return false;
                }
                out->append(QPointF(pair.at(0).toDouble(), pair.at(1).toDouble()));
            }
            return true;
        }

        // Flat scalars: [x1, y1, x2, y2, ...] or a single [x, y]
        if (arr.size() % 2 != 0) {
            return false;
        }
        for (int i = 0; i < arr.size(); i += 2) {
            if (!arr.at(i).isDouble() || !arr.at(i + 1).isDouble()) {
                return false;
            }
            out->append(QPointF(arr.at(i).toDouble(), arr.at(i + 1).toDouble()));
        }
        return true;
    }
};
