#pragma once

// ============================================================================
// AnnotationSet - All annotations of one image, in paint order
// ============================================================================

#include "Annotation.h"

#include <QSize>
#include <QString>
#include <QVector>
#include <QJsonObject>

/**
 * @brief A non-fatal or per-item problem found while handling annotations.
 */
struct AnnotationIssue {
    enum class Kind {
        SchemaError,            ///< Missing field or wrong arity
        UnknownLabel,           ///< Label not present in the class table
        DegenerateGeometry,     ///< Shape with no drawable extent
        ImageSizeUnavailable    ///< No stored size and no readable source image
    };

    Kind kind = Kind::SchemaError;
    int annotationIndex = -1;   ///< Index in the set, or -1 for the whole record
    QString message;

    static QString kindName(Kind k);
    QString toString() const;
};

/**
 * @brief The vector record of one image.
 *
 * Paint order is list order: later annotations cover earlier ones when
 * rasterized. originalSize is the pixel size of the image the annotations
 * were drawn on; it may be invalid for records written by older tools.
 */
struct AnnotationSet {
    QVector<Annotation> annotations;
    QSize originalSize;

    bool isEmpty() const { return annotations.isEmpty(); }
    int count() const { return annotations.size(); }

    QJsonObject toJson() const;

    /**
     * @brief Parse a record.
     *
     * A record without an "annotations" array is a schema error. Individual
     * entries that fail to parse are skipped and reported in @p issues; the
     * remaining entries are kept in order. A missing or malformed
     * "original_size" leaves originalSize invalid.
     *
     * @return True if the record itself was well-formed.
     */
    static bool fromJson(const QJsonObject& obj, AnnotationSet* out,
                         QVector<AnnotationIssue>* issues = nullptr,
                         QString* errorMessage = nullptr);

    /**
     * @brief Read and parse a record file.
     * @return True on success; false if the file is unreadable or not a valid record.
     */
    static bool loadFromFile(const QString& path, AnnotationSet* out,
                             QVector<AnnotationIssue>* issues = nullptr,
                             QString* errorMessage = nullptr);

    /**
     * @brief Serialize (indented) and write atomically.
     */
    bool saveToFile(const QString& path, QString* errorMessage = nullptr) const;
};
