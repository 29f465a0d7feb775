#include "AnnotationSet.h"

#include <QFile>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

// ============================================================================
// AnnotationIssue
// ============================================================================

QString AnnotationIssue::kindName(Kind k)
{
    switch (k) {
        case Kind::SchemaError:          return QStringLiteral("SchemaError");
        case Kind::UnknownLabel:         return QStringLiteral("UnknownLabel");
        case Kind::DegenerateGeometry:   return QStringLiteral("DegenerateGeometry");
        case Kind::ImageSizeUnavailable: return QStringLiteral("ImageSizeUnavailable");
    }
    return QStringLiteral("Unknown");
}

QString AnnotationIssue::toString() const
{
    if (annotationIndex >= 0) {
        return QStringLiteral("%1 (annotation %2): %3")
            .arg(kindName(kind)).arg(annotationIndex).arg(message);
    }
    return QStringLiteral("%1: %2").arg(kindName(kind), message);
}

// ============================================================================
// AnnotationSet
// ============================================================================

QJsonObject AnnotationSet::toJson() const
{
    QJsonObject obj;

    QJsonArray arr;
    for (const Annotation& a : annotations) {
        arr.append(a.toJson());
    }
    obj["annotations"] = arr;

    if (!originalSize.isEmpty()) {
        obj["original_size"] = QJsonArray{ originalSize.width(), originalSize.height() };
    }
    return obj;
}

bool AnnotationSet::fromJson(const QJsonObject& obj, AnnotationSet* out,
                             QVector<AnnotationIssue>* issues,
                             QString* errorMessage)
{
    if (!obj.contains("annotations") || !obj["annotations"].isArray()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("record has no 'annotations' array");
        }
        return false;
    }

    AnnotationSet result;

    const QJsonArray arr = obj["annotations"].toArray();
    for (int i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).isObject()) {
            if (issues) {
                issues->append({ AnnotationIssue::Kind::SchemaError, i,
                                 QStringLiteral("entry is not an object") });
            }
            continue;
        }
        Annotation a;
        QString err;
        if (!Annotation::fromJson(arr.at(i).toObject(), &a, &err)) {
            if (issues) {
                issues->append({ AnnotationIssue::Kind::SchemaError, i, err });
            }
            continue;
        }
        result.annotations.append(a);
    }

    // original_size is optional; consumers recover it from the image if needed
    const QJsonArray sizeArr = obj["original_size"].toArray();
    if (sizeArr.size() == 2 && sizeArr.at(0).isDouble() && sizeArr.at(1).isDouble()) {
        const QSize size(sizeArr.at(0).toInt(), sizeArr.at(1).toInt());
        // A zero or negative axis counts as missing
        if (!size.isEmpty()) {
            result.originalSize = size;
        }
    }

    *out = result;
    return true;
}

bool AnnotationSet::loadFromFile(const QString& path, AnnotationSet* out,
                                 QVector<AnnotationIssue>* issues,
                                 QString* errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("JSON parse error in %1: %2")
                                .arg(path, parseError.errorString());
        }
        return false;
    }
    if (!doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 does not contain a JSON object").arg(path);
        }
        return false;
    }

    return fromJson(doc.object(), out, issues, errorMessage);
}

bool AnnotationSet::saveToFile(const QString& path, QString* errorMessage) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot write %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));

    if (!file.commit()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot commit %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    return true;
}
