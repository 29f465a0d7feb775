#include "LabelSettings.h"

#include <QSettings>

namespace LabelSettings {

QStringList defaultLabelClasses()
{
    return { QStringLiteral("object"), QStringLiteral("lines"), QStringLiteral("person"),
             QStringLiteral("vehicle"), QStringLiteral("animal"), QStringLiteral("marker"),
             QStringLiteral("path") };
}

int lineThickness()
{
    QSettings settings("MaskLabel", "App");
    const int value = settings.value("batch/lineThickness", DEFAULT_LINE_THICKNESS).toInt();
    return value > 0 ? value : DEFAULT_LINE_THICKNESS;
}

void setLineThickness(int thickness)
{
    QSettings settings("MaskLabel", "App");
    settings.setValue("batch/lineThickness", thickness);
}

QString classMappingFile()
{
    QSettings settings("MaskLabel", "App");
    return settings.value("batch/classMappingFile").toString();
}

void setClassMappingFile(const QString& path)
{
    QSettings settings("MaskLabel", "App");
    settings.setValue("batch/classMappingFile", path);
}

ClassTable batchClassTable(QString* errorMessage, bool* ok)
{
    const QString path = classMappingFile();
    if (path.isEmpty()) {
        if (ok) {
            *ok = true;
        }
        return ClassTable::defaultTable();
    }
    return ClassTable::loadFromFile(path, errorMessage, ok);
}

QStringList labelClasses()
{
    QSettings settings("MaskLabel", "App");
    const QStringList saved = settings.value("labeling/classes").toStringList();
    return saved.isEmpty() ? defaultLabelClasses() : saved;
}

void setLabelClasses(const QStringList& classes)
{
    QSettings settings("MaskLabel", "App");
    settings.setValue("labeling/classes", classes);
}

QString lastFolder()
{
    QSettings settings("MaskLabel", "App");
    return settings.value("labeling/lastFolder").toString();
}

void setLastFolder(const QString& path)
{
    QSettings settings("MaskLabel", "App");
    settings.setValue("labeling/lastFolder", path);
}

} // namespace LabelSettings
