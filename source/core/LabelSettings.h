#pragma once

// ============================================================================
// LabelSettings - Persistent user preferences (QSettings "MaskLabel"/"App")
// ============================================================================
// Keys:
//   batch/lineThickness      stroke width for lines/freehand in generated masks
//   batch/classMappingFile   "value, label" mapping used when none is given
//   labeling/classes         class list offered in the labeling window
//   labeling/lastFolder      folder opened last time
// ============================================================================

#include "../annotations/ClassTable.h"

#include <QString>
#include <QStringList>

namespace LabelSettings {

constexpr int DEFAULT_LINE_THICKNESS = 5;

/**
 * @brief Class labels offered when no list has been saved yet.
 */
QStringList defaultLabelClasses();

int lineThickness();
void setLineThickness(int thickness);

QString classMappingFile();
void setClassMappingFile(const QString& path);

/**
 * @brief Class table for batch conversion.
 *
 * Reads the configured mapping file if one is set, otherwise returns
 * ClassTable::defaultTable(). A broken mapping file is reported through
 * @p errorMessage / @p ok rather than silently replaced by the default.
 */
ClassTable batchClassTable(QString* errorMessage = nullptr, bool* ok = nullptr);

QStringList labelClasses();
void setLabelClasses(const QStringList& classes);

QString lastFolder();
void setLastFolder(const QString& path);

} // namespace LabelSettings
