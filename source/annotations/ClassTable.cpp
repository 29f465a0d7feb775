#include "ClassTable.h"

#include <QFile>
#include <QTextStream>
#include <QStringList>
#include <QtMath>

namespace {

const char* BACKGROUND_LABEL = "background";

void setError(QString* errorMessage, const QString& msg)
{
    if (errorMessage) {
        *errorMessage = msg;
    }
}

void setOk(bool* ok, bool value)
{
    if (ok) {
        *ok = value;
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

bool ClassTable::addClass(int id, const QString& label, QString* errorMessage)
{
    const QString trimmed = label.trimmed();

    if (id < BACKGROUND_ID || id > MAX_ID) {
        setError(errorMessage, QStringLiteral("class id %1 is outside 0..%2").arg(id).arg(MAX_ID));
        return false;
    }
    if (trimmed.isEmpty()) {
        setError(errorMessage, QStringLiteral("class id %1 has an empty label").arg(id));
        return false;
    }
    if (id == BACKGROUND_ID && trimmed != QLatin1String(BACKGROUND_LABEL)) {
        setError(errorMessage, QStringLiteral("id 0 is reserved for '%1', got '%2'")
                                   .arg(QLatin1String(BACKGROUND_LABEL), trimmed));
        return false;
    }
    if (m_labelById.contains(id)) {
        setError(errorMessage, QStringLiteral("duplicate class id %1 ('%2' and '%3')")
                                   .arg(id).arg(m_labelById.value(id), trimmed));
        return false;
    }
    if (m_idByLabel.contains(trimmed)) {
        setError(errorMessage, QStringLiteral("duplicate label '%1' (ids %2 and %3)")
                                   .arg(trimmed).arg(m_idByLabel.value(trimmed)).arg(id));
        return false;
    }

    m_entries.append({ id, trimmed });
    m_labelById.insert(id, trimmed);
    m_idByLabel.insert(trimmed, id);
    return true;
}

ClassTable ClassTable::fromEntries(const QVector<Entry>& entries,
                                   QString* errorMessage, bool* ok)
{
    ClassTable table;
    for (const Entry& e : entries) {
        if (!table.addClass(e.id, e.label, errorMessage)) {
            setOk(ok, false);
            return ClassTable();
        }
    }
    setOk(ok, true);
    return table;
}

ClassTable ClassTable::parseMapping(const QString& text, QString* errorMessage, bool* ok)
{
    ClassTable table;
    const QStringList lines = text.split(QLatin1Char('\n'));

    for (int i = 0; i < lines.size(); ++i) {
        const QString line = lines.at(i).trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }

        const int comma = line.indexOf(QLatin1Char(','));
        if (comma < 0) {
            setError(errorMessage, QStringLiteral("line %1: expected 'pixel_value, label', got '%2'")
                                       .arg(i + 1).arg(line));
            setOk(ok, false);
            return ClassTable();
        }

        bool idOk = false;
        const int id = line.left(comma).trimmed().toInt(&idOk);
        const QString label = line.mid(comma + 1).trimmed();
        if (!idOk) {
            setError(errorMessage, QStringLiteral("line %1: pixel value '%2' is not an integer")
                                       .arg(i + 1).arg(line.left(comma).trimmed()));
            setOk(ok, false);
            return ClassTable();
        }

        QString err;
        if (!table.addClass(id, label, &err)) {
            setError(errorMessage, QStringLiteral("line %1: %2").arg(i + 1).arg(err));
            setOk(ok, false);
            return ClassTable();
        }
    }

    if (table.isEmpty()) {
        setError(errorMessage, QStringLiteral("mapping defines no classes"));
        setOk(ok, false);
        return ClassTable();
    }

    setOk(ok, true);
    return table;
}

ClassTable ClassTable::loadFromFile(const QString& path, QString* errorMessage, bool* ok)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        setError(errorMessage, QStringLiteral("cannot open class mapping %1: %2")
                                   .arg(path, file.errorString()));
        setOk(ok, false);
        return ClassTable();
    }
    QTextStream in(&file);
    return parseMapping(in.readAll(), errorMessage, ok);
}

ClassTable ClassTable::defaultTable()
{
    return fromEntries({
        { 0, QStringLiteral("background") },
        { 1, QStringLiteral("lines") },
        { 2, QStringLiteral("object") },
        { 3, QStringLiteral("person") },
        { 4, QStringLiteral("vehicle") },
        { 5, QStringLiteral("animal") },
        { 6, QStringLiteral("marker") },
        { 7, QStringLiteral("path") },
    });
}

// ============================================================================
// Display scaling
// ============================================================================

int ClassTable::nonBackgroundCount() const
{
    int count = 0;
    for (const Entry& e : m_entries) {
        if (e.id != BACKGROUND_ID) {
            ++count;
        }
    }
    return count;
}

int ClassTable::displayValue(int id) const
{
    const int n = nonBackgroundCount();
    if (id == BACKGROUND_ID || n == 0) {
        return id;
    }
    return qMin(MAX_ID, qRound(id * 255.0 / n));
}

ClassTable ClassTable::displayScaled(QString* errorMessage, bool* ok) const
{
    ClassTable scaled;
    for (const Entry& e : m_entries) {
        QString err;
        if (!scaled.addClass(displayValue(e.id), e.label, &err)) {
            setError(errorMessage, QStringLiteral("display scaling collapses class '%1': %2")
                                       .arg(e.label, err));
            setOk(ok, false);
            return ClassTable();
        }
    }
    setOk(ok, true);
    return scaled;
}

QString ClassTable::toMappingText() const
{
    QString text;
    for (const Entry& e : m_entries) {
        text += QStringLiteral("%1, %2\n").arg(e.id).arg(e.label);
    }
    return text;
}
