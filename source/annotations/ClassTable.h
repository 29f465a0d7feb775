#pragma once

// ============================================================================
// ClassTable - Validated label <-> class id mapping for mask rasters
// ============================================================================

#include <QString>
#include <QVector>
#include <QHash>

/**
 * @brief Bidirectional mapping between class labels and raster values.
 *
 * Ids are 8-bit raster values (0..255). Id 0 is reserved for the
 * "background" label. Neither ids nor labels may repeat; all construction
 * paths reject duplicates instead of silently overwriting an entry.
 *
 * Entry order is preserved and is the order in which conversions visit
 * classes.
 */
class ClassTable {
public:
    struct Entry {
        int id = 0;
        QString label;
    };

    static constexpr int BACKGROUND_ID = 0;
    static constexpr int MAX_ID = 255;

    ClassTable() = default;

    /**
     * @brief Build a table from a list of entries.
     * @param ok Set to false (and an empty table returned) on the first invalid entry.
     */
    static ClassTable fromEntries(const QVector<Entry>& entries,
                                  QString* errorMessage = nullptr,
                                  bool* ok = nullptr);

    /**
     * @brief Parse mapping text with one "value, label" pair per line.
     *
     * Blank lines and lines starting with '#' are ignored. Errors name the
     * offending line number.
     */
    static ClassTable parseMapping(const QString& text,
                                   QString* errorMessage = nullptr,
                                   bool* ok = nullptr);

    /**
     * @brief Read a mapping file in the format accepted by parseMapping().
     */
    static ClassTable loadFromFile(const QString& path,
                                   QString* errorMessage = nullptr,
                                   bool* ok = nullptr);

    /**
     * @brief The built-in class set used when no mapping is configured.
     */
    static ClassTable defaultTable();

    /**
     * @brief Add one class.
     * @return False (table unchanged) if the id is out of range, the label is
     *         empty, id 0 is bound to something other than "background", or
     *         the id or label already exists.
     */
    bool addClass(int id, const QString& label, QString* errorMessage = nullptr);

    bool containsId(int id) const { return m_labelById.contains(id); }
    bool containsLabel(const QString& label) const { return m_idByLabel.contains(label); }

    /// @return The id of @p label, or -1 if unknown.
    int idForLabel(const QString& label) const { return m_idByLabel.value(label, -1); }

    /// @return The label of @p id, or an empty string if unknown.
    QString labelForId(int id) const { return m_labelById.value(id); }

    const QVector<Entry>& entries() const { return m_entries; }
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

    /// @return Number of entries whose id is not the background id.
    int nonBackgroundCount() const;

    /**
     * @brief Raster value used for @p id in a display-scaled mask.
     *
     * Spreads the non-background ids over 0..255:
     * round(id * 255 / nonBackgroundCount), clamped to 255. Id 0 stays 0.
     */
    int displayValue(int id) const;

    /**
     * @brief The same classes keyed by their display-scaled values.
     *
     * Used to read back masks that were written with display scaling.
     * Returns an empty table (and ok=false) if two ids collapse onto the
     * same display value.
     */
    ClassTable displayScaled(QString* errorMessage = nullptr, bool* ok = nullptr) const;

    /**
     * @brief Serialize back to "value, label" lines.
     */
    QString toMappingText() const;

private:
    QVector<Entry> m_entries;
    QHash<int, QString> m_labelById;
    QHash<QString, int> m_idByLabel;
};
