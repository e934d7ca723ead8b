#ifndef SHADOWSTYLESETTINGS_H
#define SHADOWSTYLESETTINGS_H

#include "frontend/rendering/shadow/ShadowConfig.h"

#include <QString>

class QSettings;

/**
 * ShadowStyleSettings
 * Reads the named style properties of a shadow container from QSettings and
 * converts them into a ShadowConfig in physical pixels.
 *
 * Keys (inside the group, lengths in density-independent units):
 * - shadowColor, borderColor: any QColor name (#RRGGBB, #AARRGGBB, svg names)
 * - shadowWidth, dx, dy, cornerRadius, borderWidth: numbers
 * - shadowSides: decimal mask (top=1 right=2 bottom=4 left=8) or a list such
 *   as "top|bottom"; "all" and "none" are accepted
 *
 * Missing keys use the ShadowConfig defaults. Unreadable values are logged
 * and replaced by the default.
 */
class ShadowStyleSettings {
public:
    static const QString kDefaultGroup;

    explicit ShadowStyleSettings(qreal densityScale = 1.0);

    qreal densityScale() const { return m_densityScale; }
    void setDensityScale(qreal densityScale);

    ShadowConfig load(QSettings& settings, const QString& group = kDefaultGroup) const;
    ShadowConfig loadFile(const QString& iniPath, const QString& group = kDefaultGroup) const;

    // Writes config back; lengths are divided by the density scale.
    void save(QSettings& settings, const ShadowConfig& config, const QString& group = kDefaultGroup) const;

    static ShadowSides parseShadowSides(const QString& text, bool* ok = nullptr);
    static QString shadowSidesToString(ShadowSides sides);

private:
    qreal readLength(QSettings& settings, const QString& key) const;
    static QColor readColor(QSettings& settings, const QString& key, const QColor& fallback);

    qreal m_densityScale;
};

#endif // SHADOWSTYLESETTINGS_H
