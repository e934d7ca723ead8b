#include "managers/app/ShadowStyleSettings.h"

#include <QDebug>
#include <QSettings>
#include <QStringList>

const QString ShadowStyleSettings::kDefaultGroup = QStringLiteral("ShadowLayout");

namespace {
    const QString KEY_SHADOW_COLOR = QStringLiteral("shadowColor");
    const QString KEY_SHADOW_WIDTH = QStringLiteral("shadowWidth");
    const QString KEY_DX = QStringLiteral("dx");
    const QString KEY_DY = QStringLiteral("dy");
    const QString KEY_CORNER_RADIUS = QStringLiteral("cornerRadius");
    const QString KEY_BORDER_COLOR = QStringLiteral("borderColor");
    const QString KEY_BORDER_WIDTH = QStringLiteral("borderWidth");
    const QString KEY_SHADOW_SIDES = QStringLiteral("shadowSides");
}

ShadowStyleSettings::ShadowStyleSettings(qreal densityScale)
    : m_densityScale(1.0)
{
    setDensityScale(densityScale);
}

void ShadowStyleSettings::setDensityScale(qreal densityScale)
{
    if (densityScale <= 0.0) {
        qWarning() << "ShadowStyleSettings: ignoring non-positive density scale" << densityScale;
        return;
    }
    m_densityScale = densityScale;
}

ShadowConfig ShadowStyleSettings::load(QSettings& settings, const QString& group) const
{
    const ShadowConfig defaults;
    ShadowConfig config;

    settings.beginGroup(group);
    config.shadowColor = readColor(settings, KEY_SHADOW_COLOR, defaults.shadowColor);
    config.shadowWidth = readLength(settings, KEY_SHADOW_WIDTH);
    config.dx = readLength(settings, KEY_DX);
    config.dy = readLength(settings, KEY_DY);
    config.cornerRadius = readLength(settings, KEY_CORNER_RADIUS);
    config.borderColor = readColor(settings, KEY_BORDER_COLOR, defaults.borderColor);
    config.borderWidth = readLength(settings, KEY_BORDER_WIDTH);

    if (settings.contains(KEY_SHADOW_SIDES)) {
        bool ok = false;
        const ShadowSides sides = parseShadowSides(settings.value(KEY_SHADOW_SIDES).toString(), &ok);
        if (ok) {
            config.shadowSides = sides;
        } else {
            qWarning() << "ShadowStyleSettings: invalid" << KEY_SHADOW_SIDES
                       << settings.value(KEY_SHADOW_SIDES) << "- using all sides";
        }
    }
    settings.endGroup();

    qDebug() << "ShadowStyleSettings: loaded" << group
             << "shadowWidth:" << config.shadowWidth
             << "offset:" << config.dx << config.dy
             << "cornerRadius:" << config.cornerRadius
             << "borderWidth:" << config.borderWidth;
    return config;
}

ShadowConfig ShadowStyleSettings::loadFile(const QString& iniPath, const QString& group) const
{
    QSettings settings(iniPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning() << "ShadowStyleSettings: cannot read" << iniPath << "- status" << settings.status();
    }
    return load(settings, group);
}

void ShadowStyleSettings::save(QSettings& settings, const ShadowConfig& config, const QString& group) const
{
    settings.beginGroup(group);
    settings.setValue(KEY_SHADOW_COLOR, config.shadowColor.name(QColor::HexArgb));
    settings.setValue(KEY_SHADOW_WIDTH, config.shadowWidth / m_densityScale);
    settings.setValue(KEY_DX, config.dx / m_densityScale);
    settings.setValue(KEY_DY, config.dy / m_densityScale);
    settings.setValue(KEY_CORNER_RADIUS, config.cornerRadius / m_densityScale);
    settings.setValue(KEY_BORDER_COLOR, config.borderColor.name(QColor::HexArgb));
    settings.setValue(KEY_BORDER_WIDTH, config.borderWidth / m_densityScale);
    settings.setValue(KEY_SHADOW_SIDES, shadowSidesToString(config.shadowSides));
    settings.endGroup();
    settings.sync();
}

qreal ShadowStyleSettings::readLength(QSettings& settings, const QString& key) const
{
    if (!settings.contains(key)) {
        return 0.0;
    }

    bool ok = false;
    const qreal dp = settings.value(key).toDouble(&ok);
    if (!ok) {
        qWarning() << "ShadowStyleSettings: invalid length for" << key << settings.value(key) << "- using 0";
        return 0.0;
    }
    return ShadowUnits::dpToPx(dp, m_densityScale);
}

QColor ShadowStyleSettings::readColor(QSettings& settings, const QString& key, const QColor& fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }

    const QColor color(settings.value(key).toString().trimmed());
    if (!color.isValid()) {
        qWarning() << "ShadowStyleSettings: invalid color for" << key << settings.value(key)
                   << "- using" << fallback.name(QColor::HexArgb);
        return fallback;
    }
    return color;
}

ShadowSides ShadowStyleSettings::parseShadowSides(const QString& text, bool* ok)
{
    if (ok) *ok = false;

    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return ShadowConfig::allShadowSides();
    }

    bool isNumber = false;
    const int mask = trimmed.toInt(&isNumber, 10);
    if (isNumber) {
        if (ok) *ok = true;
        return ShadowConfig::shadowSidesFromMask(mask);
    }

    ShadowSides sides;
    const QStringList tokens = trimmed.split(QLatin1Char('|'), Qt::SkipEmptyParts);
    for (const QString& rawToken : tokens) {
        const QString token = rawToken.trimmed().toLower();
        if (token == QLatin1String("top")) {
            sides |= ShadowSide::Top;
        } else if (token == QLatin1String("right")) {
            sides |= ShadowSide::Right;
        } else if (token == QLatin1String("bottom")) {
            sides |= ShadowSide::Bottom;
        } else if (token == QLatin1String("left")) {
            sides |= ShadowSide::Left;
        } else if (token == QLatin1String("all")) {
            sides |= ShadowConfig::allShadowSides();
        } else if (token == QLatin1String("none")) {
            // contributes nothing
        } else {
            return ShadowConfig::allShadowSides();
        }
    }

    if (ok) *ok = true;
    return sides;
}

QString ShadowStyleSettings::shadowSidesToString(ShadowSides sides)
{
    QStringList names;
    if (sides.testFlag(ShadowSide::Top)) names << QStringLiteral("top");
    if (sides.testFlag(ShadowSide::Right)) names << QStringLiteral("right");
    if (sides.testFlag(ShadowSide::Bottom)) names << QStringLiteral("bottom");
    if (sides.testFlag(ShadowSide::Left)) names << QStringLiteral("left");
    if (names.isEmpty()) {
        return QStringLiteral("none");
    }
    return names.join(QLatin1Char('|'));
}
