#ifndef SHADOWCONFIG_H
#define SHADOWCONFIG_H

#include <QColor>
#include <QFlags>
#include <QtGlobal>

/**
 * @brief Sides of the container that reserve space for the shadow
 */
enum class ShadowSide {
    Top = 0x1,
    Right = 0x2,
    Bottom = 0x4,
    Left = 0x8
};
Q_DECLARE_FLAGS(ShadowSides, ShadowSide)
Q_DECLARE_OPERATORS_FOR_FLAGS(ShadowSides)

constexpr int kShadowSidesMask = 0xF;

/**
 * @brief Geometric and color parameters of a shadowed rounded container
 *
 * All lengths are physical pixels. Geometric values are expected to be
 * non-negative except the shadow offsets; zero widths and a zero radius are
 * valid and simply reduce the corresponding pass to a no-op.
 */
struct ShadowConfig {
    QColor shadowColor = QColor(Qt::black);
    qreal shadowWidth = 0.0;
    qreal dx = 0.0;
    qreal dy = 0.0;
    qreal cornerRadius = 0.0;
    QColor borderColor = QColor(Qt::white);
    qreal borderWidth = 0.0;
    ShadowSides shadowSides = allShadowSides();

    static ShadowSides allShadowSides() {
        return ShadowSide::Top | ShadowSide::Right | ShadowSide::Bottom | ShadowSide::Left;
    }

    // Builds a side set from an integer mask; bits above Left are dropped.
    static ShadowSides shadowSidesFromMask(int mask);

    bool hasShadow() const { return shadowWidth > 0.0; }
    bool hasBorder() const { return borderWidth > 0.0; }

    bool operator==(const ShadowConfig& other) const;
    bool operator!=(const ShadowConfig& other) const { return !(*this == other); }
};

namespace ShadowUnits {

// Density-independent length to physical pixels, rounded to nearest.
qreal dpToPx(qreal dp, qreal densityScale);

} // namespace ShadowUnits

#endif // SHADOWCONFIG_H
