#include "frontend/rendering/shadow/ShadowConfig.h"

#include <cmath>

ShadowSides ShadowConfig::shadowSidesFromMask(int mask)
{
    return ShadowSides(QFlag(mask & kShadowSidesMask));
}

bool ShadowConfig::operator==(const ShadowConfig& other) const
{
    return shadowColor == other.shadowColor
        && qFuzzyCompare(1.0 + shadowWidth, 1.0 + other.shadowWidth)
        && qFuzzyCompare(1.0 + dx, 1.0 + other.dx)
        && qFuzzyCompare(1.0 + dy, 1.0 + other.dy)
        && qFuzzyCompare(1.0 + cornerRadius, 1.0 + other.cornerRadius)
        && borderColor == other.borderColor
        && qFuzzyCompare(1.0 + borderWidth, 1.0 + other.borderWidth)
        && shadowSides == other.shadowSides;
}

namespace ShadowUnits {

qreal dpToPx(qreal dp, qreal densityScale)
{
    return std::floor(dp * densityScale + 0.5);
}

} // namespace ShadowUnits
