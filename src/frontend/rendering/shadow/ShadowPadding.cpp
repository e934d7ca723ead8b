#include "frontend/rendering/shadow/ShadowPadding.h"

#include "frontend/rendering/shadow/ShadowConfig.h"

#include <cmath>

namespace ShadowPadding {

QMargins computeInsets(const ShadowConfig& config)
{
    const int xPadding = static_cast<int>(config.shadowWidth + std::abs(config.dx));
    const int yPadding = static_cast<int>(config.shadowWidth + std::abs(config.dy));
    const ShadowSides sides = config.shadowSides;

    return QMargins(
        sides.testFlag(ShadowSide::Left) ? xPadding : 0,
        sides.testFlag(ShadowSide::Top) ? yPadding : 0,
        sides.testFlag(ShadowSide::Right) ? xPadding : 0,
        sides.testFlag(ShadowSide::Bottom) ? yPadding : 0);
}

} // namespace ShadowPadding
