#ifndef SHADOWPADDING_H
#define SHADOWPADDING_H

#include <QMargins>

struct ShadowConfig;

namespace ShadowPadding {

/**
 * @brief Edge insets reserved around the content so the shadow is never clipped
 *
 * Left/right reserve shadowWidth + |dx|, top/bottom reserve shadowWidth + |dy|,
 * both truncated to whole pixels. A side that is not enabled in
 * config.shadowSides gets no inset.
 */
QMargins computeInsets(const ShadowConfig& config);

} // namespace ShadowPadding

#endif // SHADOWPADDING_H
