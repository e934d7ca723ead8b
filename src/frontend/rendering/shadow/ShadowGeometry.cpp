#include "frontend/rendering/shadow/ShadowGeometry.h"

#include <algorithm>

ShadowGeometry ShadowGeometryResolver::resolve(const QSize& size, const QMargins& padding, qreal borderWidth)
{
    const qreal left = padding.left();
    const qreal top = padding.top();
    // Padding wider than the container collapses the rect instead of inverting it.
    const qreal right = std::max(left, static_cast<qreal>(size.width() - padding.right()));
    const qreal bottom = std::max(top, static_cast<qreal>(size.height() - padding.bottom()));

    ShadowGeometry geometry;
    geometry.contentRect = QRectF(QPointF(left, top), QPointF(right, bottom));

    const qreal inset = borderWidth * kBorderInsetRatio;
    if (inset > 0.0) {
        geometry.borderRect = geometry.contentRect.adjusted(inset, inset, -inset, -inset);
    }
    return geometry;
}

void ShadowGeometryResolver::onResize(const QSize& size, const QMargins& padding, qreal borderWidth)
{
    m_size = size;
    m_geometry = resolve(size, padding, borderWidth);
}

void ShadowGeometryResolver::invalidate()
{
    m_geometry.reset();
    m_size = QSize();
}
