#ifndef SHADOWGEOMETRY_H
#define SHADOWGEOMETRY_H

#include <QMargins>
#include <QRectF>
#include <QSize>
#include <optional>

/**
 * @brief Rectangles the render pipeline draws into for one container size
 */
struct ShadowGeometry {
    QRectF contentRect;
    std::optional<QRectF> borderRect;
};

/**
 * @brief Derives content and border rectangles whenever the container is resized
 *
 * The resolver starts unresolved; callers must not draw until onResize() has
 * been delivered at least once.
 */
class ShadowGeometryResolver {
public:
    // Border rect is pulled inwards by this share of the border width so
    // wide strokes stay centred on the rounded edge.
    static constexpr qreal kBorderInsetRatio = 1.0 / 3.0;

    static ShadowGeometry resolve(const QSize& size, const QMargins& padding, qreal borderWidth);

    void onResize(const QSize& size, const QMargins& padding, qreal borderWidth);
    void invalidate();

    bool isResolved() const { return m_geometry.has_value(); }
    const std::optional<ShadowGeometry>& geometry() const { return m_geometry; }
    QSize resolvedSize() const { return m_size; }

private:
    std::optional<ShadowGeometry> m_geometry;
    QSize m_size;
};

#endif // SHADOWGEOMETRY_H
