#ifndef ISHADOWCANVAS_H
#define ISHADOWCANVAS_H

#include <QPainterPath>
#include <QRectF>
#include <QSize>

class QPainter;
class ScratchPaint;

/**
 * @brief Minimal 2D surface the shadow render pipeline draws on
 *
 * save()/restore() scope transform and painter state. saveLayer() redirects
 * drawing into an off-screen layer that the matching restore() composites
 * back using the layer paint; the destination-out mask relies on this.
 */
class IShadowCanvas {
public:
    virtual ~IShadowCanvas() = default;

    virtual bool isValid() const = 0;
    virtual QSize size() const = 0;

    virtual void save() = 0;
    virtual void saveLayer(const QRectF& bounds, const ScratchPaint& paint) = 0;
    virtual void restore() = 0;

    virtual void drawRoundedRect(const QRectF& rect, qreal rx, qreal ry, const ScratchPaint& paint) = 0;
    virtual void drawPath(const QPainterPath& path, const ScratchPaint& paint) = 0;

    // Painter targeting the active layer, for content drawn by the child tree.
    // May be null on surfaces that do not rasterize.
    virtual QPainter* painter() = 0;
};

#endif // ISHADOWCANVAS_H
