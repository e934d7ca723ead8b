#ifndef RASTERCANVAS_H
#define RASTERCANVAS_H

#include "shared/rendering/IShadowCanvas.h"

#include <QImage>
#include <QPainter>
#include <memory>
#include <vector>

struct PaintShadow;

/**
 * @brief IShadowCanvas backed by a QImage and Qt's raster paint engine
 *
 * Layers are full-size transparent images drawn with their own QPainter and
 * composited on the matching restore(). The destination-out corner mask only
 * works on raster targets, which is why the shadow container always renders
 * through this class before touching the widget surface.
 *
 * The target image must outlive the canvas.
 */
class RasterCanvas : public IShadowCanvas {
public:
    explicit RasterCanvas(QImage* target);
    ~RasterCanvas() override;

    RasterCanvas(const RasterCanvas&) = delete;
    RasterCanvas& operator=(const RasterCanvas&) = delete;

    bool isValid() const override;
    QSize size() const override;

    void save() override;
    void saveLayer(const QRectF& bounds, const ScratchPaint& paint) override;
    void restore() override;

    void drawRoundedRect(const QRectF& rect, qreal rx, qreal ry, const ScratchPaint& paint) override;
    void drawPath(const QPainterPath& path, const ScratchPaint& paint) override;

    QPainter* painter() override { return currentPainter(); }

    int saveDepth() const { return static_cast<int>(m_saveStack.size()); }
    int layerDepth() const { return static_cast<int>(m_layers.size()); }

private:
    struct Layer {
        QImage image;
        std::unique_ptr<QPainter> painter;
        qreal opacity = 1.0;
        QPainter::CompositionMode compositionMode = QPainter::CompositionMode_SourceOver;
    };

    QPainter* currentPainter() const;
    void drawShape(const QPainterPath& path, const ScratchPaint& paint);
    void drawShadow(QPainter& painter, const QPainterPath& shape, const PaintShadow& shadow);

    QImage* m_target;
    qreal m_devicePixelRatio;
    std::unique_ptr<QPainter> m_painter;
    std::vector<std::unique_ptr<Layer>> m_layers;
    std::vector<bool> m_saveStack; // true for entries opened by saveLayer()
};

#endif // RASTERCANVAS_H
