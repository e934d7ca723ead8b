#include "frontend/rendering/shadow/RasterCanvas.h"

#include "frontend/rendering/shadow/ScratchPaint.h"
#include "frontend/rendering/shadow/ShadowBlur.h"

#include <QDebug>
#include <QPainterPathStroker>
#include <QTransform>

RasterCanvas::RasterCanvas(QImage* target)
    : m_target(target),
      m_devicePixelRatio(1.0)
{
    if (!m_target || m_target->isNull()) {
        qWarning() << "RasterCanvas: no target image, canvas is unusable";
        return;
    }

    m_devicePixelRatio = m_target->devicePixelRatio();
    m_painter = std::make_unique<QPainter>(m_target);
    if (!m_painter->isActive()) {
        qWarning() << "RasterCanvas: failed to begin painting on target image" << m_target->format();
        m_painter.reset();
    }
}

RasterCanvas::~RasterCanvas()
{
    if (!m_saveStack.empty()) {
        qWarning() << "RasterCanvas: destroyed with" << m_saveStack.size() << "unbalanced save(s)";
    }
    while (!m_saveStack.empty()) {
        restore();
    }
    if (m_painter) {
        m_painter->end();
    }
}

bool RasterCanvas::isValid() const
{
    return m_painter && m_painter->isActive();
}

QSize RasterCanvas::size() const
{
    if (!m_target) {
        return QSize();
    }
    return m_target->size() / m_devicePixelRatio;
}

QPainter* RasterCanvas::currentPainter() const
{
    if (!m_layers.empty()) {
        return m_layers.back()->painter.get();
    }
    return m_painter.get();
}

void RasterCanvas::save()
{
    QPainter* painter = currentPainter();
    if (!painter) {
        return;
    }
    painter->save();
    m_saveStack.push_back(false);
}

void RasterCanvas::saveLayer(const QRectF& bounds, const ScratchPaint& paint)
{
    QPainter* below = currentPainter();
    if (!below) {
        return;
    }

    auto layer = std::make_unique<Layer>();
    layer->image = QImage(m_target->size(), QImage::Format_ARGB32_Premultiplied);
    layer->image.setDevicePixelRatio(m_devicePixelRatio);
    layer->image.fill(Qt::transparent);
    layer->opacity = paint.color().alphaF();
    layer->compositionMode = paint.compositionMode().value_or(QPainter::CompositionMode_SourceOver);

    layer->painter = std::make_unique<QPainter>(&layer->image);
    layer->painter->setTransform(below->worldTransform());
    layer->painter->setClipRect(bounds);

    m_layers.push_back(std::move(layer));
    m_saveStack.push_back(true);
}

void RasterCanvas::restore()
{
    if (m_saveStack.empty()) {
        qWarning() << "RasterCanvas: restore() without matching save(), ignored";
        return;
    }

    const bool closesLayer = m_saveStack.back();
    m_saveStack.pop_back();

    if (!closesLayer) {
        currentPainter()->restore();
        return;
    }

    std::unique_ptr<Layer> layer = std::move(m_layers.back());
    m_layers.pop_back();
    layer->painter->end();

    QPainter* below = currentPainter();
    below->save();
    below->resetTransform();
    below->setOpacity(layer->opacity);
    below->setCompositionMode(layer->compositionMode);
    below->drawImage(QPointF(0.0, 0.0), layer->image);
    below->restore();
}

void RasterCanvas::drawRoundedRect(const QRectF& rect, qreal rx, qreal ry, const ScratchPaint& paint)
{
    QPainterPath path;
    if (rx > 0.0 && ry > 0.0) {
        path.addRoundedRect(rect, rx, ry);
    } else {
        path.addRect(rect);
    }
    drawShape(path, paint);
}

void RasterCanvas::drawPath(const QPainterPath& path, const ScratchPaint& paint)
{
    drawShape(path, paint);
}

void RasterCanvas::drawShape(const QPainterPath& path, const ScratchPaint& paint)
{
    QPainter* painter = currentPainter();
    if (!painter) {
        return;
    }

    const std::optional<PaintShadow>& shadow = paint.shadow();
    if (shadow && shadow->radius > 0.0) {
        if (paint.style() == ScratchPaint::Style::Stroke) {
            QPainterPathStroker stroker;
            stroker.setWidth(paint.strokeWidth());
            stroker.setJoinStyle(Qt::MiterJoin);
            drawShadow(*painter, stroker.createStroke(path), *shadow);
        } else {
            drawShadow(*painter, path, *shadow);
        }
    }

    painter->save();
    paint.applyTo(*painter);
    painter->drawPath(path);
    painter->restore();
}

void RasterCanvas::drawShadow(QPainter& painter, const QPainterPath& shape, const PaintShadow& shadow)
{
    const ShadowBlur blur(shadow.radius);
    const QTransform toDevice = painter.combinedTransform()
        * QTransform::fromScale(m_devicePixelRatio, m_devicePixelRatio);

    QPoint origin;
    QImage image = blur.render(toDevice.map(shape), shadow.color, origin);
    if (image.isNull()) {
        return;
    }
    image.setDevicePixelRatio(m_devicePixelRatio);

    const QPointF offset = toDevice.map(QPointF(shadow.dx, shadow.dy)) - toDevice.map(QPointF(0.0, 0.0));
    const QPointF topLeft((origin.x() + offset.x()) / m_devicePixelRatio,
                          (origin.y() + offset.y()) / m_devicePixelRatio);

    painter.save();
    painter.resetTransform();
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
    painter.drawImage(topLeft, image);
    painter.restore();
}
