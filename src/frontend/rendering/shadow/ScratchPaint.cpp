#include "frontend/rendering/shadow/ScratchPaint.h"

#include <QBrush>
#include <QPen>

ScratchPaint::ScratchPaint(const QColor& baseColor)
{
    reset(baseColor);
}

void ScratchPaint::reset(const QColor& baseColor)
{
    m_color = baseColor;
    m_style = Style::Fill;
    m_strokeWidth = 0.0;
    m_antiAlias = true;
    m_compositionMode.reset();
    m_shadow.reset();
}

bool ScratchPaint::isBaseline(const QColor& baseColor) const
{
    return m_color == baseColor
        && m_style == Style::Fill
        && m_strokeWidth == 0.0
        && m_antiAlias
        && !m_compositionMode.has_value()
        && !m_shadow.has_value();
}

void ScratchPaint::setShadowLayer(qreal radius, qreal dx, qreal dy, const QColor& color)
{
    PaintShadow shadow;
    shadow.radius = radius;
    shadow.dx = dx;
    shadow.dy = dy;
    shadow.color = color;
    m_shadow = shadow;
}

void ScratchPaint::applyTo(QPainter& painter) const
{
    painter.setRenderHint(QPainter::Antialiasing, m_antiAlias);
    painter.setCompositionMode(m_compositionMode.value_or(QPainter::CompositionMode_SourceOver));

    if (m_style == Style::Stroke) {
        QPen pen(m_color);
        pen.setWidthF(m_strokeWidth);
        pen.setJoinStyle(Qt::MiterJoin);
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);
    } else {
        painter.setPen(Qt::NoPen);
        painter.setBrush(QBrush(m_color));
    }
}

void ScratchResources::reset()
{
    paint.reset();
    path.clear();
    path.setFillRule(Qt::OddEvenFill);
}

bool ScratchResources::isBaseline() const
{
    return paint.isBaseline() && path.isEmpty();
}
