#include "frontend/rendering/shadow/ShadowRenderPipeline.h"

#include "frontend/rendering/shadow/ShadowConfig.h"
#include "frontend/rendering/shadow/ShadowGeometry.h"
#include "shared/rendering/IShadowCanvas.h"

#include <QDebug>

ShadowRenderPipeline::Passes ShadowRenderPipeline::allPasses()
{
    return Pass::Shadow | Pass::Content | Pass::Border;
}

bool ShadowRenderPipeline::draw(IShadowCanvas* canvas,
                                const ShadowGeometry& geometry,
                                const ShadowConfig& config,
                                const ChildDrawCallback& drawChildren,
                                Passes passes)
{
    if (!canvas || !canvas->isValid()) {
        qDebug() << "ShadowRenderPipeline: canvas unavailable, frame skipped";
        return false;
    }

    if (passes.testFlag(Pass::Shadow)) {
        drawShadow(*canvas, geometry, config);
    }
    if (passes.testFlag(Pass::Content)) {
        drawMaskedContent(*canvas, geometry, config, drawChildren);
    }
    if (passes.testFlag(Pass::Border)) {
        drawBorder(*canvas, geometry, config);
    }
    return true;
}

void ShadowRenderPipeline::drawShadow(IShadowCanvas& canvas, const ShadowGeometry& geometry, const ShadowConfig& config)
{
    canvas.save();
    {
        ScopedScratchPass pass(m_scratch);
        pass.paint().setShadowLayer(config.shadowWidth, config.dx, config.dy, config.shadowColor);
        canvas.drawRoundedRect(geometry.contentRect, config.cornerRadius, config.cornerRadius, pass.paint());
    }
    canvas.restore();
}

void ShadowRenderPipeline::drawMaskedContent(IShadowCanvas& canvas,
                                             const ShadowGeometry& geometry,
                                             const ShadowConfig& config,
                                             const ChildDrawCallback& drawChildren)
{
    canvas.saveLayer(QRectF(QPointF(0.0, 0.0), QSizeF(canvas.size())), m_scratch.paint);

    if (drawChildren) {
        drawChildren(canvas);
    }

    {
        ScopedScratchPass pass(m_scratch);

        // Rect XOR rounded rect leaves only the four corner bites.
        QPainterPath& mask = pass.path();
        mask.addRect(geometry.contentRect);
        mask.addRoundedRect(geometry.contentRect, config.cornerRadius, config.cornerRadius);
        mask.setFillRule(Qt::OddEvenFill);

        pass.paint().setCompositionMode(QPainter::CompositionMode_DestinationOut);
        canvas.drawPath(mask, pass.paint());
    }

    canvas.restore();
}

void ShadowRenderPipeline::drawBorder(IShadowCanvas& canvas, const ShadowGeometry& geometry, const ShadowConfig& config)
{
    if (!geometry.borderRect) {
        return;
    }

    canvas.save();
    {
        ScopedScratchPass pass(m_scratch);
        pass.paint().setStrokeWidth(config.borderWidth);
        pass.paint().setStyle(ScratchPaint::Style::Stroke);
        pass.paint().setColor(config.borderColor);
        canvas.drawRoundedRect(*geometry.borderRect, config.cornerRadius, config.cornerRadius, pass.paint());
    }
    canvas.restore();
}
