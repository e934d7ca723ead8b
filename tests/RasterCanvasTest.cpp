#include <gtest/gtest.h>
#include "frontend/rendering/shadow/RasterCanvas.h"
#include "frontend/rendering/shadow/ScratchPaint.h"

static QImage makeTarget(int w, int h, qreal dpr = 1.0) {
    QImage image(qRound(w * dpr), qRound(h * dpr), QImage::Format_ARGB32_Premultiplied);
    image.setDevicePixelRatio(dpr);
    image.fill(Qt::transparent);
    return image;
}

static ScratchPaint fillPaint(const QColor& color) {
    ScratchPaint paint;
    paint.setColor(color);
    paint.setAntiAlias(false);
    return paint;
}

TEST(RasterCanvasTest, NullTargetIsInvalid) {
    RasterCanvas canvas(nullptr);
    EXPECT_FALSE(canvas.isValid());
    EXPECT_EQ(canvas.painter(), nullptr);

    // Drawing on an invalid canvas is a silent no-op.
    canvas.save();
    canvas.drawRoundedRect(QRectF(0, 0, 10, 10), 2, 2, ScratchPaint());
    canvas.restore();
    EXPECT_EQ(canvas.saveDepth(), 0);
}

TEST(RasterCanvasTest, SizeIsInLogicalPixels) {
    QImage target = makeTarget(100, 50, 2.0);
    RasterCanvas canvas(&target);
    EXPECT_TRUE(canvas.isValid());
    EXPECT_EQ(canvas.size(), QSize(100, 50));
}

TEST(RasterCanvasTest, FillsRoundedRectWithPaintColor) {
    QImage target = makeTarget(40, 40);
    {
        RasterCanvas canvas(&target);
        canvas.drawRoundedRect(QRectF(0, 0, 40, 40), 0, 0, fillPaint(QColor(Qt::green)));
    }
    EXPECT_EQ(target.pixel(0, 0), QColor(Qt::green).rgba());
    EXPECT_EQ(target.pixel(39, 39), QColor(Qt::green).rgba());
}

TEST(RasterCanvasTest, LayerIsCompositedOnRestore) {
    QImage target = makeTarget(20, 20);
    {
        RasterCanvas canvas(&target);
        canvas.saveLayer(QRectF(0, 0, 20, 20), ScratchPaint());
        EXPECT_EQ(canvas.layerDepth(), 1);
        canvas.drawRoundedRect(QRectF(0, 0, 20, 20), 0, 0, fillPaint(QColor(Qt::red)));
        EXPECT_EQ(qAlpha(target.pixel(10, 10)), 0);
        canvas.restore();
        EXPECT_EQ(canvas.layerDepth(), 0);
    }
    EXPECT_EQ(target.pixel(10, 10), QColor(Qt::red).rgba());
}

TEST(RasterCanvasTest, DestinationOutOnlyErasesTheLayer) {
    QImage target = makeTarget(20, 20);
    target.fill(QColor(Qt::blue));
    {
        RasterCanvas canvas(&target);
        canvas.saveLayer(QRectF(0, 0, 20, 20), ScratchPaint());
        canvas.drawRoundedRect(QRectF(0, 0, 20, 20), 0, 0, fillPaint(QColor(Qt::red)));

        QPainterPath hole;
        hole.addRect(QRectF(0, 0, 5, 5));
        ScratchPaint erase = fillPaint(QColor(Qt::white));
        erase.setCompositionMode(QPainter::CompositionMode_DestinationOut);
        canvas.drawPath(hole, erase);
        canvas.restore();
    }
    EXPECT_EQ(target.pixel(2, 2), QColor(Qt::blue).rgba());
    EXPECT_EQ(target.pixel(10, 10), QColor(Qt::red).rgba());
}

TEST(RasterCanvasTest, StrokePaintLeavesInteriorUntouched) {
    QImage target = makeTarget(40, 40);
    {
        RasterCanvas canvas(&target);
        ScratchPaint stroke = fillPaint(QColor(Qt::yellow));
        stroke.setStyle(ScratchPaint::Style::Stroke);
        stroke.setStrokeWidth(4.0);
        canvas.drawRoundedRect(QRectF(10, 10, 20, 20), 0, 0, stroke);
    }
    EXPECT_EQ(target.pixel(10, 20), QColor(Qt::yellow).rgba());
    EXPECT_EQ(qAlpha(target.pixel(20, 20)), 0);
}

TEST(RasterCanvasTest, PaintShadowIsDrawnAtOffset) {
    QImage target = makeTarget(80, 80);
    {
        RasterCanvas canvas(&target);
        ScratchPaint paint = fillPaint(QColor(Qt::white));
        paint.setShadowLayer(6.0, 0.0, 10.0, QColor(Qt::black));
        canvas.drawRoundedRect(QRectF(20, 20, 40, 30), 0, 0, paint);
    }
    // Shape itself is still drawn with the paint colour.
    EXPECT_EQ(target.pixel(40, 35), QColor(Qt::white).rgba());
    // The shadow is pushed down: more coverage below the shape than above it.
    const int below = qAlpha(target.pixel(40, 53));
    const int above = qAlpha(target.pixel(40, 17));
    EXPECT_GT(below, 0);
    EXPECT_GT(below, above);
}

TEST(RasterCanvasTest, ZeroRadiusShadowDrawsOnlyTheShape) {
    QImage target = makeTarget(40, 40);
    {
        RasterCanvas canvas(&target);
        ScratchPaint paint = fillPaint(QColor(Qt::white));
        paint.setShadowLayer(0.0, 0.0, 5.0, QColor(Qt::black));
        canvas.drawRoundedRect(QRectF(10, 10, 20, 10), 0, 0, paint);
    }
    EXPECT_EQ(qAlpha(target.pixel(20, 23)), 0);
    EXPECT_EQ(target.pixel(20, 15), QColor(Qt::white).rgba());
}

TEST(RasterCanvasTest, UnbalancedRestoreIsIgnored) {
    QImage target = makeTarget(10, 10);
    RasterCanvas canvas(&target);
    canvas.restore();
    EXPECT_EQ(canvas.saveDepth(), 0);
    canvas.save();
    EXPECT_EQ(canvas.saveDepth(), 1);
    canvas.restore();
    EXPECT_EQ(canvas.saveDepth(), 0);
}

TEST(RasterCanvasTest, DestructorClosesOpenLayers) {
    QImage target = makeTarget(10, 10);
    {
        RasterCanvas canvas(&target);
        canvas.saveLayer(QRectF(0, 0, 10, 10), ScratchPaint());
        canvas.drawRoundedRect(QRectF(0, 0, 10, 10), 0, 0, fillPaint(QColor(Qt::cyan)));
    }
    EXPECT_EQ(target.pixel(5, 5), QColor(Qt::cyan).rgba());
}

TEST(RasterCanvasTest, HighDpiLayerKeepsDevicePixels) {
    QImage target = makeTarget(10, 10, 2.0);
    {
        RasterCanvas canvas(&target);
        canvas.saveLayer(QRectF(0, 0, 10, 10), ScratchPaint());
        canvas.drawRoundedRect(QRectF(0, 0, 5, 10), 0, 0, fillPaint(QColor(Qt::red)));
        canvas.restore();
    }
    EXPECT_EQ(target.pixel(9, 10), QColor(Qt::red).rgba());
    EXPECT_EQ(qAlpha(target.pixel(10, 10)), 0);
}
