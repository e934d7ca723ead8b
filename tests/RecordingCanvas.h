#ifndef RECORDINGCANVAS_H
#define RECORDINGCANVAS_H

#include "frontend/rendering/shadow/ScratchPaint.h"
#include "shared/rendering/IShadowCanvas.h"

#include <QString>
#include <QStringList>
#include <vector>

// Canvas that rasterizes nothing and keeps the call sequence, with a copy of
// the paint seen by every call, for ordering and state-bleed assertions.
class RecordingCanvas : public IShadowCanvas {
public:
    enum class OpKind {
        Save,
        SaveLayer,
        Restore,
        RoundedRect,
        Path,
        Children
    };

    struct Op {
        OpKind kind;
        QRectF rect;
        qreal rx = 0.0;
        qreal ry = 0.0;
        QPainterPath path;
        ScratchPaint paint;
    };

    explicit RecordingCanvas(const QSize& size = QSize(100, 100), bool valid = true)
        : m_size(size), m_valid(valid) {}

    bool isValid() const override { return m_valid; }
    QSize size() const override { return m_size; }

    void save() override;
    void saveLayer(const QRectF& bounds, const ScratchPaint& paint) override;
    void restore() override;
    void drawRoundedRect(const QRectF& rect, qreal rx, qreal ry, const ScratchPaint& paint) override;
    void drawPath(const QPainterPath& path, const ScratchPaint& paint) override;
    QPainter* painter() override { return nullptr; }

    // Called from a child-draw callback to mark where children were drawn.
    void recordChildren();

    const std::vector<Op>& ops() const { return m_ops; }
    QStringList sequence() const;
    int depth() const { return m_depth; }
    void clear() { m_ops.clear(); m_depth = 0; }

private:
    QSize m_size;
    bool m_valid;
    int m_depth = 0;
    std::vector<Op> m_ops;
};

#endif // RECORDINGCANVAS_H
