#ifndef SCRATCHPAINT_H
#define SCRATCHPAINT_H

#include <QColor>
#include <QPainter>
#include <QPainterPath>
#include <optional>

/**
 * @brief Shadow attached to a paint; drawn beneath the shape it decorates
 */
struct PaintShadow {
    qreal radius = 0.0;
    qreal dx = 0.0;
    qreal dy = 0.0;
    QColor color;
};

/**
 * @brief Mutable paint record shared by the passes of one render pipeline
 *
 * The neutral baseline is an opaque white anti-aliased fill with no stroke
 * width, no composition mode and no shadow. Every pass must leave the paint
 * at that baseline; use ScopedScratchPass instead of calling reset() by hand.
 */
class ScratchPaint {
public:
    enum class Style {
        Fill,
        Stroke
    };

    explicit ScratchPaint(const QColor& baseColor = QColor(Qt::white));

    void reset(const QColor& baseColor = QColor(Qt::white));
    bool isBaseline(const QColor& baseColor = QColor(Qt::white)) const;

    QColor color() const { return m_color; }
    void setColor(const QColor& color) { m_color = color; }

    Style style() const { return m_style; }
    void setStyle(Style style) { m_style = style; }

    qreal strokeWidth() const { return m_strokeWidth; }
    void setStrokeWidth(qreal width) { m_strokeWidth = width; }

    bool isAntiAlias() const { return m_antiAlias; }
    void setAntiAlias(bool enabled) { m_antiAlias = enabled; }

    const std::optional<QPainter::CompositionMode>& compositionMode() const { return m_compositionMode; }
    void setCompositionMode(QPainter::CompositionMode mode) { m_compositionMode = mode; }

    const std::optional<PaintShadow>& shadow() const { return m_shadow; }
    void setShadowLayer(qreal radius, qreal dx, qreal dy, const QColor& color);
    void clearShadowLayer() { m_shadow.reset(); }

    // Configures pen, brush, render hints and composition mode of painter.
    void applyTo(QPainter& painter) const;

private:
    QColor m_color;
    Style m_style = Style::Fill;
    qreal m_strokeWidth = 0.0;
    bool m_antiAlias = true;
    std::optional<QPainter::CompositionMode> m_compositionMode;
    std::optional<PaintShadow> m_shadow;
};

/**
 * @brief The paint and the mask path, owned by exactly one pipeline instance
 */
struct ScratchResources {
    ScratchPaint paint;
    QPainterPath path;

    void reset();
    bool isBaseline() const;
};

/**
 * @brief Brackets one render pass; resets the scratch resources on scope exit
 */
class ScopedScratchPass {
public:
    explicit ScopedScratchPass(ScratchResources& resources) : m_resources(resources) {}
    ~ScopedScratchPass() { m_resources.reset(); }

    ScopedScratchPass(const ScopedScratchPass&) = delete;
    ScopedScratchPass& operator=(const ScopedScratchPass&) = delete;

    ScratchPaint& paint() { return m_resources.paint; }
    QPainterPath& path() { return m_resources.path; }

private:
    ScratchResources& m_resources;
};

#endif // SCRATCHPAINT_H
