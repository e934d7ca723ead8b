#ifndef SHADOWLAYOUT_H
#define SHADOWLAYOUT_H

#include "frontend/rendering/shadow/ShadowConfig.h"
#include "frontend/rendering/shadow/ShadowGeometry.h"
#include "frontend/rendering/shadow/ShadowRenderPipeline.h"

#include <QImage>
#include <QRegion>
#include <QWidget>
#include <functional>

class QChildEvent;
class QPainter;
class ShadowBorderOverlay;

/**
 * @brief Container that paints a drop shadow, rounds its content and draws a border
 *
 * The widget reserves room for the shadow through its contents margins, so a
 * QLayout installed on it places child widgets inside the card. Child widgets
 * are the card content: their corners are cut to cornerRadius and the border
 * is drawn above them. Extra content can be painted under the children with
 * setContentPainter() or by overriding paintContent().
 *
 * On screen the three passes are split across surfaces: this widget paints the
 * shadow and the content layer, each child carries a mask with the corner
 * bites removed, and a click-through overlay kept above the children paints
 * the border. The widget owns the masks of its direct children.
 *
 * renderFrame() runs all passes on a single image, with the child widgets
 * rendered into the content layer before the corners are erased.
 */
class ShadowLayout : public QWidget {
    Q_OBJECT

public:
    using ContentPainter = std::function<void(QPainter& painter, const QRectF& contentRect)>;

    explicit ShadowLayout(QWidget* parent = nullptr);
    explicit ShadowLayout(const ShadowConfig& config, QWidget* parent = nullptr);
    ~ShadowLayout() override = default;

    const ShadowConfig& shadowConfig() const { return m_config; }
    void setShadowConfig(const ShadowConfig& config);

    void setContentPainter(ContentPainter painter);

    // Empty until the first resize has been processed.
    const std::optional<ShadowGeometry>& shadowGeometry() const { return m_geometry.geometry(); }

    /**
     * @brief Renders the current frame off-screen, child widgets included
     * @param devicePixelRatio Scale of the returned image relative to widget pixels
     * @return Premultiplied ARGB image of size() * devicePixelRatio, null for an empty widget
     */
    QImage renderFrame(qreal devicePixelRatio = 1.0);

signals:
    void shadowConfigChanged();

protected:
    void resizeEvent(QResizeEvent* event) override;
    void paintEvent(QPaintEvent* event) override;
    void childEvent(QChildEvent* event) override;
    bool eventFilter(QObject* watched, QEvent* event) override;

    virtual void paintContent(QPainter& painter, const QRectF& contentRect);

private:
    void processPadding();
    void resolveShadowGeometry();
    void paintPasses(QWidget& surface, ShadowRenderPipeline::Passes passes);
    void renderInto(QImage& image, ShadowRenderPipeline::Passes passes, bool includeChildWidgets);
    void renderChildWidgets(QPainter& painter);
    bool isContentChild(const QWidget* child) const;

    QRegion cornerRegion() const;
    void updateChildMask(QWidget* child);
    void updateChildMasks();

    ShadowConfig m_config;
    ShadowGeometryResolver m_geometry;
    ShadowRenderPipeline m_pipeline;
    ContentPainter m_contentPainter;
    ShadowBorderOverlay* m_borderOverlay = nullptr;
};

#endif // SHADOWLAYOUT_H
