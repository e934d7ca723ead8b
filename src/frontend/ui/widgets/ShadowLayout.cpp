#include "frontend/ui/widgets/ShadowLayout.h"

#include "frontend/rendering/shadow/RasterCanvas.h"
#include "frontend/rendering/shadow/ShadowPadding.h"
#include "frontend/ui/widgets/ShadowBorderOverlay.h"

#include <QChildEvent>
#include <QDebug>
#include <QEvent>
#include <QPaintEvent>
#include <QPainter>
#include <QPainterPath>
#include <QResizeEvent>
#include <utility>

ShadowLayout::ShadowLayout(QWidget* parent)
    : ShadowLayout(ShadowConfig(), parent)
{
}

ShadowLayout::ShadowLayout(const ShadowConfig& config, QWidget* parent)
    : QWidget(parent),
      m_config(config)
{
    // Parented after the pointer is set so childEvent() can tell it apart.
    m_borderOverlay = new ShadowBorderOverlay([this](QWidget& surface) {
        paintPasses(surface, ShadowRenderPipeline::Pass::Border);
    });
    m_borderOverlay->setParent(this);
    m_borderOverlay->setGeometry(rect());
    m_borderOverlay->show();

    processPadding();
}

void ShadowLayout::setShadowConfig(const ShadowConfig& config)
{
    if (config == m_config) {
        return;
    }

    m_config = config;
    processPadding();
    // Insets and border rect depend on the config; never draw the old ones.
    if (m_geometry.isResolved()) {
        resolveShadowGeometry();
    }
    update();
    m_borderOverlay->update();
    emit shadowConfigChanged();
}

void ShadowLayout::setContentPainter(ContentPainter painter)
{
    m_contentPainter = std::move(painter);
    update();
}

void ShadowLayout::processPadding()
{
    setContentsMargins(ShadowPadding::computeInsets(m_config));
}

void ShadowLayout::resolveShadowGeometry()
{
    m_geometry.onResize(size(), contentsMargins(), m_config.borderWidth);
    m_borderOverlay->setGeometry(rect());
    updateChildMasks();
}

void ShadowLayout::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    resolveShadowGeometry();
}

void ShadowLayout::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    // Children paint themselves above this, clipped by their masks; the
    // overlay adds the border on top of them.
    paintPasses(*this, ShadowRenderPipeline::Pass::Shadow | ShadowRenderPipeline::Pass::Content);
}

void ShadowLayout::childEvent(QChildEvent* event)
{
    QWidget::childEvent(event);

    QObject* child = event->child();
    if (!child->isWidgetType() || child == m_borderOverlay) {
        return;
    }

    if (event->added() || event->polished()) {
        child->installEventFilter(this);
        m_borderOverlay->raise();
    }
    if (event->polished()) {
        QWidget* widget = static_cast<QWidget*>(child);
        if (isContentChild(widget)) {
            updateChildMask(widget);
        }
    }
}

bool ShadowLayout::eventFilter(QObject* watched, QEvent* event)
{
    if (watched->isWidgetType() && watched != m_borderOverlay) {
        QWidget* child = static_cast<QWidget*>(watched);
        switch (event->type()) {
        case QEvent::Move:
        case QEvent::Resize:
        case QEvent::Show:
            if (isContentChild(child)) {
                updateChildMask(child);
            }
            break;
        case QEvent::ZOrderChange:
            if (child->parentWidget() == this) {
                m_borderOverlay->raise();
            }
            break;
        case QEvent::ParentChange:
            if (child->parentWidget() != this) {
                child->clearMask();
                child->removeEventFilter(this);
            }
            break;
        default:
            break;
        }
    }
    return QWidget::eventFilter(watched, event);
}

bool ShadowLayout::isContentChild(const QWidget* child) const
{
    return child && child != m_borderOverlay && child->parentWidget() == this && !child->isWindow();
}

QRegion ShadowLayout::cornerRegion() const
{
    const std::optional<ShadowGeometry>& geometry = m_geometry.geometry();
    if (!geometry || m_config.cornerRadius <= 0.0) {
        return QRegion();
    }

    const QRectF& contentRect = geometry->contentRect;
    QPainterPath rounded;
    rounded.addRoundedRect(contentRect, m_config.cornerRadius, m_config.cornerRadius);
    return QRegion(contentRect.toAlignedRect()) - QRegion(rounded.toFillPolygon().toPolygon());
}

void ShadowLayout::updateChildMask(QWidget* child)
{
    const QRegion corners = cornerRegion().translated(-child->pos());
    const QRegion full(child->rect());
    if (!corners.intersects(full)) {
        if (!child->mask().isEmpty()) {
            child->clearMask();
        }
        return;
    }
    child->setMask(full - corners);
}

void ShadowLayout::updateChildMasks()
{
    const QObjectList objects = children();
    for (QObject* object : objects) {
        if (!object->isWidgetType()) {
            continue;
        }
        QWidget* child = static_cast<QWidget*>(object);
        if (isContentChild(child)) {
            updateChildMask(child);
        }
    }
}

void ShadowLayout::paintPasses(QWidget& surface, ShadowRenderPipeline::Passes passes)
{
    if (!m_geometry.isResolved()) {
        return;
    }

    const qreal dpr = surface.devicePixelRatioF();
    QImage frame(size() * dpr, QImage::Format_ARGB32_Premultiplied);
    if (frame.isNull()) {
        return;
    }
    frame.setDevicePixelRatio(dpr);
    frame.fill(Qt::transparent);
    renderInto(frame, passes, false);

    QPainter p(&surface);
    p.drawImage(QPointF(0.0, 0.0), frame);
}

QImage ShadowLayout::renderFrame(qreal devicePixelRatio)
{
    if (size().isEmpty() || devicePixelRatio <= 0.0) {
        qDebug() << "ShadowLayout: nothing to render for size" << size() << "dpr" << devicePixelRatio;
        return QImage();
    }

    // A hidden widget receives its resize event only when shown; catch up here.
    if (!m_geometry.isResolved() || m_geometry.resolvedSize() != size()) {
        resolveShadowGeometry();
    }

    QImage frame(size() * devicePixelRatio, QImage::Format_ARGB32_Premultiplied);
    frame.setDevicePixelRatio(devicePixelRatio);
    frame.fill(Qt::transparent);
    renderInto(frame, ShadowRenderPipeline::allPasses(), true);
    return frame;
}

void ShadowLayout::renderInto(QImage& image, ShadowRenderPipeline::Passes passes, bool includeChildWidgets)
{
    const ShadowGeometry& geometry = *m_geometry.geometry();

    RasterCanvas canvas(&image);
    m_pipeline.draw(&canvas, geometry, m_config, [this, &geometry, includeChildWidgets](IShadowCanvas& layer) {
        QPainter* painter = layer.painter();
        if (!painter) {
            return;
        }
        painter->save();
        paintContent(*painter, geometry.contentRect);
        painter->restore();

        if (includeChildWidgets) {
            renderChildWidgets(*painter);
        }
    }, passes);
}

void ShadowLayout::renderChildWidgets(QPainter& painter)
{
    // The layer mask cuts the corners here, with antialiasing, so the
    // aliased on-screen masks are ignored. Rendering may polish children,
    // which restacks the overlay, so walk a copy.
    const QObjectList objects = children();
    for (QObject* object : objects) {
        if (!object->isWidgetType()) {
            continue;
        }
        QWidget* child = static_cast<QWidget*>(object);
        if (!isContentChild(child) || child->isHidden()) {
            continue;
        }
        child->render(&painter, child->pos(), QRegion(), QWidget::DrawChildren | QWidget::IgnoreMask);
    }
}

void ShadowLayout::paintContent(QPainter& painter, const QRectF& contentRect)
{
    if (m_contentPainter) {
        m_contentPainter(painter, contentRect);
    }
}
