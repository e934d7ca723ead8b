#ifndef SHADOWBLUR_H
#define SHADOWBLUR_H

#include <QColor>
#include <QImage>
#include <QPainterPath>
#include <QPoint>

/**
 * @brief Software Gaussian approximation used to rasterize paint shadows
 *
 * Three box blurs per axis approximate a Gaussian with a standard deviation
 * of half the blur radius. Works on the alpha channel only; the colour is
 * applied afterwards with a SourceIn fill.
 */
class ShadowBlur {
public:
    explicit ShadowBlur(qreal radius);

    qreal radius() const { return m_radius; }
    bool isNoop() const { return m_radius <= 0.0; }

    // Transparent border kept around the shape so the blur can spread.
    int margin() const;

    // Blurs the alpha channel of an ARGB32_Premultiplied image in place.
    // Colour channels are cleared.
    void blurAlpha(QImage& image) const;

    /**
     * @brief Rasterizes a blurred, tinted copy of a device-space path
     * @param devicePath Shape in device pixels
     * @param color Shadow colour (its alpha scales the shadow)
     * @param deviceOrigin Receives the device position of the image's top-left pixel
     * @return Premultiplied image, null when there is nothing to draw
     */
    QImage render(const QPainterPath& devicePath, const QColor& color, QPoint& deviceOrigin) const;

private:
    qreal m_radius;
};

#endif // SHADOWBLUR_H
