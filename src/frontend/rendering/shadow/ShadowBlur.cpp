#include "frontend/rendering/shadow/ShadowBlur.h"

#include <QPainter>
#include <QRect>
#include <QtMath>
#include <algorithm>
#include <cmath>
#include <vector>

namespace {

enum {
    LeftLobe = 0,
    RightLobe = 1
};

// Box sizes for three successive blurs approximating a Gaussian with
// stdDev = radius / 2 (CSS box-shadow definition).
void calculateLobes(int lobes[][2], qreal blurRadius)
{
    const qreal stdDev = blurRadius / 2.0;
    const qreal gaussianKernelFactor = 3.0 / 4.0 * std::sqrt(2.0 * M_PI);
    const qreal fudgeFactor = 0.88;
    const int diameter = std::max(2, static_cast<int>(std::floor(stdDev * gaussianKernelFactor * fudgeFactor + 0.5)));

    if (diameter & 1) {
        // Odd: three boxes of size d centred on the output pixel.
        const int lobeSize = (diameter - 1) / 2;
        for (int pass = 0; pass < 3; ++pass) {
            lobes[pass][LeftLobe] = lobeSize;
            lobes[pass][RightLobe] = lobeSize;
        }
    } else {
        // Even: two boxes of size d straddling the pixel, then one of size d + 1.
        const int lobeSize = diameter / 2;
        lobes[0][LeftLobe] = lobeSize;
        lobes[0][RightLobe] = lobeSize - 1;
        lobes[1][LeftLobe] = lobeSize - 1;
        lobes[1][RightLobe] = lobeSize;
        lobes[2][LeftLobe] = lobeSize;
        lobes[2][RightLobe] = lobeSize;
    }
}

// Sliding-window box blur of one row or column; edge values are replicated.
void boxBlurLine(uchar* data, int count, int stride, int leftLobe, int rightLobe, std::vector<uchar>& source)
{
    for (int i = 0; i < count; ++i) {
        source[i] = data[i * stride];
    }

    const int pixelCount = leftLobe + 1 + rightLobe;
    auto sample = [&](int i) {
        return static_cast<int>(source[std::clamp(i, 0, count - 1)]);
    };

    int sum = 0;
    for (int k = -leftLobe; k <= rightLobe; ++k) {
        sum += sample(k);
    }
    for (int i = 0; i < count; ++i) {
        data[i * stride] = static_cast<uchar>((sum + pixelCount / 2) / pixelCount);
        sum += sample(i + rightLobe + 1) - sample(i - leftLobe);
    }
}

} // namespace

ShadowBlur::ShadowBlur(qreal radius)
    : m_radius(std::max<qreal>(0.0, radius))
{
}

int ShadowBlur::margin() const
{
    if (isNoop()) {
        return 0;
    }
    return static_cast<int>(std::ceil(m_radius)) * 2;
}

void ShadowBlur::blurAlpha(QImage& image) const
{
    if (image.isNull()) {
        return;
    }
    if (image.format() != QImage::Format_ARGB32_Premultiplied) {
        image = image.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    }

    const int width = image.width();
    const int height = image.height();
    std::vector<uchar> alpha(static_cast<size_t>(width) * height);
    for (int y = 0; y < height; ++y) {
        const QRgb* line = reinterpret_cast<const QRgb*>(image.constScanLine(y));
        for (int x = 0; x < width; ++x) {
            alpha[static_cast<size_t>(y) * width + x] = static_cast<uchar>(qAlpha(line[x]));
        }
    }

    if (!isNoop()) {
        int lobes[3][2];
        calculateLobes(lobes, m_radius);
        std::vector<uchar> scratch(static_cast<size_t>(std::max(width, height)));

        for (int y = 0; y < height; ++y) {
            uchar* row = alpha.data() + static_cast<size_t>(y) * width;
            for (int step = 0; step < 3; ++step) {
                boxBlurLine(row, width, 1, lobes[step][LeftLobe], lobes[step][RightLobe], scratch);
            }
        }
        for (int x = 0; x < width; ++x) {
            uchar* column = alpha.data() + x;
            for (int step = 0; step < 3; ++step) {
                boxBlurLine(column, height, width, lobes[step][LeftLobe], lobes[step][RightLobe], scratch);
            }
        }
    }

    for (int y = 0; y < height; ++y) {
        QRgb* line = reinterpret_cast<QRgb*>(image.scanLine(y));
        for (int x = 0; x < width; ++x) {
            line[x] = qRgba(0, 0, 0, alpha[static_cast<size_t>(y) * width + x]);
        }
    }
}

QImage ShadowBlur::render(const QPainterPath& devicePath, const QColor& color, QPoint& deviceOrigin) const
{
    const QRect shapeBounds = devicePath.boundingRect().toAlignedRect();
    if (shapeBounds.isEmpty() || color.alpha() == 0) {
        return QImage();
    }

    const int pad = margin();
    const QRect imageRect = shapeBounds.adjusted(-pad, -pad, pad, pad);

    QImage image(imageRect.size(), QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);
    {
        QPainter painter(&image);
        painter.setRenderHint(QPainter::Antialiasing, true);
        painter.translate(-imageRect.left(), -imageRect.top());
        painter.fillPath(devicePath, QColor(Qt::black));
    }

    blurAlpha(image);

    {
        QPainter painter(&image);
        painter.setCompositionMode(QPainter::CompositionMode_SourceIn);
        painter.fillRect(image.rect(), color);
    }

    deviceOrigin = imageRect.topLeft();
    return image;
}
