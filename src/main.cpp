#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>
#include <QLinearGradient>
#include <QPainter>
#include "frontend/ui/widgets/ShadowLayout.h"
#include "managers/app/ShadowStyleSettings.h"

namespace {
// Placeholder card content so the rounded corners and border are visible.
void paintDemoContent(QPainter& painter, const QRectF& contentRect) {
    QLinearGradient gradient(contentRect.topLeft(), contentRect.bottomRight());
    gradient.setColorAt(0.0, QColor(74, 144, 226));
    gradient.setColorAt(1.0, QColor(31, 78, 168));
    painter.fillRect(contentRect, gradient);

    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setPen(QPen(QColor(255, 255, 255, 90), 6.0));
    painter.drawLine(contentRect.topLeft(), contentRect.bottomRight());
}

bool readPositive(const QCommandLineParser& parser, const QString& option, qreal& out) {
    bool ok = false;
    const qreal value = parser.value(option).toDouble(&ok);
    if (!ok || value <= 0.0) {
        qCritical() << "shadowframe-render: option" << option << "expects a positive number, got" << parser.value(option);
        return false;
    }
    out = value;
    return true;
}
}

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("shadowframe-render");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("ShadowFrame");

    QCommandLineParser parser;
    parser.setApplicationDescription("Renders one frame of a shadowed rounded container to a PNG file.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"config", "INI file with the style properties.", "ini"},
        {"group", "Settings group holding the style.", "group", ShadowStyleSettings::kDefaultGroup},
        {"width", "Container width in pixels.", "px", "240"},
        {"height", "Container height in pixels.", "px", "160"},
        {"density", "Density scale applied to style lengths.", "scale", "1"},
        {"dpr", "Device pixel ratio of the output image.", "ratio", "1"},
        {"output", "PNG file to write.", "png", "shadowframe.png"},
    });
    parser.process(app);

    qreal width = 0.0;
    qreal height = 0.0;
    qreal density = 0.0;
    qreal dpr = 0.0;
    if (!readPositive(parser, "width", width) || !readPositive(parser, "height", height)
        || !readPositive(parser, "density", density) || !readPositive(parser, "dpr", dpr)) {
        return 1;
    }

    ShadowStyleSettings style(density);
    ShadowConfig config;
    if (parser.isSet("config")) {
        const QString iniPath = parser.value("config");
        if (!QFileInfo::exists(iniPath)) {
            qCritical() << "shadowframe-render: config file not found:" << iniPath;
            return 1;
        }
        config = style.loadFile(iniPath, parser.value("group"));
    } else {
        qInfo() << "shadowframe-render: no --config given, rendering default style";
    }

    ShadowLayout layout(config);
    layout.setContentPainter(paintDemoContent);
    layout.resize(qRound(width), qRound(height));

    const QImage frame = layout.renderFrame(dpr);
    if (frame.isNull()) {
        qCritical() << "shadowframe-render: rendering produced no image";
        return 1;
    }

    const QString outputPath = parser.value("output");
    if (!frame.save(outputPath, "PNG")) {
        qCritical() << "shadowframe-render: failed to write" << outputPath;
        return 1;
    }

    qInfo() << "shadowframe-render: wrote" << outputPath << frame.size();
    return 0;
}
