#ifndef SHADOWBORDEROVERLAY_H
#define SHADOWBORDEROVERLAY_H

#include <QWidget>
#include <functional>

class QPaintEvent;

// Click-through child that covers its owner and paints on top of the owner's
// other children. Painting is delegated to the owner.
class ShadowBorderOverlay : public QWidget {
public:
    using PaintHandler = std::function<void(QWidget& surface)>;

    explicit ShadowBorderOverlay(PaintHandler paintHandler, QWidget* parent = nullptr);

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    PaintHandler m_paintHandler;
};

#endif // SHADOWBORDEROVERLAY_H
