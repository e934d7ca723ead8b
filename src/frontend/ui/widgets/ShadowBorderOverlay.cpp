#include "frontend/ui/widgets/ShadowBorderOverlay.h"

#include <QPaintEvent>
#include <utility>

ShadowBorderOverlay::ShadowBorderOverlay(PaintHandler paintHandler, QWidget* parent)
    : QWidget(parent),
      m_paintHandler(std::move(paintHandler))
{
    setAttribute(Qt::WA_TransparentForMouseEvents, true);
    setFocusPolicy(Qt::NoFocus);
}

void ShadowBorderOverlay::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    if (m_paintHandler) {
        m_paintHandler(*this);
    }
}
