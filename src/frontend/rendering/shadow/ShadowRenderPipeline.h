#ifndef SHADOWRENDERPIPELINE_H
#define SHADOWRENDERPIPELINE_H

#include "frontend/rendering/shadow/ScratchPaint.h"

#include <QFlags>
#include <functional>

class IShadowCanvas;
struct ShadowConfig;
struct ShadowGeometry;

/**
 * @brief Draws one frame of a shadowed, rounded container
 *
 * Three passes in fixed order:
 *  1. shadow: filled rounded rect carrying the paint shadow
 *  2. content: children drawn into a layer, then the four corners outside
 *     the rounded rect are erased with a destination-out even-odd mask
 *  3. border: stroked rounded rect, only when the geometry has a border rect
 *
 * Each pass is wrapped in canvas save/restore and leaves the scratch paint
 * and path at their baseline. A subset of passes can be requested when the
 * passes of one frame land on different surfaces; the order is unchanged.
 * Not reentrant; one instance per container.
 */
class ShadowRenderPipeline {
public:
    using ChildDrawCallback = std::function<void(IShadowCanvas&)>;

    enum class Pass {
        Shadow = 0x1,
        Content = 0x2,
        Border = 0x4
    };
    Q_DECLARE_FLAGS(Passes, Pass)

    static Passes allPasses();

    ShadowRenderPipeline() = default;

    ShadowRenderPipeline(const ShadowRenderPipeline&) = delete;
    ShadowRenderPipeline& operator=(const ShadowRenderPipeline&) = delete;

    // Returns false when the frame was skipped because the canvas is unusable.
    bool draw(IShadowCanvas* canvas,
              const ShadowGeometry& geometry,
              const ShadowConfig& config,
              const ChildDrawCallback& drawChildren,
              Passes passes = allPasses());

    const ScratchResources& scratch() const { return m_scratch; }

private:
    void drawShadow(IShadowCanvas& canvas, const ShadowGeometry& geometry, const ShadowConfig& config);
    void drawMaskedContent(IShadowCanvas& canvas,
                           const ShadowGeometry& geometry,
                           const ShadowConfig& config,
                           const ChildDrawCallback& drawChildren);
    void drawBorder(IShadowCanvas& canvas, const ShadowGeometry& geometry, const ShadowConfig& config);

    ScratchResources m_scratch;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(ShadowRenderPipeline::Passes)

#endif // SHADOWRENDERPIPELINE_H
