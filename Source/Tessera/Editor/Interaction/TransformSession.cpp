#include "Tessera/Editor/Interaction/TransformSession.h"

namespace Tessera::Ui::Interaction
{
    TransformSession::TransformSession(SnapEngine snapEngineIn) noexcept
        : snapEngine(snapEngineIn)
    {
    }

    juce::Result TransformSession::beginMove(DocumentHandle& document, const LayerId& targetId)
    {
        return begin(document, targetId, Mode::move, ResizeHandle::se, std::nullopt);
    }

    juce::Result TransformSession::beginMove(DocumentHandle& document,
                                             const LayerId& targetId,
                                             juce::Rectangle<float> initialBounds)
    {
        return begin(document, targetId, Mode::move, ResizeHandle::se, initialBounds);
    }

    juce::Result TransformSession::beginResize(DocumentHandle& document, const LayerId& targetId, ResizeHandle handle)
    {
        return begin(document, targetId, Mode::resize, handle, std::nullopt);
    }

    juce::Result TransformSession::beginResize(DocumentHandle& document,
                                               const LayerId& targetId,
                                               ResizeHandle handle,
                                               juce::Rectangle<float> initialBounds)
    {
        return begin(document, targetId, Mode::resize, handle, initialBounds);
    }

    juce::Result TransformSession::begin(DocumentHandle& document,
                                         const LayerId& targetId,
                                         Mode nextMode,
                                         ResizeHandle handle,
                                         std::optional<juce::Rectangle<float>> initialBounds)
    {
        if (isActive())
            return juce::Result::fail("transform already in progress");

        const auto* layer = document.findLayer(targetId);
        if (layer == nullptr)
            return juce::Result::fail("layer not found on active page: " + targetId);
        if (layer->locked)
            return juce::Result::fail("layer is locked: " + targetId);

        if (!initialBounds.has_value())
            initialBounds = layerBounds(*layer);
        if (!initialBounds.has_value())
            return juce::Result::fail("start bounds required for " + layerTypeToKey(getLayerType(*layer)) + " layer");

        document.pushHistory();

        mode = nextMode;
        resizeHandle = handle;
        layerId = targetId;
        startLayer = *layer;
        startBounds = *initialBounds;
        currentBounds = startBounds;
        verticalGuides.clear();
        horizontalGuides.clear();
        return juce::Result::ok();
    }

    MoveSnapResult TransformSession::updateMove(const DocumentHandle& document, juce::Point<float> dragDelta)
    {
        if (mode != Mode::move)
            return {};

        const auto& model = document.snapshot();
        auto result = snapEngine.computeMoveSnap(startBounds.translated(dragDelta.x, dragDelta.y),
                                                 static_cast<float>(model.canvasWidth),
                                                 static_cast<float>(model.canvasHeight));

        currentBounds = result.snappedBounds;
        verticalGuides = result.verticalGuides;
        horizontalGuides = result.horizontalGuides;
        return result;
    }

    ResizeResult TransformSession::updateResize(const DocumentHandle& document, juce::Rectangle<float> proposedBounds)
    {
        if (mode != Mode::resize)
            return {};

        const auto& model = document.snapshot();
        auto result = snapEngine.computeResize(currentBounds,
                                               proposedBounds,
                                               resizeHandle,
                                               static_cast<float>(model.canvasWidth),
                                               static_cast<float>(model.canvasHeight));

        currentBounds = result.bounds;
        verticalGuides = result.verticalGuides;
        horizontalGuides = result.horizontalGuides;
        return result;
    }

    TransformState TransformSession::pendingState() const
    {
        TransformState state;
        state.x = startLayer.x + (currentBounds.getX() - startBounds.getX());
        state.y = startLayer.y + (currentBounds.getY() - startBounds.getY());
        state.rotation = startLayer.rotation;
        state.scaleX = startLayer.scaleX;
        state.scaleY = startLayer.scaleY;

        if (mode == Mode::resize)
        {
            if (startBounds.getWidth() > 0.0f)
                state.scaleX = startLayer.scaleX * currentBounds.getWidth() / startBounds.getWidth();
            if (startBounds.getHeight() > 0.0f)
                state.scaleY = startLayer.scaleY * currentBounds.getHeight() / startBounds.getHeight();
        }

        return state;
    }

    juce::Result TransformSession::commit(DocumentHandle& document)
    {
        if (!isActive())
            return juce::Result::fail("no transform in progress");

        const auto patch = commitTransform(startLayer, pendingState());
        const auto targetId = layerId;
        clear();

        if (!document.updateLayer(targetId, patch))
            return juce::Result::fail("transform target no longer exists: " + targetId);

        return juce::Result::ok();
    }

    void TransformSession::cancel() noexcept
    {
        clear();
    }

    void TransformSession::clear() noexcept
    {
        mode = Mode::idle;
        layerId.clear();
        verticalGuides.clear();
        horizontalGuides.clear();
    }
}
