#pragma once

#include "Tessera/Editor/Interaction/SnapEngine.h"
#include "Tessera/Public/DocumentHandle.h"

namespace Tessera::Ui::Interaction
{
    // Drives one drag or resize gesture. History is snapshotted once at the
    // start; intermediate updates only compute snapped geometry and guides, and
    // commit() writes the result with a single updateLayer.
    class TransformSession
    {
    public:
        enum class Mode
        {
            idle,
            move,
            resize
        };

        explicit TransformSession(SnapEngine snapEngineIn) noexcept;

        // Start bounds default to layerBounds(); text layers need the measured box.
        juce::Result beginMove(DocumentHandle& document, const LayerId& layerId);
        juce::Result beginMove(DocumentHandle& document, const LayerId& layerId, juce::Rectangle<float> initialBounds);
        juce::Result beginResize(DocumentHandle& document, const LayerId& layerId, ResizeHandle handle);
        juce::Result beginResize(DocumentHandle& document,
                                 const LayerId& layerId,
                                 ResizeHandle handle,
                                 juce::Rectangle<float> initialBounds);

        // dragDelta is in canvas units, measured from the gesture start.
        MoveSnapResult updateMove(const DocumentHandle& document, juce::Point<float> dragDelta);
        ResizeResult updateResize(const DocumentHandle& document, juce::Rectangle<float> proposedBounds);

        juce::Result commit(DocumentHandle& document);
        void cancel() noexcept;

        Mode getMode() const noexcept { return mode; }
        bool isActive() const noexcept { return mode != Mode::idle; }
        const LayerId& getLayerId() const noexcept { return layerId; }
        juce::Rectangle<float> getCurrentBounds() const noexcept { return currentBounds; }
        const std::vector<float>& getVerticalGuides() const noexcept { return verticalGuides; }
        const std::vector<float>& getHorizontalGuides() const noexcept { return horizontalGuides; }

    private:
        juce::Result begin(DocumentHandle& document,
                           const LayerId& targetId,
                           Mode nextMode,
                           ResizeHandle handle,
                           std::optional<juce::Rectangle<float>> initialBounds);
        TransformState pendingState() const;
        void clear() noexcept;

        SnapEngine snapEngine;
        Mode mode = Mode::idle;
        LayerId layerId;
        ResizeHandle resizeHandle = ResizeHandle::se;
        LayerModel startLayer;
        juce::Rectangle<float> startBounds;
        juce::Rectangle<float> currentBounds;
        std::vector<float> verticalGuides;
        std::vector<float> horizontalGuides;
    };
}
