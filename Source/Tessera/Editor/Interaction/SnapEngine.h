#pragma once

#include "Tessera/Config/EditorSettings.h"
#include "Tessera/Public/LayerPatch.h"
#include "Tessera/Public/Types.h"
#include <array>
#include <optional>
#include <vector>

namespace Tessera::Ui::Interaction
{
    enum class ResizeHandle
    {
        nw,
        n,
        ne,
        e,
        se,
        s,
        sw,
        w
    };

    constexpr std::array<ResizeHandle, 8> kAllResizeHandles {
        ResizeHandle::nw, ResizeHandle::n, ResizeHandle::ne, ResizeHandle::e,
        ResizeHandle::se, ResizeHandle::s, ResizeHandle::sw, ResizeHandle::w
    };

    juce::String resizeHandleToKey(ResizeHandle handle);

    struct SnapSettings
    {
        bool enabled = true;
        float threshold = 8.0f;
        float minimumSize = 10.0f;
    };

    SnapSettings makeSnapSettings(const EditorSettings& settings);

    struct MoveSnapResult
    {
        juce::Point<float> delta;
        juce::Rectangle<float> snappedBounds;
        std::vector<float> verticalGuides;   // x positions
        std::vector<float> horizontalGuides; // y positions
    };

    struct ResizeResult
    {
        juce::Rectangle<float> bounds;
        bool accepted = false;
        std::vector<float> verticalGuides;
        std::vector<float> horizontalGuides;
    };

    // Geometry captured at the end of a drag or resize gesture.
    struct TransformState
    {
        float x = 0.0f;
        float y = 0.0f;
        float rotation = 0.0f;
        float scaleX = 1.0f;
        float scaleY = 1.0f;
    };

    class SnapEngine
    {
    public:
        SnapEngine() = default;
        explicit SnapEngine(SnapSettings settingsIn)
            : settings(settingsIn)
        {
        }

        const SnapSettings& getSettings() const noexcept { return settings; }
        void setSettings(SnapSettings settingsIn) noexcept { settings = settingsIn; }

        // Per axis the first match wins: start edge to 0, end edge to the canvas
        // extent, then centre to the canvas centre.
        MoveSnapResult computeMoveSnap(const juce::Rectangle<float>& box,
                                       float canvasWidth,
                                       float canvasHeight) const;

        // Dragged edges snap to the canvas edges, else to its centre line. The
        // opposite edge stays put. Boxes below the minimum size are rejected.
        ResizeResult computeResize(const juce::Rectangle<float>& previous,
                                   const juce::Rectangle<float>& proposed,
                                   ResizeHandle handle,
                                   float canvasWidth,
                                   float canvasHeight) const;

    private:
        SnapSettings settings;
    };

    juce::Point<float> screenToCanvas(juce::Point<float> screenPoint, juce::Point<float> viewOrigin, float zoom);

    juce::Point<float> handlePosition(const juce::Rectangle<float>& box, ResizeHandle handle);
    std::array<juce::Point<float>, 8> handlePositions(const juce::Rectangle<float>& box);
    std::optional<ResizeHandle> hitTestHandle(const juce::Rectangle<float>& box, juce::Point<float> point, float zoom);

    // Axis-aligned extent after scale and rotation about the layer origin.
    // Text has no intrinsic size here.
    std::optional<juce::Rectangle<float>> layerBounds(const LayerModel& layer);

    LayerPatch commitTransform(const LayerModel& layer, const TransformState& state);
}
