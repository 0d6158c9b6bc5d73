#include "Tessera/Editor/Interaction/SnapEngine.h"

#include <algorithm>
#include <cmath>

namespace Tessera::Ui::Interaction
{
    namespace
    {
        constexpr float kHandleSize = 8.0f;
        constexpr float kHandleHitPadding = 4.0f;

        struct AxisSnap
        {
            bool hasValue = false;
            float delta = 0.0f;
            float guide = 0.0f;
        };

        // Start edge, end edge, then centre; first match inside the threshold wins.
        AxisSnap snapMovingAxis(float start, float size, float extent, float threshold)
        {
            AxisSnap snap;
            const auto end = start + size;
            const auto centre = start + size * 0.5f;

            if (std::abs(start) < threshold)
                snap = { true, -start, 0.0f };
            else if (std::abs(end - extent) < threshold)
                snap = { true, extent - end, extent };
            else if (std::abs(centre - extent * 0.5f) < threshold)
                snap = { true, extent * 0.5f - centre, extent * 0.5f };

            return snap;
        }

        // Snaps one dragged edge coordinate. Returns the guide when it moved.
        // Left/top edges snap to the canvas origin, right/bottom edges to the canvas extent.
        // Both fall back to the canvas centre.
        std::optional<float> snapToTarget(float& edge, float target, float centre, float threshold)
        {
            if (std::abs(edge - target) < threshold)
                edge = target;
            else if (std::abs(edge - centre) < threshold)
                edge = centre;
            else
                return std::nullopt;

            return edge;
        }

        std::optional<float> snapStartEdge(float& edge, float extent, float threshold)
        {
            return snapToTarget(edge, 0.0f, extent * 0.5f, threshold);
        }

        std::optional<float> snapEndEdge(float& edge, float extent, float threshold)
        {
            return snapToTarget(edge, extent, extent * 0.5f, threshold);
        }

        bool dragsLeft(ResizeHandle handle) noexcept
        {
            return handle == ResizeHandle::nw || handle == ResizeHandle::w || handle == ResizeHandle::sw;
        }

        bool dragsRight(ResizeHandle handle) noexcept
        {
            return handle == ResizeHandle::ne || handle == ResizeHandle::e || handle == ResizeHandle::se;
        }

        bool dragsTop(ResizeHandle handle) noexcept
        {
            return handle == ResizeHandle::nw || handle == ResizeHandle::n || handle == ResizeHandle::ne;
        }

        bool dragsBottom(ResizeHandle handle) noexcept
        {
            return handle == ResizeHandle::sw || handle == ResizeHandle::s || handle == ResizeHandle::se;
        }
    }

    juce::String resizeHandleToKey(ResizeHandle handle)
    {
        switch (handle)
        {
            case ResizeHandle::nw: return "nw";
            case ResizeHandle::n:  return "n";
            case ResizeHandle::ne: return "ne";
            case ResizeHandle::e:  return "e";
            case ResizeHandle::se: return "se";
            case ResizeHandle::s:  return "s";
            case ResizeHandle::sw: return "sw";
            case ResizeHandle::w:  return "w";
        }

        return {};
    }

    SnapSettings makeSnapSettings(const EditorSettings& settings)
    {
        SnapSettings snap;
        snap.enabled = settings.snapEnabled;
        snap.threshold = settings.snapThreshold;
        snap.minimumSize = settings.resizeMinSize;
        return snap;
    }

    MoveSnapResult SnapEngine::computeMoveSnap(const juce::Rectangle<float>& box,
                                               float canvasWidth,
                                               float canvasHeight) const
    {
        MoveSnapResult result;
        result.snappedBounds = box;

        if (!settings.enabled)
            return result;

        const auto threshold = std::max(0.0f, settings.threshold);
        const auto xSnap = snapMovingAxis(box.getX(), box.getWidth(), canvasWidth, threshold);
        const auto ySnap = snapMovingAxis(box.getY(), box.getHeight(), canvasHeight, threshold);

        if (xSnap.hasValue)
        {
            result.delta.x = xSnap.delta;
            result.verticalGuides.push_back(xSnap.guide);
        }

        if (ySnap.hasValue)
        {
            result.delta.y = ySnap.delta;
            result.horizontalGuides.push_back(ySnap.guide);
        }

        result.snappedBounds = box.translated(result.delta.x, result.delta.y);
        return result;
    }

    ResizeResult SnapEngine::computeResize(const juce::Rectangle<float>& previous,
                                           const juce::Rectangle<float>& proposed,
                                           ResizeHandle handle,
                                           float canvasWidth,
                                           float canvasHeight) const
    {
        auto left = proposed.getX();
        auto top = proposed.getY();
        auto right = proposed.getRight();
        auto bottom = proposed.getBottom();

        ResizeResult result;
        if (settings.enabled)
        {
            const auto threshold = std::max(0.0f, settings.threshold);

            if (dragsLeft(handle))
            {
                if (const auto guide = snapStartEdge(left, canvasWidth, threshold))
                    result.verticalGuides.push_back(*guide);
            }
            else if (dragsRight(handle))
            {
                if (const auto guide = snapEndEdge(right, canvasWidth, threshold))
                    result.verticalGuides.push_back(*guide);
            }

            if (dragsTop(handle))
            {
                if (const auto guide = snapStartEdge(top, canvasHeight, threshold))
                    result.horizontalGuides.push_back(*guide);
            }
            else if (dragsBottom(handle))
            {
                if (const auto guide = snapEndEdge(bottom, canvasHeight, threshold))
                    result.horizontalGuides.push_back(*guide);
            }
        }

        const auto width = right - left;
        const auto height = bottom - top;
        if (!std::isfinite(width) || !std::isfinite(height)
            || width < settings.minimumSize || height < settings.minimumSize)
        {
            ResizeResult rejected;
            rejected.bounds = previous;
            return rejected;
        }

        result.bounds = { left, top, width, height };
        result.accepted = true;
        return result;
    }

    juce::Point<float> screenToCanvas(juce::Point<float> screenPoint, juce::Point<float> viewOrigin, float zoom)
    {
        const auto scale = (std::isfinite(zoom) && zoom > 0.0f) ? zoom : 1.0f;
        return (screenPoint - viewOrigin) / scale;
    }

    juce::Point<float> handlePosition(const juce::Rectangle<float>& box, ResizeHandle handle)
    {
        switch (handle)
        {
            case ResizeHandle::nw: return box.getTopLeft();
            case ResizeHandle::n:  return { box.getCentreX(), box.getY() };
            case ResizeHandle::ne: return box.getTopRight();
            case ResizeHandle::e:  return { box.getRight(), box.getCentreY() };
            case ResizeHandle::se: return box.getBottomRight();
            case ResizeHandle::s:  return { box.getCentreX(), box.getBottom() };
            case ResizeHandle::sw: return box.getBottomLeft();
            case ResizeHandle::w:  return { box.getX(), box.getCentreY() };
        }

        return box.getCentre();
    }

    std::array<juce::Point<float>, 8> handlePositions(const juce::Rectangle<float>& box)
    {
        std::array<juce::Point<float>, 8> positions;
        for (size_t i = 0; i < kAllResizeHandles.size(); ++i)
            positions[i] = handlePosition(box, kAllResizeHandles[i]);

        return positions;
    }

    std::optional<ResizeHandle> hitTestHandle(const juce::Rectangle<float>& box, juce::Point<float> point, float zoom)
    {
        const auto scale = (std::isfinite(zoom) && zoom > 0.0f) ? zoom : 1.0f;
        const auto hitRadius = kHandleSize / scale + kHandleHitPadding;

        for (const auto handle : kAllResizeHandles)
        {
            const auto position = handlePosition(box, handle);
            if (std::abs(point.x - position.x) < hitRadius && std::abs(point.y - position.y) < hitRadius)
                return handle;
        }

        return std::nullopt;
    }

    std::optional<juce::Rectangle<float>> layerBounds(const LayerModel& layer)
    {
        const auto size = std::visit([](const auto& content) -> std::optional<juce::Point<float>>
        {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, TextContent>)
                return std::nullopt;
            else
                return juce::Point<float> { content.width, content.height };
        }, layer.content);

        if (!size.has_value())
            return std::nullopt;

        const juce::Rectangle<float> local { 0.0f, 0.0f, size->x, size->y };
        const auto transform = juce::AffineTransform::scale(layer.scaleX, layer.scaleY)
                                   .rotated(juce::degreesToRadians(layer.rotation))
                                   .translated(layer.x, layer.y);

        return local.transformedBy(transform);
    }

    LayerPatch commitTransform(const LayerModel& layer, const TransformState& state)
    {
        LayerPatch patch;
        patch.x = state.x;
        patch.y = state.y;
        patch.rotation = state.rotation;

        if (const auto* text = std::get_if<TextContent>(&layer.content))
        {
            patch.fontSize = std::max(1.0f, std::round(text->fontSize * state.scaleX));
            patch.scaleX = 1.0f;
            patch.scaleY = 1.0f;
        }
        else
        {
            patch.scaleX = state.scaleX;
            patch.scaleY = state.scaleY;
        }

        return patch;
    }
}
