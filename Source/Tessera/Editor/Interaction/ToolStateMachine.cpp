#include "Tessera/Editor/Interaction/ToolStateMachine.h"

namespace Tessera::Ui::Interaction
{
    namespace
    {
        // Toolbar placement offsets from the canvas centre.
        constexpr float kToolbarOffsetX = 100.0f;
        constexpr float kToolbarTextOffsetY = 24.0f;
        constexpr float kToolbarShapeOffsetY = 75.0f;

        juce::Result moveCreatedLayer(DocumentHandle& document, const LayerId& id, float x, float y)
        {
            LayerPatch patch;
            patch.x = x;
            patch.y = y;
            if (!document.updateLayer(id, patch))
                return juce::Result::fail("created layer could not be positioned");

            return juce::Result::ok();
        }
    }

    void ToolStateMachine::setTool(DocumentHandle& document, ToolKind tool) const
    {
        document.setActiveTool(tool);
    }

    ToolKind ToolStateMachine::currentTool(const DocumentHandle& document) const noexcept
    {
        return document.snapshot().activeTool;
    }

    LayerId ToolStateMachine::createForTool(DocumentHandle& document, ToolKind tool) const
    {
        switch (tool)
        {
            case ToolKind::text:    return document.addTextLayer(kDefaultText);
            case ToolKind::rect:    return document.addShapeLayer(ShapeType::rect);
            case ToolKind::ellipse: return document.addShapeLayer(ShapeType::ellipse);
            case ToolKind::select:  break;
        }

        return {};
    }

    juce::Result ToolStateMachine::handleBackgroundClick(DocumentHandle& document,
                                                         juce::Point<float> canvasPoint,
                                                         LayerId* createdIdOut) const
    {
        const auto tool = currentTool(document);
        if (tool == ToolKind::select)
        {
            if (!document.setActiveLayer(std::nullopt))
                return juce::Result::fail("failed to clear active layer");

            return juce::Result::ok();
        }

        const auto createdId = createForTool(document, tool);
        if (createdId.isEmpty())
            return juce::Result::fail("failed to create layer for tool " + toolKindToKey(tool));

        if (createdIdOut != nullptr)
            *createdIdOut = createdId;

        return moveCreatedLayer(document, createdId, canvasPoint.x, canvasPoint.y);
    }

    juce::Result ToolStateMachine::handleLayerClick(DocumentHandle& document, const LayerId& layerId) const
    {
        if (!document.setActiveLayer(layerId))
            return juce::Result::fail("layer not found on active page: " + layerId);

        return juce::Result::ok();
    }

    juce::Result ToolStateMachine::createFromToolbar(DocumentHandle& document,
                                                     ToolKind tool,
                                                     LayerId* createdIdOut) const
    {
        if (tool == ToolKind::select)
        {
            setTool(document, ToolKind::select);
            return juce::Result::ok();
        }

        const auto createdId = createForTool(document, tool);
        if (createdId.isEmpty())
            return juce::Result::fail("failed to create layer for tool " + toolKindToKey(tool));

        if (createdIdOut != nullptr)
            *createdIdOut = createdId;

        const auto& model = document.snapshot();
        const auto offsetY = tool == ToolKind::text ? kToolbarTextOffsetY : kToolbarShapeOffsetY;
        const auto result = moveCreatedLayer(document,
                                             createdId,
                                             static_cast<float>(model.canvasWidth) * 0.5f - kToolbarOffsetX,
                                             static_cast<float>(model.canvasHeight) * 0.5f - offsetY);

        setTool(document, ToolKind::select);
        return result;
    }
}
