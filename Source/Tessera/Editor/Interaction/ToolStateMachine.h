#pragma once

#include "Tessera/Public/DocumentHandle.h"

namespace Tessera::Ui::Interaction
{
    // Interprets pointer clicks according to the document's active tool.
    // Canvas clicks keep the tool for repeated placement; toolbar creation
    // is single-shot and returns to select.
    class ToolStateMachine
    {
    public:
        static constexpr const char* kDefaultText = "Your Text";

        void setTool(DocumentHandle& document, ToolKind tool) const;
        ToolKind currentTool(const DocumentHandle& document) const noexcept;

        juce::Result handleBackgroundClick(DocumentHandle& document,
                                           juce::Point<float> canvasPoint,
                                           LayerId* createdIdOut = nullptr) const;
        juce::Result handleLayerClick(DocumentHandle& document, const LayerId& layerId) const;
        juce::Result createFromToolbar(DocumentHandle& document,
                                       ToolKind tool,
                                       LayerId* createdIdOut = nullptr) const;

    private:
        LayerId createForTool(DocumentHandle& document, ToolKind tool) const;
    };
}
