#pragma once

#include "Tessera/Public/Types.h"
#include <set>

namespace Tessera::Core
{
    using IdSet = std::set<juce::String>;

    // Fresh UUID that is not in takenIds. The result is inserted into takenIds.
    juce::String createUniqueId(IdSet& takenIds);

    IdSet collectIds(const PageList& pages);

    LayerModel makeImageLayer(const LayerId& id, const juce::String& source, float width, float height);
    LayerModel makeTextLayer(const LayerId& id, const juce::String& text);
    LayerModel makeShapeLayer(const LayerId& id, ShapeType shapeType);
    LayerModel makeBackgroundLayer(const LayerId& id, int canvasWidth, int canvasHeight);

    juce::String textLayerName(const juce::String& text);

    PageModel makeBlankPage(IdSet& takenIds);
    PageModel makeBackgroundPage(IdSet& takenIds, int canvasWidth, int canvasHeight);

    // Deep copy with a fresh page id and fresh layer ids.
    PageModel clonePageWithFreshIds(const PageModel& source, IdSet& takenIds);
}
