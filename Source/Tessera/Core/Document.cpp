#include "Tessera/Core/Document.h"

namespace
{
    constexpr int kMaxTextLayerNameLength = 20;

    juce::String createIdCandidate()
    {
        return juce::Uuid().toDashedString();
    }
}

namespace Tessera::Core
{
    juce::String createUniqueId(IdSet& takenIds)
    {
        auto newId = createIdCandidate();
        while (newId.isEmpty() || takenIds.count(newId) > 0)
            newId = createIdCandidate();

        takenIds.insert(newId);
        return newId;
    }

    IdSet collectIds(const PageList& pages)
    {
        IdSet ids;
        for (const auto& page : pages)
        {
            ids.insert(page.id);
            for (const auto& layer : page.layers)
                ids.insert(layer.id);
        }

        return ids;
    }

    LayerModel makeImageLayer(const LayerId& id, const juce::String& source, float width, float height)
    {
        LayerModel layer;
        layer.id = id;
        layer.name = "Image";

        ImageContent image;
        image.source = source;
        image.width = width;
        image.height = height;
        layer.content = std::move(image);
        return layer;
    }

    juce::String textLayerName(const juce::String& text)
    {
        const auto prefix = text.substring(0, kMaxTextLayerNameLength);
        return prefix.isEmpty() ? juce::String("Text") : prefix;
    }

    LayerModel makeTextLayer(const LayerId& id, const juce::String& text)
    {
        LayerModel layer;
        layer.id = id;
        layer.name = textLayerName(text);
        layer.x = 100.0f;
        layer.y = 100.0f;

        TextContent content;
        content.text = text;
        layer.content = std::move(content);
        return layer;
    }

    LayerModel makeShapeLayer(const LayerId& id, ShapeType shapeType)
    {
        LayerModel layer;
        layer.id = id;
        layer.name = shapeType == ShapeType::rect ? "Rectangle" : "Ellipse";
        layer.x = 100.0f;
        layer.y = 100.0f;

        ShapeContent shape;
        shape.shapeType = shapeType;
        shape.cornerRadius = shapeType == ShapeType::rect ? 8.0f : 0.0f;
        layer.content = std::move(shape);
        return layer;
    }

    LayerModel makeBackgroundLayer(const LayerId& id, int canvasWidth, int canvasHeight)
    {
        LayerModel layer;
        layer.id = id;
        layer.name = "Background Layer";
        layer.locked = true;

        ShapeContent shape;
        shape.shapeType = ShapeType::rect;
        shape.width = static_cast<float>(canvasWidth);
        shape.height = static_cast<float>(canvasHeight);
        shape.fill = "#ffffff";
        shape.stroke = {};
        shape.strokeWidth = 0.0f;
        shape.cornerRadius = 0.0f;
        layer.content = std::move(shape);
        return layer;
    }

    PageModel makeBlankPage(IdSet& takenIds)
    {
        PageModel page;
        page.id = createUniqueId(takenIds);
        return page;
    }

    PageModel makeBackgroundPage(IdSet& takenIds, int canvasWidth, int canvasHeight)
    {
        auto page = makeBlankPage(takenIds);
        page.layers.push_back(makeBackgroundLayer(createUniqueId(takenIds), canvasWidth, canvasHeight));
        return page;
    }

    PageModel clonePageWithFreshIds(const PageModel& source, IdSet& takenIds)
    {
        PageModel copy = source;
        copy.id = createUniqueId(takenIds);
        for (auto& layer : copy.layers)
            layer.id = createUniqueId(takenIds);

        return copy;
    }
}
