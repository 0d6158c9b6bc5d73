#pragma once

#include "Tessera/Public/Types.h"
#include <algorithm>
#include <cmath>
#include <set>

namespace Tessera::Core::DocumentValidator
{
    inline bool isFiniteOpacity(float value) noexcept
    {
        return std::isfinite(value) && value >= 0.0f && value <= 1.0f;
    }

    inline bool isFiniteNonNegative(float value) noexcept
    {
        return std::isfinite(value) && value >= 0.0f;
    }

    inline juce::Result validateSchemaVersion(const SchemaVersion& version)
    {
        const auto current = currentSchemaVersion();
        if (version.major != current.major)
            return juce::Result::fail("schema.major mismatch");

        if (compareSchemaVersion(version, current) > 0)
            return juce::Result::fail("schema is newer than runtime");

        return juce::Result::ok();
    }

    inline juce::Result validateContent(const LayerContent& content)
    {
        return std::visit([](const auto& value) -> juce::Result
        {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ImageContent>)
            {
                if (!isFiniteNonNegative(value.width) || !isFiniteNonNegative(value.height))
                    return juce::Result::fail("image width/height must be finite and >= 0");
            }
            else if constexpr (std::is_same_v<T, TextContent>)
            {
                if (!std::isfinite(value.fontSize) || value.fontSize <= 0.0f)
                    return juce::Result::fail("text fontSize must be > 0");
                if (!isFiniteNonNegative(value.strokeWidth) || !isFiniteNonNegative(value.shadowBlur))
                    return juce::Result::fail("text strokeWidth/shadowBlur must be finite and >= 0");
                if (!std::isfinite(value.shadowOffsetX) || !std::isfinite(value.shadowOffsetY))
                    return juce::Result::fail("text shadow offset must be finite");
            }
            else
            {
                if (!isFiniteNonNegative(value.width) || !isFiniteNonNegative(value.height))
                    return juce::Result::fail("shape width/height must be finite and >= 0");
                if (!isFiniteNonNegative(value.strokeWidth) || !isFiniteNonNegative(value.cornerRadius))
                    return juce::Result::fail("shape strokeWidth/cornerRadius must be finite and >= 0");
            }

            return juce::Result::ok();
        }, content);
    }

    inline juce::Result validateLayer(const LayerModel& layer)
    {
        if (layer.id.isEmpty())
            return juce::Result::fail("layer.id must not be empty");

        if (!std::isfinite(layer.x) || !std::isfinite(layer.y) || !std::isfinite(layer.rotation))
            return juce::Result::fail("layer position/rotation must be finite");
        if (!std::isfinite(layer.scaleX) || !std::isfinite(layer.scaleY))
            return juce::Result::fail("layer scale must be finite");
        if (!isFiniteOpacity(layer.opacity))
            return juce::Result::fail("layer.opacity must be within [0, 1]");

        const auto contentResult = validateContent(layer.content);
        if (contentResult.failed())
            return juce::Result::fail("layer " + layer.id + ": " + contentResult.getErrorMessage());

        return juce::Result::ok();
    }

    inline juce::Result validatePages(const PageList& pages)
    {
        if (pages.empty())
            return juce::Result::fail("document must contain at least one page");

        std::set<juce::String> ids;
        for (const auto& page : pages)
        {
            if (page.id.isEmpty())
                return juce::Result::fail("page.id must not be empty");
            if (!ids.insert(page.id).second)
                return juce::Result::fail("ids must be unique: " + page.id);

            for (const auto& layer : page.layers)
            {
                const auto layerResult = validateLayer(layer);
                if (layerResult.failed())
                    return layerResult;

                if (!ids.insert(layer.id).second)
                    return juce::Result::fail("ids must be unique: " + layer.id);
            }
        }

        return juce::Result::ok();
    }

    inline juce::Result validateCanvasSize(int width, int height)
    {
        if (width <= 0 || height <= 0)
            return juce::Result::fail("canvas size must be positive");

        return juce::Result::ok();
    }

    inline juce::Result validateDocument(const DocumentModel& document)
    {
        const auto pagesResult = validatePages(document.pages);
        if (pagesResult.failed())
            return pagesResult;

        const auto canvasResult = validateCanvasSize(document.canvasWidth, document.canvasHeight);
        if (canvasResult.failed())
            return canvasResult;

        if (document.activePageIndex < 0 || document.activePageIndex >= static_cast<int>(document.pages.size()))
            return juce::Result::fail("activePageIndex out of range");

        if (document.activeLayerId.has_value())
        {
            const auto& layers = document.pages[static_cast<size_t>(document.activePageIndex)].layers;
            const auto found = std::any_of(layers.begin(),
                                           layers.end(),
                                           [&document](const LayerModel& layer)
                                           {
                                               return layer.id == *document.activeLayerId;
                                           });
            if (!found)
                return juce::Result::fail("activeLayerId must exist on the active page");
        }

        return juce::Result::ok();
    }
}
