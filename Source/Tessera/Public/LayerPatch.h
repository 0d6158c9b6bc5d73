#pragma once

#include "Tessera/Public/Types.h"
#include <cmath>
#include <optional>

namespace Tessera
{
    // Partial layer update. Absent fields are left untouched.
    struct LayerPatch
    {
        std::optional<juce::String> name;
        std::optional<bool> visible;
        std::optional<bool> locked;
        std::optional<float> x;
        std::optional<float> y;
        std::optional<float> rotation;
        std::optional<float> scaleX;
        std::optional<float> scaleY;
        std::optional<float> opacity;

        // image and shape
        std::optional<float> width;
        std::optional<float> height;

        // image
        std::optional<juce::String> source;
        std::optional<CornerRadius> imageCornerRadius;

        // text
        std::optional<juce::String> text;
        std::optional<float> fontSize;
        std::optional<juce::String> fontFamily;
        std::optional<FontStyle> fontStyle;
        std::optional<float> shadowBlur;
        std::optional<float> shadowOffsetX;
        std::optional<float> shadowOffsetY;
        std::optional<juce::String> shadowColor;

        // text and shape
        std::optional<juce::String> fill;
        std::optional<juce::String> stroke;
        std::optional<float> strokeWidth;

        // shape (rect only)
        std::optional<float> cornerRadius;

        bool isEmpty() const noexcept
        {
            return !name && !visible && !locked && !x && !y && !rotation && !scaleX && !scaleY && !opacity
                && !width && !height && !source && !imageCornerRadius
                && !text && !fontSize && !fontFamily && !fontStyle
                && !shadowBlur && !shadowOffsetX && !shadowOffsetY && !shadowColor
                && !fill && !stroke && !strokeWidth && !cornerRadius;
        }
    };

    namespace Detail
    {
        inline bool isFinite(const std::optional<float>& value) noexcept
        {
            return !value.has_value() || std::isfinite(*value);
        }

        inline bool isFiniteNonNegative(const std::optional<float>& value) noexcept
        {
            return !value.has_value() || (std::isfinite(*value) && *value >= 0.0f);
        }

        inline bool isValidCornerRadius(const CornerRadius& radius) noexcept
        {
            if (const auto* scalar = std::get_if<float>(&radius))
                return std::isfinite(*scalar) && *scalar >= 0.0f;

            for (const auto corner : std::get<std::array<float, 4>>(radius))
            {
                if (!std::isfinite(corner) || corner < 0.0f)
                    return false;
            }

            return true;
        }
    }

    inline juce::Result validateLayerPatch(const LayerPatch& patch)
    {
        if (!Detail::isFinite(patch.x) || !Detail::isFinite(patch.y))
            return juce::Result::fail("position must be finite");
        if (!Detail::isFinite(patch.rotation))
            return juce::Result::fail("rotation must be finite");
        if (!Detail::isFinite(patch.scaleX) || !Detail::isFinite(patch.scaleY))
            return juce::Result::fail("scale must be finite");

        if (patch.opacity.has_value()
            && (!std::isfinite(*patch.opacity) || *patch.opacity < 0.0f || *patch.opacity > 1.0f))
            return juce::Result::fail("opacity must be within [0, 1]");

        if (!Detail::isFiniteNonNegative(patch.width) || !Detail::isFiniteNonNegative(patch.height))
            return juce::Result::fail("width/height must be finite and >= 0");
        if (!Detail::isFiniteNonNegative(patch.strokeWidth))
            return juce::Result::fail("strokeWidth must be finite and >= 0");
        if (!Detail::isFiniteNonNegative(patch.shadowBlur))
            return juce::Result::fail("shadowBlur must be finite and >= 0");
        if (!Detail::isFinite(patch.shadowOffsetX) || !Detail::isFinite(patch.shadowOffsetY))
            return juce::Result::fail("shadow offset must be finite");
        if (!Detail::isFiniteNonNegative(patch.cornerRadius))
            return juce::Result::fail("cornerRadius must be finite and >= 0");

        if (patch.imageCornerRadius.has_value() && !Detail::isValidCornerRadius(*patch.imageCornerRadius))
            return juce::Result::fail("image cornerRadius must be finite and >= 0");

        if (patch.fontSize.has_value() && (!std::isfinite(*patch.fontSize) || *patch.fontSize <= 0.0f))
            return juce::Result::fail("fontSize must be > 0");

        return juce::Result::ok();
    }

    // Merges a validated patch. Fields for another layer type are skipped.
    inline void applyLayerPatch(LayerModel& layer, const LayerPatch& patch)
    {
        if (patch.name) layer.name = *patch.name;
        if (patch.visible) layer.visible = *patch.visible;
        if (patch.locked) layer.locked = *patch.locked;
        if (patch.x) layer.x = *patch.x;
        if (patch.y) layer.y = *patch.y;
        if (patch.rotation) layer.rotation = *patch.rotation;
        if (patch.scaleX) layer.scaleX = *patch.scaleX;
        if (patch.scaleY) layer.scaleY = *patch.scaleY;
        if (patch.opacity) layer.opacity = *patch.opacity;

        std::visit([&patch](auto& content)
        {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, ImageContent>)
            {
                if (patch.source) content.source = *patch.source;
                if (patch.width) content.width = *patch.width;
                if (patch.height) content.height = *patch.height;
                if (patch.imageCornerRadius) content.cornerRadius = *patch.imageCornerRadius;
            }
            else if constexpr (std::is_same_v<T, TextContent>)
            {
                if (patch.text) content.text = *patch.text;
                if (patch.fontSize) content.fontSize = *patch.fontSize;
                if (patch.fontFamily) content.fontFamily = *patch.fontFamily;
                if (patch.fontStyle) content.fontStyle = *patch.fontStyle;
                if (patch.fill) content.fill = *patch.fill;
                if (patch.stroke) content.stroke = *patch.stroke;
                if (patch.strokeWidth) content.strokeWidth = *patch.strokeWidth;
                if (patch.shadowColor) content.shadowColor = *patch.shadowColor;
                if (patch.shadowBlur) content.shadowBlur = *patch.shadowBlur;
                if (patch.shadowOffsetX) content.shadowOffsetX = *patch.shadowOffsetX;
                if (patch.shadowOffsetY) content.shadowOffsetY = *patch.shadowOffsetY;
            }
            else
            {
                if (patch.width) content.width = *patch.width;
                if (patch.height) content.height = *patch.height;
                if (patch.fill) content.fill = *patch.fill;
                if (patch.stroke) content.stroke = *patch.stroke;
                if (patch.strokeWidth) content.strokeWidth = *patch.strokeWidth;
                if (patch.cornerRadius && content.shapeType == ShapeType::rect)
                    content.cornerRadius = *patch.cornerRadius;
            }
        }, layer.content);
    }
}
