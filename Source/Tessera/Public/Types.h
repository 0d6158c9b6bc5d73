#pragma once

#include <juce_core/juce_core.h>
#include <juce_graphics/juce_graphics.h>
#include <array>
#include <optional>
#include <variant>
#include <vector>

namespace Tessera
{
    using LayerId = juce::String;
    using PageId = juce::String;

    constexpr int kDefaultCanvasWidth = 1280;
    constexpr int kDefaultCanvasHeight = 720;

    enum class LayerType
    {
        image,
        text,
        shape
    };

    enum class ShapeType
    {
        rect,
        ellipse
    };

    enum class FontStyle
    {
        normal,
        bold,
        italic,
        boldItalic
    };

    enum class ToolKind
    {
        select,
        text,
        rect,
        ellipse
    };

    enum class LayerMoveDirection
    {
        up,
        down
    };

    // Scalar radius, or per-corner radii ordered top-left, top-right, bottom-right, bottom-left.
    using CornerRadius = std::variant<float, std::array<float, 4>>;

    struct ImageContent
    {
        juce::String source;
        float width = 0.0f;
        float height = 0.0f;
        std::optional<CornerRadius> cornerRadius;
    };

    struct TextContent
    {
        juce::String text;
        float fontSize = 48.0f;
        juce::String fontFamily = "Inter";
        FontStyle fontStyle = FontStyle::normal;
        juce::String fill = "#ffffff";
        juce::String stroke;
        float strokeWidth = 0.0f;
        juce::String shadowColor = "rgba(0,0,0,0.5)";
        float shadowBlur = 0.0f;
        float shadowOffsetX = 0.0f;
        float shadowOffsetY = 0.0f;
    };

    struct ShapeContent
    {
        ShapeType shapeType = ShapeType::rect;
        float width = 200.0f;
        float height = 150.0f;
        juce::String fill = "#3b82f6";
        juce::String stroke = "#1d4ed8";
        float strokeWidth = 2.0f;
        float cornerRadius = 8.0f; // rect only
    };

    using LayerContent = std::variant<ImageContent, TextContent, ShapeContent>;

    struct LayerModel
    {
        LayerId id;
        juce::String name;
        bool visible = true;
        bool locked = false;
        float x = 0.0f;
        float y = 0.0f;
        float rotation = 0.0f; // degrees
        float scaleX = 1.0f;
        float scaleY = 1.0f;
        float opacity = 1.0f;
        LayerContent content;
    };

    struct PageModel
    {
        PageId id;
        std::vector<LayerModel> layers; // back-to-front
    };

    using PageList = std::vector<PageModel>;

    struct SchemaVersion
    {
        int major = 1;
        int minor = 0;
        int patch = 0;
    };

    inline SchemaVersion currentSchemaVersion() noexcept
    {
        return {};
    }

    inline int compareSchemaVersion(const SchemaVersion& lhs, const SchemaVersion& rhs) noexcept
    {
        if (lhs.major != rhs.major)
            return lhs.major < rhs.major ? -1 : 1;
        if (lhs.minor != rhs.minor)
            return lhs.minor < rhs.minor ? -1 : 1;
        if (lhs.patch != rhs.patch)
            return lhs.patch < rhs.patch ? -1 : 1;
        return 0;
    }

    struct DocumentModel
    {
        PageList pages;
        int activePageIndex = 0;
        std::optional<LayerId> activeLayerId;
        ToolKind activeTool = ToolKind::select;
        int canvasWidth = kDefaultCanvasWidth;
        int canvasHeight = kDefaultCanvasHeight;
    };

    inline LayerType getLayerType(const LayerModel& layer) noexcept
    {
        return std::visit([](const auto& content) -> LayerType
        {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, ImageContent>) return LayerType::image;
            if constexpr (std::is_same_v<T, TextContent>)  return LayerType::text;
            return LayerType::shape;
        }, layer.content);
    }

    inline juce::String layerTypeToKey(LayerType type)
    {
        switch (type)
        {
            case LayerType::image: return "image";
            case LayerType::text:  return "text";
            case LayerType::shape: return "shape";
        }

        return {};
    }

    inline juce::String shapeTypeToKey(ShapeType type)
    {
        return type == ShapeType::ellipse ? "ellipse" : "rect";
    }

    inline std::optional<ShapeType> shapeTypeFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "rect") return ShapeType::rect;
        if (normalized == "ellipse") return ShapeType::ellipse;
        return std::nullopt;
    }

    inline juce::String fontStyleToKey(FontStyle style)
    {
        switch (style)
        {
            case FontStyle::normal:     return "normal";
            case FontStyle::bold:       return "bold";
            case FontStyle::italic:     return "italic";
            case FontStyle::boldItalic: return "bold italic";
        }

        return "normal";
    }

    inline std::optional<FontStyle> fontStyleFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "normal") return FontStyle::normal;
        if (normalized == "bold") return FontStyle::bold;
        if (normalized == "italic") return FontStyle::italic;
        if (normalized == "bold italic") return FontStyle::boldItalic;
        return std::nullopt;
    }

    inline juce::String toolKindToKey(ToolKind tool)
    {
        switch (tool)
        {
            case ToolKind::select:  return "select";
            case ToolKind::text:    return "text";
            case ToolKind::rect:    return "rect";
            case ToolKind::ellipse: return "ellipse";
        }

        return "select";
    }

    inline bool operator==(const ImageContent& lhs, const ImageContent& rhs)
    {
        return lhs.source == rhs.source
            && lhs.width == rhs.width
            && lhs.height == rhs.height
            && lhs.cornerRadius == rhs.cornerRadius;
    }

    inline bool operator==(const TextContent& lhs, const TextContent& rhs)
    {
        return lhs.text == rhs.text
            && lhs.fontSize == rhs.fontSize
            && lhs.fontFamily == rhs.fontFamily
            && lhs.fontStyle == rhs.fontStyle
            && lhs.fill == rhs.fill
            && lhs.stroke == rhs.stroke
            && lhs.strokeWidth == rhs.strokeWidth
            && lhs.shadowColor == rhs.shadowColor
            && lhs.shadowBlur == rhs.shadowBlur
            && lhs.shadowOffsetX == rhs.shadowOffsetX
            && lhs.shadowOffsetY == rhs.shadowOffsetY;
    }

    inline bool operator==(const ShapeContent& lhs, const ShapeContent& rhs)
    {
        return lhs.shapeType == rhs.shapeType
            && lhs.width == rhs.width
            && lhs.height == rhs.height
            && lhs.fill == rhs.fill
            && lhs.stroke == rhs.stroke
            && lhs.strokeWidth == rhs.strokeWidth
            && lhs.cornerRadius == rhs.cornerRadius;
    }

    // Everything except the id.
    inline bool sameLayerContent(const LayerModel& lhs, const LayerModel& rhs)
    {
        return lhs.name == rhs.name
            && lhs.visible == rhs.visible
            && lhs.locked == rhs.locked
            && lhs.x == rhs.x
            && lhs.y == rhs.y
            && lhs.rotation == rhs.rotation
            && lhs.scaleX == rhs.scaleX
            && lhs.scaleY == rhs.scaleY
            && lhs.opacity == rhs.opacity
            && lhs.content == rhs.content;
    }

    inline bool operator==(const LayerModel& lhs, const LayerModel& rhs)
    {
        return lhs.id == rhs.id && sameLayerContent(lhs, rhs);
    }

    inline bool operator!=(const LayerModel& lhs, const LayerModel& rhs)
    {
        return !(lhs == rhs);
    }

    inline bool operator==(const PageModel& lhs, const PageModel& rhs)
    {
        return lhs.id == rhs.id && lhs.layers == rhs.layers;
    }

    inline bool operator!=(const PageModel& lhs, const PageModel& rhs)
    {
        return !(lhs == rhs);
    }
}
