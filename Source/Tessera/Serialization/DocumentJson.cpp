#include "Tessera/Serialization/DocumentJson.h"

#include "Tessera/Core/Document.h"
#include "Tessera/Core/DocumentValidator.h"
#include <cmath>
#include <limits>
#include <memory>

namespace
{
    bool isNumericVar(const juce::var& value) noexcept
    {
        return value.isInt() || value.isInt64() || value.isDouble();
    }

    juce::var serializeSchemaVersion(const Tessera::SchemaVersion& version)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("major", version.major);
        object->setProperty("minor", version.minor);
        object->setProperty("patch", version.patch);
        return juce::var(object.release());
    }

    std::optional<Tessera::SchemaVersion> parseSchemaVersion(const juce::var& value)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return std::nullopt;

        const auto& props = object->getProperties();
        if (!isNumericVar(props["major"]) || !isNumericVar(props["minor"]) || !isNumericVar(props["patch"]))
            return std::nullopt;

        const auto toComponent = [] (const juce::var& component) -> std::optional<int>
        {
            const auto number = static_cast<double>(component);
            if (!std::isfinite(number) || number < 0.0
                || number > static_cast<double>(std::numeric_limits<int>::max())
                || std::floor(number) != number)
                return std::nullopt;

            return static_cast<int>(number);
        };

        const auto majorPart = toComponent(props["major"]);
        const auto minorPart = toComponent(props["minor"]);
        const auto patchPart = toComponent(props["patch"]);
        if (!majorPart.has_value() || !minorPart.has_value() || !patchPart.has_value())
            return std::nullopt;

        Tessera::SchemaVersion version;
        version.major = *majorPart;
        version.minor = *minorPart;
        version.patch = *patchPart;
        return version;
    }

    juce::var serializeCornerRadius(const Tessera::CornerRadius& radius)
    {
        if (const auto* scalar = std::get_if<float>(&radius))
            return juce::var(static_cast<double>(*scalar));

        juce::Array<juce::var> corners;
        for (const auto corner : std::get<std::array<float, 4>>(radius))
            corners.add(static_cast<double>(corner));

        return juce::var(corners);
    }

    juce::Result parseCornerRadius(const juce::var& value, Tessera::CornerRadius& outRadius)
    {
        if (isNumericVar(value))
        {
            outRadius = static_cast<float>(static_cast<double>(value));
            return juce::Result::ok();
        }

        const auto* array = value.getArray();
        if (array == nullptr || array->size() != 4)
            return juce::Result::fail("image.cornerRadius must be numeric or an array of 4 numbers");

        std::array<float, 4> corners {};
        for (int i = 0; i < 4; ++i)
        {
            const auto& corner = array->getReference(i);
            if (!isNumericVar(corner))
                return juce::Result::fail("image.cornerRadius entries must be numeric");

            corners[static_cast<size_t>(i)] = static_cast<float>(static_cast<double>(corner));
        }

        outRadius = corners;
        return juce::Result::ok();
    }

    juce::Result parseOptionalBoolProperty(const juce::NamedValueSet& props,
                                           const juce::Identifier& key,
                                           const juce::String& context,
                                           bool& outValue)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (!value.isBool())
            return juce::Result::fail(context + "." + key.toString() + " must be bool");

        outValue = static_cast<bool>(value);
        return juce::Result::ok();
    }

    juce::Result parseOptionalFloatProperty(const juce::NamedValueSet& props,
                                            const juce::Identifier& key,
                                            const juce::String& context,
                                            float& outValue)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (!isNumericVar(value))
            return juce::Result::fail(context + "." + key.toString() + " must be numeric");

        const auto parsed = static_cast<float>(static_cast<double>(value));
        if (!std::isfinite(parsed))
            return juce::Result::fail(context + "." + key.toString() + " must be finite");

        outValue = parsed;
        return juce::Result::ok();
    }

    juce::Result parseOptionalStringProperty(const juce::NamedValueSet& props,
                                             const juce::Identifier& key,
                                             const juce::String& context,
                                             juce::String& outValue)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (!value.isString())
            return juce::Result::fail(context + "." + key.toString() + " must be string");

        outValue = value.toString();
        return juce::Result::ok();
    }

    std::optional<Tessera::LayerType> resolveLayerType(const juce::NamedValueSet& props,
                                                       std::optional<Tessera::ShapeType>& legacyShapeType)
    {
        if (props.contains("type"))
        {
            const auto key = props["type"].toString().trim();
            if (key == "image") return Tessera::LayerType::image;
            if (key == "text") return Tessera::LayerType::text;
            if (key == "shape") return Tessera::LayerType::shape;

            legacyShapeType = Tessera::shapeTypeFromKey(key);
            if (legacyShapeType.has_value())
                return Tessera::LayerType::shape;

            return std::nullopt;
        }

        if (props.contains("text")) return Tessera::LayerType::text;
        if (props.contains("dataUrl")) return Tessera::LayerType::image;
        if (props.contains("shapeType")) return Tessera::LayerType::shape;
        return std::nullopt;
    }

    juce::Result parseImageContent(const juce::NamedValueSet& props, Tessera::ImageContent& outImage)
    {
        if (const auto result = parseOptionalStringProperty(props, "dataUrl", "image", outImage.source); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "width", "image", outImage.width); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "height", "image", outImage.height); result.failed())
            return result;

        if (props.contains("cornerRadius") && !props["cornerRadius"].isVoid())
        {
            Tessera::CornerRadius radius = 0.0f;
            const auto radiusResult = parseCornerRadius(props["cornerRadius"], radius);
            if (radiusResult.failed())
                return radiusResult;

            outImage.cornerRadius = radius;
        }

        return juce::Result::ok();
    }

    juce::Result parseTextContent(const juce::NamedValueSet& props, Tessera::TextContent& outText)
    {
        // Older saves stored the text colour as "color".
        if (!props.contains("fill"))
        {
            const auto legacyResult = parseOptionalStringProperty(props, "color", "text", outText.fill);
            if (legacyResult.failed())
                return legacyResult;
        }

        if (const auto result = parseOptionalStringProperty(props, "text", "text", outText.text); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "fontSize", "text", outText.fontSize); result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(props, "fontFamily", "text", outText.fontFamily); result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(props, "fill", "text", outText.fill); result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(props, "stroke", "text", outText.stroke); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "strokeWidth", "text", outText.strokeWidth); result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(props, "shadowColor", "text", outText.shadowColor); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "shadowBlur", "text", outText.shadowBlur); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "shadowOffsetX", "text", outText.shadowOffsetX); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "shadowOffsetY", "text", outText.shadowOffsetY); result.failed())
            return result;

        if (props.contains("fontStyle"))
        {
            const auto style = Tessera::fontStyleFromKey(props["fontStyle"].toString());
            if (!style.has_value())
                return juce::Result::fail("text.fontStyle is unknown: " + props["fontStyle"].toString());

            outText.fontStyle = *style;
        }

        return juce::Result::ok();
    }

    juce::Result parseShapeContent(const juce::NamedValueSet& props,
                                   std::optional<Tessera::ShapeType> legacyShapeType,
                                   Tessera::ShapeContent& outShape)
    {
        if (legacyShapeType.has_value())
            outShape.shapeType = *legacyShapeType;

        if (props.contains("shapeType"))
        {
            const auto shapeType = Tessera::shapeTypeFromKey(props["shapeType"].toString());
            if (!shapeType.has_value())
                return juce::Result::fail("shape.shapeType is unknown: " + props["shapeType"].toString());

            outShape.shapeType = *shapeType;
        }

        outShape.cornerRadius = outShape.shapeType == Tessera::ShapeType::rect ? 8.0f : 0.0f;

        if (const auto result = parseOptionalFloatProperty(props, "width", "shape", outShape.width); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "height", "shape", outShape.height); result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(props, "fill", "shape", outShape.fill); result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(props, "stroke", "shape", outShape.stroke); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "strokeWidth", "shape", outShape.strokeWidth); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "cornerRadius", "shape", outShape.cornerRadius); result.failed())
            return result;

        return juce::Result::ok();
    }

    juce::Result parseLayer(const juce::var& value, Tessera::LayerModel& outLayer)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail("layer must be object");

        const auto& props = object->getProperties();

        std::optional<Tessera::ShapeType> legacyShapeType;
        const auto type = resolveLayerType(props, legacyShapeType);
        if (!type.has_value())
            return juce::Result::fail("layer.type is missing or unknown");

        Tessera::LayerModel layer;
        juce::Result contentResult = juce::Result::ok();
        switch (*type)
        {
            case Tessera::LayerType::image:
            {
                Tessera::ImageContent image;
                contentResult = parseImageContent(props, image);
                layer.name = "Image";
                layer.content = std::move(image);
                break;
            }
            case Tessera::LayerType::text:
            {
                Tessera::TextContent text;
                contentResult = parseTextContent(props, text);
                layer.name = Tessera::Core::textLayerName(text.text);
                layer.content = std::move(text);
                break;
            }
            case Tessera::LayerType::shape:
            {
                Tessera::ShapeContent shape;
                contentResult = parseShapeContent(props, legacyShapeType, shape);
                layer.name = shape.shapeType == Tessera::ShapeType::rect ? "Rectangle" : "Ellipse";
                layer.content = std::move(shape);
                break;
            }
        }

        if (contentResult.failed())
            return contentResult;

        if (const auto result = parseOptionalStringProperty(props, "id", "layer", layer.id); result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(props, "name", "layer", layer.name); result.failed())
            return result;
        if (const auto result = parseOptionalBoolProperty(props, "visible", "layer", layer.visible); result.failed())
            return result;
        if (const auto result = parseOptionalBoolProperty(props, "locked", "layer", layer.locked); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "x", "layer", layer.x); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "y", "layer", layer.y); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "rotation", "layer", layer.rotation); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "scaleX", "layer", layer.scaleX); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "scaleY", "layer", layer.scaleY); result.failed())
            return result;
        if (const auto result = parseOptionalFloatProperty(props, "opacity", "layer", layer.opacity); result.failed())
            return result;

        outLayer = std::move(layer);
        return juce::Result::ok();
    }

    juce::Result parseLayerArray(const juce::Array<juce::var>& values, std::vector<Tessera::LayerModel>& outLayers)
    {
        outLayers.clear();
        outLayers.reserve(static_cast<size_t>(values.size()));
        for (const auto& value : values)
        {
            Tessera::LayerModel layer;
            const auto result = parseLayer(value, layer);
            if (result.failed())
                return result;

            outLayers.push_back(std::move(layer));
        }

        return juce::Result::ok();
    }

    juce::Result parsePage(const juce::var& value, Tessera::PageModel& outPage)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail("page must be object");

        const auto& props = object->getProperties();
        const auto* layersArray = props["layers"].getArray();
        if (layersArray == nullptr)
            return juce::Result::fail("page.layers must be array");

        Tessera::PageModel page;
        const auto idResult = parseOptionalStringProperty(props, "id", "page", page.id);
        if (idResult.failed())
            return idResult;

        const auto layersResult = parseLayerArray(*layersArray, page.layers);
        if (layersResult.failed())
            return layersResult;

        outPage = std::move(page);
        return juce::Result::ok();
    }

    juce::Result parsePageArray(const juce::Array<juce::var>& values, Tessera::PageList& outPages)
    {
        outPages.clear();
        outPages.reserve(static_cast<size_t>(values.size()));
        for (const auto& value : values)
        {
            Tessera::PageModel page;
            const auto result = parsePage(value, page);
            if (result.failed())
                return result;

            outPages.push_back(std::move(page));
        }

        return juce::Result::ok();
    }

    bool looksLikePageArray(const juce::Array<juce::var>& values)
    {
        if (values.isEmpty())
            return false;

        const auto* first = values.getReference(0).getDynamicObject();
        return first != nullptr && first->hasProperty("layers");
    }

    // Saves without ids (hand-written or very old) get fresh ones.
    void assignMissingIds(Tessera::PageList& pages)
    {
        auto takenIds = Tessera::Core::collectIds(pages);
        takenIds.erase(juce::String());

        for (auto& page : pages)
        {
            if (page.id.isEmpty())
                page.id = Tessera::Core::createUniqueId(takenIds);

            for (auto& layer : page.layers)
            {
                if (layer.id.isEmpty())
                    layer.id = Tessera::Core::createUniqueId(takenIds);
            }
        }
    }

    int parseCanvasDimension(const juce::NamedValueSet& props, const juce::Identifier& key, int fallback)
    {
        if (!props.contains(key) || !isNumericVar(props[key]))
            return fallback;

        const auto value = static_cast<double>(props[key]);
        if (!std::isfinite(value) || value < 1.0 || value > static_cast<double>(std::numeric_limits<int>::max()))
            return fallback;

        return static_cast<int>(value);
    }
}

namespace Tessera::Serialization
{
    juce::var serializeLayer(const LayerModel& layer)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", layer.id);
        object->setProperty("type", layerTypeToKey(getLayerType(layer)));
        object->setProperty("name", layer.name);
        object->setProperty("visible", layer.visible);
        object->setProperty("locked", layer.locked);
        object->setProperty("x", static_cast<double>(layer.x));
        object->setProperty("y", static_cast<double>(layer.y));
        object->setProperty("rotation", static_cast<double>(layer.rotation));
        object->setProperty("scaleX", static_cast<double>(layer.scaleX));
        object->setProperty("scaleY", static_cast<double>(layer.scaleY));
        object->setProperty("opacity", static_cast<double>(layer.opacity));

        std::visit([&object](const auto& content)
        {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, ImageContent>)
            {
                object->setProperty("dataUrl", content.source);
                object->setProperty("width", static_cast<double>(content.width));
                object->setProperty("height", static_cast<double>(content.height));
                if (content.cornerRadius.has_value())
                    object->setProperty("cornerRadius", serializeCornerRadius(*content.cornerRadius));
            }
            else if constexpr (std::is_same_v<T, TextContent>)
            {
                object->setProperty("text", content.text);
                object->setProperty("fontSize", static_cast<double>(content.fontSize));
                object->setProperty("fontFamily", content.fontFamily);
                object->setProperty("fontStyle", fontStyleToKey(content.fontStyle));
                object->setProperty("fill", content.fill);
                object->setProperty("stroke", content.stroke);
                object->setProperty("strokeWidth", static_cast<double>(content.strokeWidth));
                object->setProperty("shadowColor", content.shadowColor);
                object->setProperty("shadowBlur", static_cast<double>(content.shadowBlur));
                object->setProperty("shadowOffsetX", static_cast<double>(content.shadowOffsetX));
                object->setProperty("shadowOffsetY", static_cast<double>(content.shadowOffsetY));
            }
            else
            {
                object->setProperty("shapeType", shapeTypeToKey(content.shapeType));
                object->setProperty("width", static_cast<double>(content.width));
                object->setProperty("height", static_cast<double>(content.height));
                object->setProperty("fill", content.fill);
                object->setProperty("stroke", content.stroke);
                object->setProperty("strokeWidth", static_cast<double>(content.strokeWidth));
                object->setProperty("cornerRadius", static_cast<double>(content.cornerRadius));
            }
        }, layer.content);

        return juce::var(object.release());
    }

    juce::var serializePage(const PageModel& page)
    {
        juce::Array<juce::var> layerArray;
        for (const auto& layer : page.layers)
            layerArray.add(serializeLayer(layer));

        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", page.id);
        object->setProperty("layers", juce::var(layerArray));
        return juce::var(object.release());
    }

    juce::var serializeDocument(const DocumentModel& document)
    {
        juce::Array<juce::var> pageArray;
        for (const auto& page : document.pages)
            pageArray.add(serializePage(page));

        auto root = std::make_unique<juce::DynamicObject>();
        root->setProperty("version", serializeSchemaVersion(currentSchemaVersion()));
        root->setProperty("canvasWidth", document.canvasWidth);
        root->setProperty("canvasHeight", document.canvasHeight);
        root->setProperty("pages", juce::var(pageArray));
        return juce::var(root.release());
    }

    juce::Result serializeDocumentToJsonString(const DocumentModel& document, juce::String& jsonOut)
    {
        const auto pagesResult = Core::DocumentValidator::validatePages(document.pages);
        if (pagesResult.failed())
            return juce::Result::fail("Document validation failed: " + pagesResult.getErrorMessage());

        const auto canvasResult = Core::DocumentValidator::validateCanvasSize(document.canvasWidth, document.canvasHeight);
        if (canvasResult.failed())
            return canvasResult;

        jsonOut = juce::JSON::toString(serializeDocument(document), true);
        return juce::Result::ok();
    }

    juce::Result parseDocument(const juce::var& root,
                               LoadedDocument& documentOut,
                               int defaultCanvasWidth,
                               int defaultCanvasHeight)
    {
        LoadedDocument loaded;
        loaded.canvasWidth = defaultCanvasWidth;
        loaded.canvasHeight = defaultCanvasHeight;

        if (const auto* rootArray = root.getArray())
        {
            if (looksLikePageArray(*rootArray))
            {
                loaded.shape = DocumentShape::pageArray;
                const auto result = parsePageArray(*rootArray, loaded.pages);
                if (result.failed())
                    return result;
            }
            else
            {
                loaded.shape = DocumentShape::legacyLayerArray;
                PageModel page;
                const auto result = parseLayerArray(*rootArray, page.layers);
                if (result.failed())
                    return result;

                loaded.pages.push_back(std::move(page));
            }
        }
        else if (const auto* rootObject = root.getDynamicObject())
        {
            const auto& rootProps = rootObject->getProperties();
            if (rootProps.contains("version"))
            {
                const auto version = parseSchemaVersion(rootProps["version"]);
                if (!version.has_value())
                    return juce::Result::fail("Invalid version field");

                const auto versionCheck = Core::DocumentValidator::validateSchemaVersion(*version);
                if (versionCheck.failed())
                    return versionCheck;
            }

            const auto* pagesArray = rootProps["pages"].getArray();
            if (pagesArray == nullptr)
                return juce::Result::fail("Document requires a pages array");

            loaded.shape = DocumentShape::current;
            const auto result = parsePageArray(*pagesArray, loaded.pages);
            if (result.failed())
                return result;

            loaded.canvasWidth = parseCanvasDimension(rootProps, "canvasWidth", defaultCanvasWidth);
            loaded.canvasHeight = parseCanvasDimension(rootProps, "canvasHeight", defaultCanvasHeight);
        }
        else
        {
            return juce::Result::fail("Root must be object or array");
        }

        assignMissingIds(loaded.pages);

        const auto validation = Core::DocumentValidator::validatePages(loaded.pages);
        if (validation.failed())
            return juce::Result::fail("Document validation failed: " + validation.getErrorMessage());

        documentOut = std::move(loaded);
        return juce::Result::ok();
    }

    juce::Result parseDocumentFromJsonString(const juce::String& json,
                                             LoadedDocument& documentOut,
                                             int defaultCanvasWidth,
                                             int defaultCanvasHeight)
    {
        juce::var rootVar;
        const auto parseResult = juce::JSON::parse(json, rootVar);
        if (parseResult.failed())
            return juce::Result::fail("JSON parse error: " + parseResult.getErrorMessage());

        return parseDocument(rootVar, documentOut, defaultCanvasWidth, defaultCanvasHeight);
    }

    juce::Result saveDocumentToFile(const juce::File& file, const DocumentModel& document)
    {
        juce::String json;
        const auto serializeResult = serializeDocumentToJsonString(document, json);
        if (serializeResult.failed())
            return serializeResult;

        if (!file.replaceWithText(json))
            return juce::Result::fail("Failed to write JSON file: " + file.getFullPathName());

        return juce::Result::ok();
    }

    juce::Result loadDocumentFromFile(const juce::File& file,
                                      LoadedDocument& documentOut,
                                      int defaultCanvasWidth,
                                      int defaultCanvasHeight)
    {
        if (!file.existsAsFile())
            return juce::Result::fail("File not found: " + file.getFullPathName());

        return parseDocumentFromJsonString(file.loadFileAsString(), documentOut, defaultCanvasWidth, defaultCanvasHeight);
    }
}
