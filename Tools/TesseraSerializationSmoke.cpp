#include "Tessera/Config/EditorSettings.h"
#include "Tessera/Public/DocumentHandle.h"
#include "Tessera/Serialization/DocumentJson.h"

#include <cmath>
#include <functional>
#include <iostream>
#include <set>
#include <vector>

namespace
{
    bool nearlyEqual(float lhs, float rhs, float epsilon = 1.0e-4f)
    {
        return std::fabs(lhs - rhs) <= epsilon;
    }

    juce::File makeTempFile(const juce::String& suffix)
    {
        return juce::File::getSpecialLocation(juce::File::tempDirectory)
            .getNonexistentChildFile("tessera-smoke", suffix, false);
    }

    juce::Result buildSampleDocument(Tessera::DocumentHandle& document)
    {
        const auto textId = document.addTextLayer("Quarterly report");
        Tessera::LayerPatch textPatch;
        textPatch.fontStyle = Tessera::FontStyle::boldItalic;
        textPatch.shadowBlur = 6.0f;
        textPatch.shadowOffsetX = 2.0f;
        textPatch.rotation = 15.0f;
        if (!document.updateLayer(textId, textPatch))
            return juce::Result::fail("text patch failed");

        const auto imageId = document.addImageLayer("data:image/png;base64,iVBORw0KGgo=", 320.0f, 240.0f);
        Tessera::LayerPatch imagePatch;
        imagePatch.imageCornerRadius = Tessera::CornerRadius { std::array<float, 4> { 1.0f, 2.0f, 3.0f, 4.0f } };
        imagePatch.opacity = 0.75f;
        imagePatch.visible = false;
        if (!document.updateLayer(imageId, imagePatch))
            return juce::Result::fail("image patch failed");

        if (!document.addPage())
            return juce::Result::fail("addPage failed");

        const auto ellipseId = document.addShapeLayer(Tessera::ShapeType::ellipse);
        Tessera::LayerPatch shapePatch;
        shapePatch.stroke = "#000000";
        shapePatch.scaleX = 1.25f;
        if (!document.updateLayer(ellipseId, shapePatch))
            return juce::Result::fail("shape patch failed");

        if (!document.setCanvasSize(1080, 1350))
            return juce::Result::fail("setCanvasSize failed");

        return juce::Result::ok();
    }

    juce::Result testJsonRoundTrip()
    {
        Tessera::DocumentHandle document;
        if (const auto built = buildSampleDocument(document); built.failed())
            return built;

        juce::String json;
        const auto writeResult = Tessera::Serialization::serializeDocumentToJsonString(document.snapshot(), json);
        if (writeResult.failed())
            return writeResult;

        Tessera::Serialization::LoadedDocument loaded;
        const auto readResult = Tessera::Serialization::parseDocumentFromJsonString(json, loaded);
        if (readResult.failed())
            return juce::Result::fail("reparse failed: " + readResult.getErrorMessage());

        if (loaded.shape != Tessera::Serialization::DocumentShape::current)
            return juce::Result::fail("saved documents must parse as the current format");
        if (loaded.canvasWidth != 1080 || loaded.canvasHeight != 1350)
            return juce::Result::fail("canvas size was not preserved");
        if (loaded.pages != document.snapshot().pages)
            return juce::Result::fail("pages changed across a save and load");

        const auto root = juce::JSON::parse(json);
        const auto* version = root.getProperty("version", {}).getDynamicObject();
        if (version == nullptr || static_cast<int>(version->getProperty("major")) != 1)
            return juce::Result::fail("saved documents must carry the schema version");

        return juce::Result::ok();
    }

    juce::Result testLegacyLayerArray()
    {
        const juce::String json = R"([
            { "type": "text", "text": "Old title", "color": "#ff0000", "x": 10, "y": 20 },
            { "type": "rect", "width": 50, "height": 60 },
            { "type": "ellipse" },
            { "dataUrl": "data:image/png;base64,AA", "width": 10, "height": 10 }
        ])";

        Tessera::Serialization::LoadedDocument loaded;
        const auto result = Tessera::Serialization::parseDocumentFromJsonString(json, loaded, 1000, 500);
        if (result.failed())
            return juce::Result::fail("legacy parse failed: " + result.getErrorMessage());

        if (loaded.shape != Tessera::Serialization::DocumentShape::legacyLayerArray)
            return juce::Result::fail("flat layer arrays must be detected");
        if (loaded.canvasWidth != 1000 || loaded.canvasHeight != 500)
            return juce::Result::fail("legacy documents must take the default canvas size");
        if (loaded.pages.size() != 1 || loaded.pages[0].layers.size() != 4)
            return juce::Result::fail("legacy layers must load into a single page");

        const auto& layers = loaded.pages[0].layers;
        const auto* text = std::get_if<Tessera::TextContent>(&layers[0].content);
        if (text == nullptr || text->fill != "#ff0000" || layers[0].name != "Old title" || !nearlyEqual(layers[0].y, 20.0f))
            return juce::Result::fail("legacy text colour must map to fill");

        const auto* rect = std::get_if<Tessera::ShapeContent>(&layers[1].content);
        if (rect == nullptr || rect->shapeType != Tessera::ShapeType::rect || layers[1].name != "Rectangle"
            || !nearlyEqual(rect->width, 50.0f) || !nearlyEqual(rect->cornerRadius, 8.0f))
            return juce::Result::fail("legacy rect type must load as a rect shape");

        const auto* ellipse = std::get_if<Tessera::ShapeContent>(&layers[2].content);
        if (ellipse == nullptr || ellipse->shapeType != Tessera::ShapeType::ellipse || !nearlyEqual(ellipse->width, 200.0f))
            return juce::Result::fail("legacy ellipse type must load with shape defaults");

        if (Tessera::getLayerType(layers[3]) != Tessera::LayerType::image)
            return juce::Result::fail("untyped layer with dataUrl must load as an image");

        std::set<juce::String> ids { loaded.pages[0].id };
        for (const auto& layer : layers)
            ids.insert(layer.id);

        if (ids.size() != 5 || ids.count(juce::String()) != 0)
            return juce::Result::fail("missing ids must be assigned and unique");

        return juce::Result::ok();
    }

    juce::Result testPageArray()
    {
        const juce::String json = R"([
            { "id": "cover", "layers": [ { "id": "logo", "type": "shape", "shapeType": "ellipse", "opacity": 0.5 } ] },
            { "layers": [] }
        ])";

        Tessera::Serialization::LoadedDocument loaded;
        const auto result = Tessera::Serialization::parseDocumentFromJsonString(json, loaded);
        if (result.failed())
            return juce::Result::fail("page array parse failed: " + result.getErrorMessage());

        if (loaded.shape != Tessera::Serialization::DocumentShape::pageArray || loaded.pages.size() != 2)
            return juce::Result::fail("page arrays must be detected");
        if (loaded.pages[0].id != "cover" || loaded.pages[0].layers[0].id != "logo")
            return juce::Result::fail("stored ids must be kept");
        if (loaded.pages[1].id.isEmpty() || loaded.pages[1].id == "cover")
            return juce::Result::fail("pages without ids must get a fresh one");
        if (!nearlyEqual(loaded.pages[0].layers[0].opacity, 0.5f))
            return juce::Result::fail("layer opacity was not read");
        if (loaded.canvasWidth != Tessera::kDefaultCanvasWidth)
            return juce::Result::fail("page arrays must take the default canvas size");

        return juce::Result::ok();
    }

    juce::Result testInvalidDocumentsRejected()
    {
        const std::vector<std::pair<const char*, juce::String>> cases =
        {
            { "malformed JSON", "{ oops" },
            { "scalar root", "42" },
            { "no pages", R"({ "pages": [] })" },
            { "missing pages", R"({ "canvasWidth": 800 })" },
            { "duplicate ids", R"([ { "id": "same", "layers": [ { "id": "same", "type": "text", "text": "x" } ] } ])" },
            { "unknown type", R"([ { "type": "video" } ])" },
            { "opacity out of range", R"([ { "type": "text", "text": "x", "opacity": 3 } ])" },
            { "non-numeric position", R"([ { "type": "text", "text": "x", "x": "left" } ])" },
            { "unknown shape type", R"([ { "type": "shape", "shapeType": "star" } ])" },
            { "newer minor version", R"({ "version": { "major": 1, "minor": 5, "patch": 0 }, "pages": [ { "layers": [] } ] })" },
            { "other major version", R"({ "version": { "major": 2, "minor": 0, "patch": 0 }, "pages": [ { "layers": [] } ] })" },
            { "malformed version", R"({ "version": "1.0.0", "pages": [ { "layers": [] } ] })" },
            { "oversized version", R"({ "version": { "major": 1e300, "minor": 0, "patch": 0 }, "pages": [ { "layers": [] } ] })" },
            { "fractional version", R"({ "version": { "major": 1, "minor": 0.5, "patch": 0 }, "pages": [ { "layers": [] } ] })" },
            { "negative version", R"({ "version": { "major": 1, "minor": 0, "patch": -1 }, "pages": [ { "layers": [] } ] })" }
        };

        for (const auto& [label, json] : cases)
        {
            Tessera::Serialization::LoadedDocument loaded;
            if (Tessera::Serialization::parseDocumentFromJsonString(json, loaded).wasOk())
                return juce::Result::fail(juce::String("accepted invalid document: ") + label);
        }

        Tessera::Serialization::LoadedDocument loaded;
        const auto current = R"({ "version": { "major": 1, "minor": 0, "patch": 0 }, "canvasWidth": 800, "canvasHeight": 0, "pages": [ { "layers": [] } ] })";
        if (Tessera::Serialization::parseDocumentFromJsonString(current, loaded).failed())
            return juce::Result::fail("current version must be accepted");
        if (loaded.canvasWidth != 800 || loaded.canvasHeight != Tessera::kDefaultCanvasHeight)
            return juce::Result::fail("invalid canvas dimensions must fall back to the default");

        Tessera::Serialization::LoadedDocument oversized;
        const auto huge = R"({ "canvasWidth": 1e12, "canvasHeight": 720, "pages": [ { "layers": [] } ] })";
        if (Tessera::Serialization::parseDocumentFromJsonString(huge, oversized, 1000, 500).failed())
            return juce::Result::fail("oversized canvas width must not reject the document");
        if (oversized.canvasWidth != 1000 || oversized.canvasHeight != 720)
            return juce::Result::fail("out-of-range canvas width must fall back to the default");

        Tessera::DocumentModel empty;
        juce::String json;
        if (Tessera::Serialization::serializeDocumentToJsonString(empty, json).wasOk())
            return juce::Result::fail("a document without pages must not be written");

        return juce::Result::ok();
    }

    juce::Result testFileSaveLoad()
    {
        Tessera::DocumentHandle document;
        if (const auto built = buildSampleDocument(document); built.failed())
            return built;

        const auto file = makeTempFile(".json");
        const auto saveResult = document.saveToFile(file);
        if (saveResult.failed())
            return juce::Result::fail("save failed: " + saveResult.getErrorMessage());
        if (document.hasUnsavedChanges())
            return juce::Result::fail("saving must mark the document clean");

        Tessera::DocumentHandle reloaded;
        reloaded.addTextLayer("discarded");
        const auto loadResult = reloaded.loadFromFile(file);
        file.deleteFile();

        if (loadResult.failed())
            return juce::Result::fail("load failed: " + loadResult.getErrorMessage());
        if (reloaded.snapshot().pages != document.snapshot().pages)
            return juce::Result::fail("file round trip changed the pages");
        if (reloaded.snapshot().canvasWidth != 1080 || reloaded.snapshot().canvasHeight != 1350)
            return juce::Result::fail("file round trip changed the canvas size");
        if (reloaded.canUndo() || reloaded.hasUnsavedChanges() || reloaded.snapshot().activePageIndex != 0)
            return juce::Result::fail("a loaded document must start clean on its first page");

        const auto before = reloaded.snapshot().pages;
        if (reloaded.loadFromFile(makeTempFile(".json")).wasOk())
            return juce::Result::fail("loading a missing file must fail");
        if (reloaded.snapshot().pages != before)
            return juce::Result::fail("a failed load must leave the document untouched");

        return juce::Result::ok();
    }

    juce::Result testLegacyMigration()
    {
        const auto input = makeTempFile(".json");
        const auto output = makeTempFile(".json");
        const juce::String legacy = R"([
            { "id": "title", "type": "text", "text": "Old title", "color": "#00ff00" },
            { "id": "box", "type": "rect", "x": 40, "y": 50 }
        ])";
        if (!input.replaceWithText(legacy))
            return juce::Result::fail("could not write legacy input");

        Tessera::DocumentHandle document;
        const auto loadResult = document.loadFromFile(input);
        const auto saveResult = loadResult.wasOk() ? document.saveToFile(output) : loadResult;
        input.deleteFile();

        Tessera::Serialization::LoadedDocument migrated;
        const auto reloadResult = saveResult.wasOk()
            ? Tessera::Serialization::loadDocumentFromFile(output, migrated)
            : saveResult;
        output.deleteFile();

        if (reloadResult.failed())
            return juce::Result::fail("migration failed: " + reloadResult.getErrorMessage());
        if (migrated.shape != Tessera::Serialization::DocumentShape::current)
            return juce::Result::fail("migrated output must use the current format");
        if (migrated.pages != document.snapshot().pages || migrated.pages.size() != 1 || migrated.pages[0].layers.size() != 2)
            return juce::Result::fail("migration changed the layers");

        const auto* text = std::get_if<Tessera::TextContent>(&migrated.pages[0].layers[0].content);
        if (text == nullptr || text->fill != "#00ff00" || migrated.pages[0].layers[0].id != "title")
            return juce::Result::fail("migrated text must keep its id and carry the colour as fill");

        const auto* shape = std::get_if<Tessera::ShapeContent>(&migrated.pages[0].layers[1].content);
        if (shape == nullptr || shape->shapeType != Tessera::ShapeType::rect || !nearlyEqual(migrated.pages[0].layers[1].x, 40.0f))
            return juce::Result::fail("migrated rect must load as a rect shape");

        return juce::Result::ok();
    }

    juce::Result testSettingsProperties()
    {
        Tessera::EditorSettings custom;
        custom.historyLimit = 20;
        custom.historyDebounceMs = 250;
        custom.snapEnabled = false;
        custom.snapThreshold = 4.0f;
        custom.canvasDefaultWidth = 1920;
        custom.canvasDefaultHeight = 1080;

        juce::PropertySet properties;
        Tessera::Config::storeEditorSettings(custom, properties);
        const auto restored = Tessera::Config::loadEditorSettings(properties);
        if (restored.historyLimit != 20 || restored.historyDebounceMs != 250 || restored.snapEnabled
            || !nearlyEqual(restored.snapThreshold, 4.0f) || restored.canvasDefaultWidth != 1920)
            return juce::Result::fail("settings changed across a property set");

        juce::PropertySet broken;
        broken.setValue("history.limit", 0);
        broken.setValue("snap.threshold", -3.0);
        broken.setValue("canvas.defaultHeight", -720);
        const auto fallback = Tessera::Config::loadEditorSettings(broken);
        const Tessera::EditorSettings defaults;
        if (fallback.historyLimit != defaults.historyLimit || !nearlyEqual(fallback.snapThreshold, defaults.snapThreshold)
            || fallback.canvasDefaultHeight != defaults.canvasDefaultHeight)
            return juce::Result::fail("out-of-range settings must fall back to defaults");

        return juce::Result::ok();
    }

    juce::Result testSettingsFile()
    {
        const auto missing = makeTempFile(".settings");
        Tessera::EditorSettings loaded;
        loaded.historyLimit = 3;
        if (Tessera::Config::loadEditorSettingsFromFile(missing, loaded).failed() || loaded.historyLimit != 50)
            return juce::Result::fail("a missing settings file must yield defaults");

        Tessera::EditorSettings custom;
        custom.historyLimit = 5;
        custom.canvasDefaultWidth = 640;
        custom.canvasDefaultHeight = 480;

        const auto file = makeTempFile(".settings");
        const auto saveResult = Tessera::Config::saveEditorSettingsToFile(file, custom);
        if (saveResult.failed())
            return saveResult;

        Tessera::EditorSettings reread;
        const auto loadResult = Tessera::Config::loadEditorSettingsFromFile(file, reread);
        file.deleteFile();
        if (loadResult.failed())
            return loadResult;
        if (reread.historyLimit != 5 || reread.canvasDefaultWidth != 640 || reread.canvasDefaultHeight != 480)
            return juce::Result::fail("settings changed across a file");

        Tessera::DocumentHandle document(reread);
        document.reset();
        for (int i = 0; i < 10; ++i)
            document.pushHistory();

        if (document.historySize() != 5 || document.snapshot().canvasWidth != 640)
            return juce::Result::fail("document must honour the loaded settings");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "JSON round trip", testJsonRoundTrip },
        { "Legacy layer array", testLegacyLayerArray },
        { "Page array", testPageArray },
        { "Invalid documents rejected", testInvalidDocumentsRejected },
        { "File save/load", testFileSaveLoad },
        { "Legacy migration", testLegacyMigration },
        { "Settings properties", testSettingsProperties },
        { "Settings file", testSettingsFile }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Tessera serialization smoke passed." << std::endl;
    return 0;
}
