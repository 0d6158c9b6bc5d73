#include "Tessera/Core/Document.h"
#include "Tessera/Core/History.h"
#include "Tessera/Public/DocumentHandle.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <set>
#include <vector>

namespace
{
    bool nearlyEqual(float lhs, float rhs, float epsilon = 1.0e-4f)
    {
        return std::fabs(lhs - rhs) <= epsilon;
    }

    std::vector<juce::String> collectAllIds(const Tessera::DocumentModel& document)
    {
        std::vector<juce::String> ids;
        for (const auto& page : document.pages)
        {
            ids.push_back(page.id);
            for (const auto& layer : page.layers)
                ids.push_back(layer.id);
        }

        return ids;
    }

    bool idsAreUnique(const Tessera::DocumentModel& document)
    {
        const auto ids = collectAllIds(document);
        const std::set<juce::String> unique(ids.begin(), ids.end());
        return unique.size() == ids.size();
    }

    juce::Result checkActivePointers(const Tessera::DocumentHandle& document)
    {
        const auto& model = document.snapshot();
        if (model.pages.empty())
            return juce::Result::fail("document has no pages");
        if (model.activePageIndex < 0 || model.activePageIndex >= static_cast<int>(model.pages.size()))
            return juce::Result::fail("activePageIndex out of range: " + juce::String(model.activePageIndex));
        if (model.activeLayerId.has_value() && document.findLayer(*model.activeLayerId) == nullptr)
            return juce::Result::fail("activeLayerId not on active page");

        return juce::Result::ok();
    }

    Tessera::PageList makeMarkerPages(int marker)
    {
        Tessera::PageModel page;
        page.id = "page-" + juce::String(marker);
        return { page };
    }

    std::vector<Tessera::LayerId> layerIds(const Tessera::PageModel& page)
    {
        std::vector<Tessera::LayerId> ids;
        for (const auto& layer : page.layers)
            ids.push_back(layer.id);

        return ids;
    }

    juce::Result testLayerDefaults()
    {
        Tessera::DocumentHandle document;

        const auto textId = document.addTextLayer("Hello world, this is long");
        const auto* text = document.findLayer(textId);
        if (text == nullptr)
            return juce::Result::fail("addTextLayer failed");
        if (text->name != "Hello world, this is")
            return juce::Result::fail("text layer name must be the first 20 characters: " + text->name);
        if (!nearlyEqual(text->x, 100.0f) || !nearlyEqual(text->y, 100.0f))
            return juce::Result::fail("text layer must start at (100, 100)");

        const auto* textContent = std::get_if<Tessera::TextContent>(&text->content);
        if (textContent == nullptr || !nearlyEqual(textContent->fontSize, 48.0f)
            || textContent->fontFamily != "Inter" || textContent->fill != "#ffffff")
            return juce::Result::fail("text defaults mismatch");
        if (document.snapshot().activeLayerId != std::optional<Tessera::LayerId>(textId))
            return juce::Result::fail("new layer must become active");

        const auto emptyTextId = document.addTextLayer({});
        if (document.findLayer(emptyTextId) == nullptr || document.findLayer(emptyTextId)->name != "Text")
            return juce::Result::fail("empty text must be named Text");

        const auto ellipseId = document.addShapeLayer(Tessera::ShapeType::ellipse);
        const auto* ellipse = document.findLayer(ellipseId);
        const auto* ellipseContent = ellipse != nullptr ? std::get_if<Tessera::ShapeContent>(&ellipse->content) : nullptr;
        if (ellipseContent == nullptr || ellipse->name != "Ellipse")
            return juce::Result::fail("ellipse layer missing");
        if (!nearlyEqual(ellipseContent->width, 200.0f) || !nearlyEqual(ellipseContent->height, 150.0f)
            || !nearlyEqual(ellipseContent->cornerRadius, 0.0f) || ellipseContent->fill != "#3b82f6")
            return juce::Result::fail("ellipse defaults mismatch");

        const auto rectId = document.addShapeLayer(Tessera::ShapeType::rect);
        const auto* rect = document.findLayer(rectId);
        const auto* rectContent = rect != nullptr ? std::get_if<Tessera::ShapeContent>(&rect->content) : nullptr;
        if (rectContent == nullptr || rect->name != "Rectangle" || !nearlyEqual(rectContent->cornerRadius, 8.0f))
            return juce::Result::fail("rect defaults mismatch");

        const auto imageId = document.addImageLayer("data:image/png;base64,AAAA", 640.0f, 480.0f);
        const auto* image = document.findLayer(imageId);
        if (image == nullptr || image->name != "Image" || !nearlyEqual(image->x, 0.0f) || !nearlyEqual(image->y, 0.0f))
            return juce::Result::fail("image defaults mismatch");
        if (Tessera::getLayerType(*image) != Tessera::LayerType::image)
            return juce::Result::fail("image layer type mismatch");

        if (document.activePage().layers.size() != 5)
            return juce::Result::fail("expected 5 layers on the active page");

        return juce::Result::ok();
    }

    juce::Result testBasicEditUndoScenario()
    {
        Tessera::DocumentHandle document;
        if (document.pageCount() != 1 || !document.activePage().layers.empty())
            return juce::Result::fail("new document must start with one blank page");

        const auto id = document.addTextLayer("Hi");
        if (document.snapshot().pages[0].layers.size() != 1)
            return juce::Result::fail("addTextLayer did not add a layer");

        const auto before = document.snapshot().pages[0].layers[0];

        if (!document.undo())
            return juce::Result::fail("undo failed");
        if (!document.snapshot().pages[0].layers.empty())
            return juce::Result::fail("undo did not remove the layer");
        if (document.snapshot().activeLayerId.has_value())
            return juce::Result::fail("undo must drop an active layer that no longer exists");

        if (!document.redo())
            return juce::Result::fail("redo failed");
        if (document.snapshot().pages[0].layers.size() != 1)
            return juce::Result::fail("redo did not restore the layer");
        if (document.snapshot().pages[0].layers[0] != before || before.id != id)
            return juce::Result::fail("redo restored different layer content");

        return juce::Result::ok();
    }

    juce::Result testHistoryRoundTrip()
    {
        Tessera::DocumentHandle document;
        const auto textId = document.addTextLayer("Title");
        document.addShapeLayer(Tessera::ShapeType::rect);
        document.addPage();
        document.addShapeLayer(Tessera::ShapeType::ellipse);
        if (!document.setActivePage(0))
            return juce::Result::fail("setActivePage failed");
        if (!document.moveLayer(textId, Tessera::LayerMoveDirection::up))
            return juce::Result::fail("moveLayer failed");

        constexpr int mutationCount = 5;
        const auto expected = document.snapshot().pages;

        for (int i = 0; i < mutationCount; ++i)
        {
            if (!document.undo())
                return juce::Result::fail("undo " + juce::String(i) + " failed");
        }

        if (document.pageCount() != 1 || !document.snapshot().pages[0].layers.empty())
            return juce::Result::fail("undoing every mutation must return to the blank page");

        for (int i = 0; i < mutationCount; ++i)
        {
            if (!document.redo())
                return juce::Result::fail("redo " + juce::String(i) + " failed");
        }

        if (document.snapshot().pages != expected)
            return juce::Result::fail("undo N / redo N did not restore the same pages");
        if (document.canRedo())
            return juce::Result::fail("redo must be exhausted at the tip");

        return juce::Result::ok();
    }

    juce::Result testHistoryCap()
    {
        Tessera::Core::History history;
        for (int i = 0; i < 60; ++i)
            history.push(makeMarkerPages(i));

        if (history.size() != 50)
            return juce::Result::fail("history length must be capped at 50, got " + juce::String(static_cast<int>(history.size())));
        if (history.position() != 49)
            return juce::Result::fail("history index must point at the newest entry");
        if (history.getEntries().front().front().id != "page-10")
            return juce::Result::fail("the oldest 10 entries must be evicted");
        if (history.getEntries().back().front().id != "page-59")
            return juce::Result::fail("the newest entry must be retained at index 49");

        Tessera::DocumentHandle document;
        for (int i = 0; i < 60; ++i)
            document.pushHistory();

        if (document.historySize() != 50)
            return juce::Result::fail("document history must be capped at 50");

        return juce::Result::ok();
    }

    juce::Result testHistoryBranchTruncates()
    {
        Tessera::Core::History history;
        history.push(makeMarkerPages(0));
        history.push(makeMarkerPages(1));
        history.push(makeMarkerPages(2));

        const auto restored = history.undo(makeMarkerPages(3));
        if (!restored.has_value() || restored->front().id != "page-1")
            return juce::Result::fail("undo at the tip must step back past the appended live state");
        if (history.size() != 4 || !history.canRedo())
            return juce::Result::fail("undo at the tip must append the live state");

        history.push(makeMarkerPages(4));
        if (history.size() != 3 || history.canRedo())
            return juce::Result::fail("push must truncate the redo branch");
        if (history.getEntries().back().front().id != "page-4")
            return juce::Result::fail("push must append after the current index");

        return juce::Result::ok();
    }

    juce::Result testHistoryExhaustion()
    {
        Tessera::DocumentHandle document;
        if (document.canUndo() || document.canRedo())
            return juce::Result::fail("new document must have no history");
        if (document.undo() || document.redo())
            return juce::Result::fail("exhausted history must be a no-op");

        document.addTextLayer("Once");
        if (!document.undo())
            return juce::Result::fail("undo failed");
        if (!document.undo())
            return juce::Result::fail("undo at index 0 stays available");
        if (!document.snapshot().pages[0].layers.empty())
            return juce::Result::fail("repeated undo must stay at the oldest snapshot");

        return juce::Result::ok();
    }

    juce::Result testSnapshotIsolation()
    {
        Tessera::Core::History history;
        auto live = makeMarkerPages(0);
        history.push(live);

        live.front().id = "mutated";
        if (history.getEntries().front().front().id != "page-0")
            return juce::Result::fail("mutating live pages must not alter a stored snapshot");

        auto restored = history.undo(live);
        if (!restored.has_value())
            return juce::Result::fail("undo returned nothing");

        restored->front().id = "edited-after-restore";
        if (history.getEntries().front().front().id != "page-0")
            return juce::Result::fail("editing restored pages must not alter history");

        const auto redone = history.redo();
        if (!redone.has_value() || redone->front().id != "mutated")
            return juce::Result::fail("redo must return the live state captured by undo");

        return juce::Result::ok();
    }

    juce::Result testPageInvariant()
    {
        Tessera::DocumentHandle document;
        if (document.removePage(0))
            return juce::Result::fail("removing the last page must be refused");
        if (document.pageCount() != 1 || document.canUndo())
            return juce::Result::fail("refused removePage must not touch pages or history");

        if (document.removePage(5) || document.removePage(-1))
            return juce::Result::fail("invalid page index must be refused");

        return juce::Result::ok();
    }

    juce::Result testActivePointerValidity()
    {
        Tessera::DocumentHandle document;
        juce::Random random(20240611);

        for (int step = 0; step < 400; ++step)
        {
            const auto count = document.pageCount();
            switch (random.nextInt(9))
            {
                case 0: document.addPage(); break;
                case 1: document.removePage(random.nextInt(count + 1) - 1); break;
                case 2: document.reorderPages(random.nextInt(count), random.nextInt(count)); break;
                case 3: document.duplicatePage(random.nextInt(count)); break;
                case 4: document.setActivePage(random.nextInt(count + 2) - 1); break;
                case 5: document.addTextLayer("step " + juce::String(step)); break;
                case 6: document.undo(); break;
                case 7: document.redo(); break;
                default:
                {
                    const auto& layers = document.activePage().layers;
                    if (!layers.empty())
                        document.removeLayer(layers[static_cast<size_t>(random.nextInt(static_cast<int>(layers.size())))].id);
                    break;
                }
            }

            const auto check = checkActivePointers(document);
            if (check.failed())
                return juce::Result::fail("step " + juce::String(step) + ": " + check.getErrorMessage());
            if (!idsAreUnique(document.snapshot()))
                return juce::Result::fail("step " + juce::String(step) + ": duplicate ids");
        }

        return juce::Result::ok();
    }

    juce::Result testRemovePageAdjustsActive()
    {
        Tessera::DocumentHandle document;
        document.addPage();
        document.addPage();
        if (document.pageCount() != 3 || document.snapshot().activePageIndex != 2)
            return juce::Result::fail("addPage must append and activate");

        const auto activeId = document.activePage().id;
        if (!document.removePage(0))
            return juce::Result::fail("removePage(0) failed");
        if (document.snapshot().activePageIndex != 1 || document.activePage().id != activeId)
            return juce::Result::fail("removing an earlier page must shift the active index down");

        if (!document.removePage(1))
            return juce::Result::fail("removePage(active) failed");
        if (document.snapshot().activePageIndex != 0)
            return juce::Result::fail("removing the active page must prefer the previous index");

        return juce::Result::ok();
    }

    juce::Result testReorderPagesFollowsActive()
    {
        Tessera::DocumentHandle document;
        document.addPage();
        document.addPage();
        document.addPage();

        if (!document.setActivePage(1))
            return juce::Result::fail("setActivePage failed");

        const auto trackedId = document.activePage().id;
        const auto expectActive = [&document, &trackedId](int expectedIndex, const char* label) -> juce::Result
        {
            if (document.snapshot().activePageIndex != expectedIndex)
                return juce::Result::fail(juce::String(label) + ": active index "
                                          + juce::String(document.snapshot().activePageIndex));
            if (document.activePage().id != trackedId)
                return juce::Result::fail(juce::String(label) + ": active page changed identity");
            return juce::Result::ok();
        };

        if (!document.reorderPages(1, 3))
            return juce::Result::fail("reorderPages(1, 3) failed");
        if (const auto result = expectActive(3, "active page moved"); result.failed())
            return result;

        if (!document.reorderPages(0, 3))
            return juce::Result::fail("reorderPages(0, 3) failed");
        if (const auto result = expectActive(2, "page moved past active"); result.failed())
            return result;

        if (!document.reorderPages(3, 0))
            return juce::Result::fail("reorderPages(3, 0) failed");
        if (const auto result = expectActive(3, "page moved before active"); result.failed())
            return result;

        const auto historyBefore = document.historySize();
        if (document.reorderPages(2, 2) || document.reorderPages(0, 9))
            return juce::Result::fail("no-op reorder must be refused");
        if (document.historySize() != historyBefore)
            return juce::Result::fail("refused reorder must not snapshot");

        return juce::Result::ok();
    }

    juce::Result testPageDuplication()
    {
        Tessera::DocumentHandle document;
        document.addTextLayer("Headline");
        document.addShapeLayer(Tessera::ShapeType::rect);
        document.addImageLayer("asset://photo", 320.0f, 200.0f);

        const auto source = document.snapshot().pages[0];
        if (!document.duplicatePage(0))
            return juce::Result::fail("duplicatePage failed");

        const auto& model = document.snapshot();
        if (model.pages.size() != 2 || model.activePageIndex != 1)
            return juce::Result::fail("duplicate must be inserted after the source and become active");

        const auto& copy = model.pages[1];
        if (copy.id == source.id)
            return juce::Result::fail("duplicate page must get a fresh id");
        if (copy.layers.size() != 3)
            return juce::Result::fail("duplicate must keep all 3 layers");

        for (size_t i = 0; i < copy.layers.size(); ++i)
        {
            for (const auto& original : source.layers)
            {
                if (copy.layers[i].id == original.id)
                    return juce::Result::fail("duplicate layer reused an id");
            }

            if (!Tessera::sameLayerContent(copy.layers[i], source.layers[i]))
                return juce::Result::fail("duplicate layer content differs at index " + juce::String(static_cast<int>(i)));
        }

        if (model.pages[0] != source)
            return juce::Result::fail("source page must be untouched");

        return juce::Result::ok();
    }

    juce::Result testIdUniqueness()
    {
        Tessera::DocumentHandle document;
        for (int round = 0; round < 5; ++round)
        {
            document.addTextLayer("Text " + juce::String(round));
            document.addShapeLayer(Tessera::ShapeType::ellipse);
            if (!document.duplicatePage(document.snapshot().activePageIndex))
                return juce::Result::fail("duplicatePage failed");
        }

        if (!idsAreUnique(document.snapshot()))
            return juce::Result::fail("ids must be unique across the document");

        Tessera::Core::IdSet taken;
        const auto first = Tessera::Core::createUniqueId(taken);
        const auto second = Tessera::Core::createUniqueId(taken);
        if (first == second || taken.size() != 2)
            return juce::Result::fail("createUniqueId must never repeat");

        return juce::Result::ok();
    }

    juce::Result testLayerOrdering()
    {
        Tessera::DocumentHandle document;
        const auto a = document.addShapeLayer(Tessera::ShapeType::rect);
        const auto b = document.addShapeLayer(Tessera::ShapeType::ellipse);
        const auto c = document.addTextLayer("c");

        const auto historyBefore = document.historySize();
        if (document.moveLayer(c, Tessera::LayerMoveDirection::up))
            return juce::Result::fail("moving the top layer up must be refused");
        if (document.moveLayer(a, Tessera::LayerMoveDirection::down))
            return juce::Result::fail("moving the bottom layer down must be refused");
        if (document.moveLayer("missing", Tessera::LayerMoveDirection::up))
            return juce::Result::fail("moving an unknown layer must be refused");
        if (document.historySize() != historyBefore)
            return juce::Result::fail("refused moves must not snapshot");

        if (!document.moveLayer(a, Tessera::LayerMoveDirection::up))
            return juce::Result::fail("moveLayer up failed");
        if (layerIds(document.activePage()) != std::vector<Tessera::LayerId> { b, a, c })
            return juce::Result::fail("moveLayer up must swap toward the top");

        if (!document.moveLayer(a, Tessera::LayerMoveDirection::down))
            return juce::Result::fail("moveLayer down failed");
        if (layerIds(document.activePage()) != std::vector<Tessera::LayerId> { a, b, c })
            return juce::Result::fail("moveLayer down must swap toward the bottom");

        if (!document.reorderLayers(0, 2))
            return juce::Result::fail("reorderLayers failed");
        if (layerIds(document.activePage()) != std::vector<Tessera::LayerId> { b, c, a })
            return juce::Result::fail("reorderLayers must remove and reinsert");

        if (document.reorderLayers(1, 1) || document.reorderLayers(0, 5) || document.reorderLayers(-1, 0))
            return juce::Result::fail("invalid reorderLayers must be refused");

        return juce::Result::ok();
    }

    juce::Result testRemoveLayer()
    {
        Tessera::DocumentHandle document;
        const auto keep = document.addShapeLayer(Tessera::ShapeType::rect);
        const auto removed = document.addTextLayer("bye");

        const auto historyBefore = document.historySize();
        if (document.removeLayer("not-a-layer") || document.historySize() != historyBefore)
            return juce::Result::fail("removing an unknown layer must be a silent no-op");

        if (!document.removeLayer(removed))
            return juce::Result::fail("removeLayer failed");
        if (document.snapshot().activeLayerId.has_value())
            return juce::Result::fail("removing the active layer must clear it");
        if (document.findLayer(removed) != nullptr || document.findLayer(keep) == nullptr)
            return juce::Result::fail("removeLayer removed the wrong layer");

        return juce::Result::ok();
    }

    juce::Result testPatchValidation()
    {
        Tessera::DocumentHandle document;
        const auto textId = document.addTextLayer("Patch me");
        const auto before = *document.findLayer(textId);

        Tessera::LayerPatch badOpacity;
        badOpacity.x = 50.0f;
        badOpacity.opacity = 1.5f;
        if (document.updateLayer(textId, badOpacity))
            return juce::Result::fail("opacity outside [0, 1] must be rejected");

        Tessera::LayerPatch nanPosition;
        nanPosition.y = std::numeric_limits<float>::quiet_NaN();
        if (document.updateLayer(textId, nanPosition))
            return juce::Result::fail("non-finite position must be rejected");

        Tessera::LayerPatch zeroFont;
        zeroFont.fontSize = 0.0f;
        if (document.updateLayer(textId, zeroFont))
            return juce::Result::fail("non-positive fontSize must be rejected");

        Tessera::LayerPatch negativeWidth;
        negativeWidth.width = -5.0f;
        if (document.updateLayer(textId, negativeWidth))
            return juce::Result::fail("negative width must be rejected");

        if (*document.findLayer(textId) != before)
            return juce::Result::fail("rejected patches must leave the layer unchanged");

        Tessera::LayerPatch mixed;
        mixed.x = 12.0f;
        mixed.width = 999.0f; // not a text field
        mixed.fill = "#ff0000";
        if (!document.updateLayer(textId, mixed))
            return juce::Result::fail("valid patch rejected");

        const auto* updated = document.findLayer(textId);
        const auto* content = std::get_if<Tessera::TextContent>(&updated->content);
        if (!nearlyEqual(updated->x, 12.0f) || content == nullptr || content->fill != "#ff0000")
            return juce::Result::fail("patch fields were not merged");

        const auto ellipseId = document.addShapeLayer(Tessera::ShapeType::ellipse);
        Tessera::LayerPatch radius;
        radius.cornerRadius = 20.0f;
        if (!document.updateLayer(ellipseId, radius))
            return juce::Result::fail("cornerRadius patch rejected");

        const auto* ellipse = std::get_if<Tessera::ShapeContent>(&document.findLayer(ellipseId)->content);
        if (ellipse == nullptr || !nearlyEqual(ellipse->cornerRadius, 0.0f))
            return juce::Result::fail("cornerRadius must only apply to rects");

        const auto historyBefore = document.historySize();
        Tessera::LayerPatch move;
        move.x = 1.0f;
        if (document.updateLayer("unknown", move) || document.historySize() != historyBefore)
            return juce::Result::fail("updateLayer on an unknown id must be a silent no-op");

        return juce::Result::ok();
    }

    juce::Result testActivePointers()
    {
        Tessera::DocumentHandle document;
        const auto firstPageLayer = document.addTextLayer("first");
        document.addPage();

        if (document.setActiveLayer(firstPageLayer))
            return juce::Result::fail("a layer from another page cannot become active");
        if (document.setActivePage(7))
            return juce::Result::fail("invalid page index must be refused");

        if (!document.setActivePage(0) || !document.setActiveLayer(firstPageLayer))
            return juce::Result::fail("activating the first page layer failed");
        if (!document.setActivePage(1) || document.snapshot().activeLayerId.has_value())
            return juce::Result::fail("changing page must clear the active layer");

        if (document.findLayerAnywhere(firstPageLayer) == nullptr)
            return juce::Result::fail("findLayerAnywhere must search every page");

        document.setActiveTool(Tessera::ToolKind::ellipse);
        if (document.snapshot().activeTool != Tessera::ToolKind::ellipse)
            return juce::Result::fail("setActiveTool failed");

        return juce::Result::ok();
    }

    juce::Result testCanvasSizeAndReset()
    {
        Tessera::DocumentHandle document;
        const auto imageId = document.addImageLayer("asset://wide", 1280.0f, 720.0f);

        if (document.setCanvasSize(0, 100) || document.setCanvasSize(100, -1))
            return juce::Result::fail("non-positive canvas size must be refused");
        if (!document.setCanvasSize(1080, 1080))
            return juce::Result::fail("setCanvasSize failed");

        const auto* image = std::get_if<Tessera::ImageContent>(&document.findLayer(imageId)->content);
        if (image == nullptr || !nearlyEqual(image->width, 1280.0f))
            return juce::Result::fail("setCanvasSize must not touch layer geometry");

        document.setActiveTool(Tessera::ToolKind::text);
        document.reset();

        const auto& model = document.snapshot();
        if (model.pages.size() != 1 || model.pages[0].layers.size() != 1)
            return juce::Result::fail("reset must leave one page with a background layer");

        const auto& background = model.pages[0].layers[0];
        const auto* shape = std::get_if<Tessera::ShapeContent>(&background.content);
        if (background.name != "Background Layer" || !background.locked || shape == nullptr
            || shape->fill != "#ffffff" || !nearlyEqual(shape->width, 1280.0f) || !nearlyEqual(shape->height, 720.0f))
            return juce::Result::fail("background layer defaults mismatch");

        if (model.activeTool != Tessera::ToolKind::select || model.activeLayerId.has_value())
            return juce::Result::fail("reset must restore the select tool and clear the active layer");
        if (document.canUndo() || document.canRedo())
            return juce::Result::fail("reset must empty the history");

        return juce::Result::ok();
    }

    juce::Result testDirtyTracking()
    {
        Tessera::DocumentHandle document;
        if (document.hasUnsavedChanges())
            return juce::Result::fail("new document must be clean");

        const auto id = document.addTextLayer("dirty");
        if (!document.hasUnsavedChanges())
            return juce::Result::fail("adding a layer must mark the document dirty");

        document.markSaved();
        if (document.hasUnsavedChanges())
            return juce::Result::fail("markSaved must clear the dirty state");

        Tessera::LayerPatch fade;
        fade.opacity = 0.5f;
        if (!document.updateLayer(id, fade) || !document.hasUnsavedChanges())
            return juce::Result::fail("updateLayer must mark the document dirty");

        Tessera::LayerPatch restore;
        restore.opacity = 1.0f;
        if (!document.updateLayer(id, restore) || document.hasUnsavedChanges())
            return juce::Result::fail("returning to the saved content must be clean");

        return juce::Result::ok();
    }

    juce::Result testLoadDocument()
    {
        Tessera::DocumentHandle document;
        document.addTextLayer("existing");

        Tessera::Core::IdSet ids;
        auto page = Tessera::Core::makeBackgroundPage(ids, 800, 600);
        auto duplicate = page;

        if (document.loadDocument({ page, duplicate }, 800, 600).wasOk())
            return juce::Result::fail("duplicate ids must be rejected");
        if (document.loadDocument({}, 800, 600).wasOk())
            return juce::Result::fail("an empty page list must be rejected");
        if (document.activePage().layers.size() != 1)
            return juce::Result::fail("rejected load must leave the document unchanged");

        auto second = Tessera::Core::makeBlankPage(ids);
        const auto result = document.loadDocument({ page, second }, 800, 600);
        if (result.failed())
            return juce::Result::fail("loadDocument failed: " + result.getErrorMessage());

        const auto& model = document.snapshot();
        if (model.pages.size() != 2 || model.canvasWidth != 800 || model.canvasHeight != 600 || model.activePageIndex != 0)
            return juce::Result::fail("loaded document state mismatch");
        if (document.canUndo() || document.hasUnsavedChanges())
            return juce::Result::fail("loading must clear history and start clean");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Layer defaults", testLayerDefaults },
        { "Basic edit/undo scenario", testBasicEditUndoScenario },
        { "History round-trip", testHistoryRoundTrip },
        { "History cap", testHistoryCap },
        { "History branch truncation", testHistoryBranchTruncates },
        { "History exhaustion", testHistoryExhaustion },
        { "Snapshot isolation", testSnapshotIsolation },
        { "Page invariant", testPageInvariant },
        { "Active pointer validity", testActivePointerValidity },
        { "Remove page adjusts active", testRemovePageAdjustsActive },
        { "Reorder pages follows active", testReorderPagesFollowsActive },
        { "Page duplication", testPageDuplication },
        { "Id uniqueness", testIdUniqueness },
        { "Layer ordering", testLayerOrdering },
        { "Remove layer", testRemoveLayer },
        { "Patch validation", testPatchValidation },
        { "Active pointers", testActivePointers },
        { "Canvas size and reset", testCanvasSizeAndReset },
        { "Dirty tracking", testDirtyTracking },
        { "Load document", testLoadDocument }
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

    std::cout << "Tessera core smoke passed." << std::endl;
    return 0;
}
