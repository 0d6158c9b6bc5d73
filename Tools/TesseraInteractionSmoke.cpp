#include "Tessera/Editor/Interaction/HistoryDebouncer.h"
#include "Tessera/Editor/Interaction/SnapEngine.h"
#include "Tessera/Editor/Interaction/ToolStateMachine.h"
#include "Tessera/Editor/Interaction/TransformSession.h"

#include <cmath>
#include <functional>
#include <iostream>
#include <vector>

namespace
{
    using namespace Tessera::Ui::Interaction;

    constexpr float kCanvasWidth = 1280.0f;
    constexpr float kCanvasHeight = 720.0f;

    bool nearlyEqual(float lhs, float rhs, float epsilon = 1.0e-4f)
    {
        return std::fabs(lhs - rhs) <= epsilon;
    }

    bool nearlyEqualRect(const juce::Rectangle<float>& lhs, const juce::Rectangle<float>& rhs, float epsilon = 1.0e-3f)
    {
        return nearlyEqual(lhs.getX(), rhs.getX(), epsilon)
            && nearlyEqual(lhs.getY(), rhs.getY(), epsilon)
            && nearlyEqual(lhs.getWidth(), rhs.getWidth(), epsilon)
            && nearlyEqual(lhs.getHeight(), rhs.getHeight(), epsilon);
    }

    juce::String describeRect(const juce::Rectangle<float>& rect)
    {
        return rect.toString();
    }

    juce::Result expectMoveSnap(const SnapEngine& engine,
                                juce::Rectangle<float> box,
                                juce::Point<float> expectedDelta,
                                std::vector<float> expectedVertical,
                                std::vector<float> expectedHorizontal,
                                const char* label)
    {
        const auto result = engine.computeMoveSnap(box, kCanvasWidth, kCanvasHeight);
        if (!nearlyEqual(result.delta.x, expectedDelta.x) || !nearlyEqual(result.delta.y, expectedDelta.y))
            return juce::Result::fail(juce::String(label) + ": delta " + result.delta.toString());
        if (result.verticalGuides != expectedVertical || result.horizontalGuides != expectedHorizontal)
            return juce::Result::fail(juce::String(label) + ": unexpected guides");
        if (!nearlyEqualRect(result.snappedBounds, box.translated(expectedDelta.x, expectedDelta.y)))
            return juce::Result::fail(juce::String(label) + ": snapped bounds " + describeRect(result.snappedBounds));

        return juce::Result::ok();
    }

    juce::Result testMoveSnapRules()
    {
        const SnapEngine engine;

        if (const auto r = expectMoveSnap(engine, { 5.0f, 300.0f, 100.0f, 50.0f }, { -5.0f, 0.0f }, { 0.0f }, {}, "left edge"); r.failed())
            return r;
        if (const auto r = expectMoveSnap(engine, { 1175.0f, 400.0f, 100.0f, 50.0f }, { 5.0f, 0.0f }, { 1280.0f }, {}, "right edge"); r.failed())
            return r;
        if (const auto r = expectMoveSnap(engine, { 587.0f, 200.0f, 100.0f, 50.0f }, { 3.0f, 0.0f }, { 640.0f }, {}, "vertical centre"); r.failed())
            return r;
        if (const auto r = expectMoveSnap(engine, { 300.0f, 333.0f, 100.0f, 50.0f }, { 0.0f, 2.0f }, {}, { 360.0f }, "horizontal centre"); r.failed())
            return r;
        if (const auto r = expectMoveSnap(engine, { 300.0f, 715.0f, 100.0f, 2.0f }, { 0.0f, 3.0f }, {}, { 720.0f }, "bottom edge"); r.failed())
            return r;
        if (const auto r = expectMoveSnap(engine, { 8.0f, 300.0f, 100.0f, 50.0f }, { 0.0f, 0.0f }, {}, {}, "threshold is exclusive"); r.failed())
            return r;

        return juce::Result::ok();
    }

    juce::Result testMoveSnapIdempotent()
    {
        const SnapEngine engine;
        const juce::Rectangle<float> box { 0.0f, 0.0f, 100.0f, 100.0f };

        const auto first = engine.computeMoveSnap(box, kCanvasWidth, kCanvasHeight);
        if (!nearlyEqual(first.delta.x, 0.0f) || !nearlyEqual(first.delta.y, 0.0f))
            return juce::Result::fail("box at origin must not move");
        if (first.verticalGuides != std::vector<float> { 0.0f } || first.horizontalGuides != std::vector<float> { 0.0f })
            return juce::Result::fail("box at origin must report both edge guides");

        const auto second = engine.computeMoveSnap(first.snappedBounds, kCanvasWidth, kCanvasHeight);
        if (!nearlyEqualRect(second.snappedBounds, first.snappedBounds))
            return juce::Result::fail("snapping an already snapped box must be stable");

        return juce::Result::ok();
    }

    juce::Result testSnapDisabled()
    {
        SnapSettings settings;
        settings.enabled = false;
        const SnapEngine engine(settings);

        const juce::Rectangle<float> box { 3.0f, 3.0f, 100.0f, 100.0f };
        const auto move = engine.computeMoveSnap(box, kCanvasWidth, kCanvasHeight);
        if (!nearlyEqualRect(move.snappedBounds, box) || !move.verticalGuides.empty() || !move.horizontalGuides.empty())
            return juce::Result::fail("disabled snapping must pass the box through");

        const juce::Rectangle<float> previous { 100.0f, 100.0f, 200.0f, 150.0f };
        const auto resize = engine.computeResize(previous, { 100.0f, 100.0f, 1176.0f, 150.0f }, ResizeHandle::se, kCanvasWidth, kCanvasHeight);
        if (!resize.accepted || !nearlyEqual(resize.bounds.getRight(), 1276.0f))
            return juce::Result::fail("disabled snapping must not move resized edges");

        const auto tooSmall = engine.computeResize(previous, { 100.0f, 100.0f, 4.0f, 150.0f }, ResizeHandle::e, kCanvasWidth, kCanvasHeight);
        if (tooSmall.accepted || !nearlyEqualRect(tooSmall.bounds, previous))
            return juce::Result::fail("minimum size must hold with snapping disabled");

        return juce::Result::ok();
    }

    juce::Result testSettingsDriveInteraction()
    {
        Tessera::EditorSettings settings;
        settings.snapThreshold = 2.0f;
        settings.resizeMinSize = 40.0f;
        settings.historyDebounceMs = 100;

        const SnapEngine engine(makeSnapSettings(settings));
        const auto move = engine.computeMoveSnap({ 5.0f, 300.0f, 100.0f, 50.0f }, kCanvasWidth, kCanvasHeight);
        if (!move.verticalGuides.empty())
            return juce::Result::fail("configured threshold must be used");

        const juce::Rectangle<float> previous { 100.0f, 100.0f, 200.0f, 150.0f };
        const auto resize = engine.computeResize(previous, { 100.0f, 100.0f, 30.0f, 150.0f }, ResizeHandle::e, kCanvasWidth, kCanvasHeight);
        if (resize.accepted)
            return juce::Result::fail("configured minimum size must be used");

        Tessera::DocumentHandle document(settings);
        HistoryDebouncer debouncer(settings.historyDebounceMs);
        if (!debouncer.pushIfDue(document, 0) || !debouncer.pushIfDue(document, 101))
            return juce::Result::fail("configured debounce interval must be used");

        return juce::Result::ok();
    }

    juce::Result testResizeRejection()
    {
        const SnapEngine engine;
        const juce::Rectangle<float> previous { 100.0f, 100.0f, 20.0f, 20.0f };

        const auto result = engine.computeResize(previous, { 100.0f, 100.0f, 5.0f, 5.0f }, ResizeHandle::se, kCanvasWidth, kCanvasHeight);
        if (result.accepted)
            return juce::Result::fail("resize below 10x10 must be rejected");
        if (!nearlyEqualRect(result.bounds, previous))
            return juce::Result::fail("rejected resize must return the previous box, got " + describeRect(result.bounds));

        const auto narrow = engine.computeResize(previous, { 100.0f, 100.0f, 9.0f, 40.0f }, ResizeHandle::e, kCanvasWidth, kCanvasHeight);
        if (narrow.accepted)
            return juce::Result::fail("width below the minimum must be rejected");

        const auto exact = engine.computeResize(previous, { 100.0f, 100.0f, 10.0f, 10.0f }, ResizeHandle::se, kCanvasWidth, kCanvasHeight);
        if (!exact.accepted)
            return juce::Result::fail("exactly 10x10 must be accepted");

        return juce::Result::ok();
    }

    juce::Result testResizeEdgeSnapping()
    {
        const SnapEngine engine;
        const juce::Rectangle<float> previous { 100.0f, 100.0f, 200.0f, 150.0f };

        const auto right = engine.computeResize(previous, { 100.0f, 100.0f, 1176.0f, 150.0f }, ResizeHandle::se, kCanvasWidth, kCanvasHeight);
        if (!right.accepted || !nearlyEqualRect(right.bounds, { 100.0f, 100.0f, 1180.0f, 150.0f }))
            return juce::Result::fail("right edge must snap to the canvas edge: " + describeRect(right.bounds));
        if (right.verticalGuides != std::vector<float> { 1280.0f } || !right.horizontalGuides.empty())
            return juce::Result::fail("right edge snap guides mismatch");

        const auto left = engine.computeResize(previous, { 4.0f, 100.0f, 296.0f, 150.0f }, ResizeHandle::nw, kCanvasWidth, kCanvasHeight);
        if (!left.accepted || !nearlyEqualRect(left.bounds, { 0.0f, 100.0f, 300.0f, 150.0f }))
            return juce::Result::fail("left edge must snap while the right edge stays: " + describeRect(left.bounds));

        const auto centre = engine.computeResize(previous, { 100.0f, 100.0f, 543.0f, 150.0f }, ResizeHandle::e, kCanvasWidth, kCanvasHeight);
        if (!centre.accepted || !nearlyEqual(centre.bounds.getRight(), 640.0f))
            return juce::Result::fail("dragged edge must snap to the canvas centre");

        const auto bottom = engine.computeResize(previous, { 100.0f, 100.0f, 200.0f, 617.0f }, ResizeHandle::s, kCanvasWidth, kCanvasHeight);
        if (!bottom.accepted || !nearlyEqual(bottom.bounds.getBottom(), 720.0f) || bottom.horizontalGuides != std::vector<float> { 720.0f })
            return juce::Result::fail("bottom edge must snap to the canvas edge");

        const auto leftNearFarEdge = engine.computeResize({ 1200.0f, 100.0f, 100.0f, 150.0f },
                                                          { 1276.0f, 100.0f, 24.0f, 150.0f },
                                                          ResizeHandle::nw, kCanvasWidth, kCanvasHeight);
        if (!leftNearFarEdge.accepted || !nearlyEqual(leftNearFarEdge.bounds.getX(), 1276.0f) || !leftNearFarEdge.verticalGuides.empty())
            return juce::Result::fail("left edge must not snap to the right canvas edge: " + describeRect(leftNearFarEdge.bounds));

        const auto bottomNearOrigin = engine.computeResize({ 100.0f, -100.0f, 200.0f, 150.0f },
                                                           { 100.0f, -100.0f, 200.0f, 104.0f },
                                                           ResizeHandle::s, kCanvasWidth, kCanvasHeight);
        if (!bottomNearOrigin.accepted || !nearlyEqual(bottomNearOrigin.bounds.getBottom(), 4.0f) || !bottomNearOrigin.horizontalGuides.empty())
            return juce::Result::fail("bottom edge must not snap to the top canvas edge: " + describeRect(bottomNearOrigin.bounds));

        return juce::Result::ok();
    }

    juce::Result testHandleGeometry()
    {
        const juce::Rectangle<float> box { 100.0f, 100.0f, 200.0f, 100.0f };

        const auto positions = handlePositions(box);
        if (positions[0] != juce::Point<float>(100.0f, 100.0f) || positions[4] != juce::Point<float>(300.0f, 200.0f))
            return juce::Result::fail("handle positions mismatch");
        if (handlePosition(box, ResizeHandle::n) != juce::Point<float>(200.0f, 100.0f))
            return juce::Result::fail("n handle must sit at the top centre");

        if (hitTestHandle(box, { 100.0f, 100.0f }, 1.0f) != std::optional<ResizeHandle>(ResizeHandle::nw))
            return juce::Result::fail("corner hit test failed");
        if (hitTestHandle(box, { 311.0f, 150.0f }, 1.0f) != std::optional<ResizeHandle>(ResizeHandle::e))
            return juce::Result::fail("hit radius must include the padding at zoom 1");
        if (hitTestHandle(box, { 311.0f, 150.0f }, 2.0f).has_value())
            return juce::Result::fail("hit radius must shrink with zoom");
        if (hitTestHandle(box, { 200.0f, 150.0f }, 1.0f).has_value())
            return juce::Result::fail("box centre must not hit a handle");

        if (resizeHandleToKey(ResizeHandle::sw) != "sw")
            return juce::Result::fail("handle key mismatch");

        return juce::Result::ok();
    }

    juce::Result testScreenToCanvas()
    {
        const auto point = screenToCanvas({ 300.0f, 200.0f }, { 100.0f, 50.0f }, 2.0f);
        if (!nearlyEqual(point.x, 100.0f) || !nearlyEqual(point.y, 75.0f))
            return juce::Result::fail("screenToCanvas must remove the origin and zoom");

        const auto fallback = screenToCanvas({ 300.0f, 200.0f }, { 100.0f, 50.0f }, 0.0f);
        if (!nearlyEqual(fallback.x, 200.0f) || !nearlyEqual(fallback.y, 150.0f))
            return juce::Result::fail("invalid zoom must be treated as 1");

        return juce::Result::ok();
    }

    juce::Result testLayerBoundsAndCommit()
    {
        Tessera::DocumentHandle document;
        const auto rectId = document.addShapeLayer(Tessera::ShapeType::rect);
        const auto textId = document.addTextLayer("Scale me");

        auto rect = *document.findLayer(rectId);
        rect.scaleX = 2.0f;
        const auto scaled = layerBounds(rect);
        if (!scaled.has_value() || !nearlyEqualRect(*scaled, { 100.0f, 100.0f, 400.0f, 150.0f }))
            return juce::Result::fail("scaled bounds mismatch");

        rect.scaleX = 1.0f;
        rect.rotation = 90.0f;
        const auto rotated = layerBounds(rect);
        if (!rotated.has_value() || !nearlyEqualRect(*rotated, { -50.0f, 100.0f, 150.0f, 200.0f }))
            return juce::Result::fail("rotated bounds mismatch: " + (rotated.has_value() ? describeRect(*rotated) : juce::String("none")));

        const auto& text = *document.findLayer(textId);
        if (layerBounds(text).has_value())
            return juce::Result::fail("text layers have no intrinsic bounds");

        TransformState state;
        state.x = 10.0f;
        state.y = 20.0f;
        state.scaleX = 1.5f;
        state.scaleY = 1.5f;

        const auto textPatch = commitTransform(text, state);
        if (!textPatch.fontSize.has_value() || !nearlyEqual(*textPatch.fontSize, 72.0f))
            return juce::Result::fail("text scale must fold into the font size");
        if (!nearlyEqual(textPatch.scaleX.value_or(0.0f), 1.0f) || !nearlyEqual(textPatch.scaleY.value_or(0.0f), 1.0f))
            return juce::Result::fail("text scale must reset to 1");

        state.scaleX = 0.001f;
        if (!nearlyEqual(commitTransform(text, state).fontSize.value_or(0.0f), 1.0f))
            return juce::Result::fail("font size must not drop below 1");

        state.scaleX = 1.5f;
        const auto shapePatch = commitTransform(*document.findLayer(rectId), state);
        if (shapePatch.fontSize.has_value() || !nearlyEqual(shapePatch.scaleX.value_or(0.0f), 1.5f))
            return juce::Result::fail("shape scale must be kept");
        if (!nearlyEqual(shapePatch.x.value_or(0.0f), 10.0f) || !nearlyEqual(shapePatch.y.value_or(0.0f), 20.0f))
            return juce::Result::fail("commit must carry the position");

        return juce::Result::ok();
    }

    juce::Result testHistoryDebounce()
    {
        Tessera::DocumentHandle document;
        const auto id = document.addTextLayer("Slider");
        const auto historyBefore = document.historySize();

        HistoryDebouncer debouncer;
        for (int i = 0; i < 10; ++i)
        {
            Tessera::LayerPatch patch;
            patch.x = static_cast<float>(i);
            if (!debouncer.updateWithHistory(document, id, patch, 1000 + i * 50))
                return juce::Result::fail("debounced update " + juce::String(i) + " failed");
        }

        Tessera::LayerPatch late;
        late.x = 500.0f;
        if (!debouncer.updateWithHistory(document, id, late, 1450 + 600))
            return juce::Result::fail("late update failed");

        if (debouncer.getPushCount() != 2)
            return juce::Result::fail("expected 2 pushes, got " + juce::String(debouncer.getPushCount()));
        if (document.historySize() != historyBefore + 2)
            return juce::Result::fail("history must grow by exactly 2");

        if (!document.undo() || !nearlyEqual(document.findLayer(id)->x, 100.0f))
            return juce::Result::fail("undo from the tip must return to the state before the first burst");
        if (!document.redo() || !nearlyEqual(document.findLayer(id)->x, 9.0f))
            return juce::Result::fail("redo must pass through the end of the first burst");
        if (!document.redo() || !nearlyEqual(document.findLayer(id)->x, 500.0f))
            return juce::Result::fail("redo must return to the live state");

        Tessera::LayerPatch invalid;
        invalid.opacity = 2.0f;
        if (debouncer.updateWithHistory(document, id, invalid, 5000) || debouncer.updateWithHistory(document, "missing", late, 5000))
            return juce::Result::fail("rejected updates must not apply");
        if (debouncer.getPushCount() != 2)
            return juce::Result::fail("rejected updates must not push history");

        debouncer.reset();
        if (!debouncer.pushIfDue(document, 5000) || debouncer.pushIfDue(document, 5500))
            return juce::Result::fail("reset must allow an immediate push and the interval is exclusive");

        return juce::Result::ok();
    }

    juce::Result testToolStateMachine()
    {
        Tessera::DocumentHandle document;
        const ToolStateMachine tools;

        const auto existing = document.addShapeLayer(Tessera::ShapeType::rect);
        if (tools.handleBackgroundClick(document, { 50.0f, 50.0f }).failed())
            return juce::Result::fail("select background click failed");
        if (document.snapshot().activeLayerId.has_value())
            return juce::Result::fail("select background click must clear the active layer");

        if (tools.handleLayerClick(document, existing).failed() || document.snapshot().activeLayerId != std::optional<Tessera::LayerId>(existing))
            return juce::Result::fail("layer click must activate the layer");
        if (tools.handleLayerClick(document, "missing").wasOk())
            return juce::Result::fail("clicking an unknown layer must fail");

        tools.setTool(document, Tessera::ToolKind::rect);
        Tessera::LayerId created;
        if (tools.handleBackgroundClick(document, { 400.0f, 300.0f }, &created).failed())
            return juce::Result::fail("rect background click failed");

        const auto* placed = document.findLayer(created);
        if (placed == nullptr || !nearlyEqual(placed->x, 400.0f) || !nearlyEqual(placed->y, 300.0f))
            return juce::Result::fail("canvas creation must place the layer at the click");
        if (tools.currentTool(document) != Tessera::ToolKind::rect)
            return juce::Result::fail("canvas creation must keep the tool");

        if (tools.handleBackgroundClick(document, { 10.0f, 10.0f }).failed() || document.activePage().layers.size() != 3)
            return juce::Result::fail("repeated canvas clicks must keep creating");

        Tessera::LayerId toolbarText;
        if (tools.createFromToolbar(document, Tessera::ToolKind::text, &toolbarText).failed())
            return juce::Result::fail("toolbar text creation failed");

        const auto* text = document.findLayer(toolbarText);
        const auto* textContent = text != nullptr ? std::get_if<Tessera::TextContent>(&text->content) : nullptr;
        if (textContent == nullptr || textContent->text != ToolStateMachine::kDefaultText)
            return juce::Result::fail("toolbar text must use the default text");
        if (!nearlyEqual(text->x, 540.0f) || !nearlyEqual(text->y, 336.0f))
            return juce::Result::fail("toolbar text must be placed near the canvas centre");
        if (tools.currentTool(document) != Tessera::ToolKind::select)
            return juce::Result::fail("toolbar creation must return to select");

        Tessera::LayerId toolbarEllipse;
        if (tools.createFromToolbar(document, Tessera::ToolKind::ellipse, &toolbarEllipse).failed())
            return juce::Result::fail("toolbar ellipse creation failed");

        const auto* ellipse = document.findLayer(toolbarEllipse);
        if (ellipse == nullptr || !nearlyEqual(ellipse->x, 540.0f) || !nearlyEqual(ellipse->y, 285.0f))
            return juce::Result::fail("toolbar shape placement mismatch");

        return juce::Result::ok();
    }

    juce::Result testTransformSessionMove()
    {
        Tessera::DocumentHandle document;
        const auto id = document.addShapeLayer(Tessera::ShapeType::rect);
        const auto historyBefore = document.historySize();

        const SnapEngine engine;
        TransformSession session(engine);
        if (session.beginMove(document, id).failed())
            return juce::Result::fail("beginMove failed");
        if (document.historySize() != historyBefore + 1)
            return juce::Result::fail("begin must push history once");

        session.updateMove(document, { -40.0f, 0.0f });
        session.updateMove(document, { -80.0f, 0.0f });
        const auto last = session.updateMove(document, { -97.0f, 0.0f });
        if (last.verticalGuides != std::vector<float> { 0.0f } || session.getVerticalGuides() != last.verticalGuides)
            return juce::Result::fail("drag near the left edge must report the guide");
        if (!nearlyEqual(document.findLayer(id)->x, 100.0f))
            return juce::Result::fail("drag updates must not touch the document");

        if (session.commit(document).failed())
            return juce::Result::fail("commit failed");
        if (session.isActive())
            return juce::Result::fail("commit must end the session");
        if (document.historySize() != historyBefore + 1)
            return juce::Result::fail("a whole drag must be a single history entry");

        const auto* moved = document.findLayer(id);
        if (!nearlyEqual(moved->x, 0.0f) || !nearlyEqual(moved->y, 100.0f))
            return juce::Result::fail("commit must write the snapped position");

        return juce::Result::ok();
    }

    juce::Result testTransformSessionResize()
    {
        Tessera::DocumentHandle document;
        const auto id = document.addShapeLayer(Tessera::ShapeType::rect);

        const SnapEngine engine;
        TransformSession session(engine);
        if (session.beginResize(document, id, ResizeHandle::se).failed())
            return juce::Result::fail("beginResize failed");

        const auto tiny = session.updateResize(document, { 100.0f, 100.0f, 5.0f, 5.0f });
        if (tiny.accepted || !nearlyEqualRect(session.getCurrentBounds(), { 100.0f, 100.0f, 200.0f, 150.0f }))
            return juce::Result::fail("rejected resize must keep the previous box");

        const auto grown = session.updateResize(document, { 100.0f, 100.0f, 1176.0f, 150.0f });
        if (!grown.accepted || !nearlyEqual(session.getCurrentBounds().getRight(), 1280.0f))
            return juce::Result::fail("resize must snap the dragged edge");

        if (session.commit(document).failed())
            return juce::Result::fail("commit failed");

        const auto* resized = document.findLayer(id);
        if (!nearlyEqual(resized->x, 100.0f) || !nearlyEqual(resized->scaleX, 5.9f) || !nearlyEqual(resized->scaleY, 1.0f))
            return juce::Result::fail("resize commit must fold the box into scale");

        return juce::Result::ok();
    }

    juce::Result testTransformSessionRefusals()
    {
        Tessera::DocumentHandle document;
        document.reset();
        const auto backgroundId = document.activePage().layers.front().id;
        const auto textId = document.addTextLayer("No box");

        const SnapEngine engine;
        TransformSession session(engine);

        const auto historyBefore = document.historySize();
        if (session.beginMove(document, backgroundId).wasOk())
            return juce::Result::fail("locked layers must not be dragged");
        if (session.beginMove(document, "missing").wasOk())
            return juce::Result::fail("unknown layers must not be dragged");
        if (session.beginMove(document, textId).wasOk())
            return juce::Result::fail("text without measured bounds must be refused");
        if (document.historySize() != historyBefore)
            return juce::Result::fail("refused gestures must not push history");

        if (session.beginMove(document, textId, { 100.0f, 100.0f, 180.0f, 60.0f }).failed())
            return juce::Result::fail("text with measured bounds must be draggable");
        if (session.beginResize(document, textId, ResizeHandle::se).wasOk())
            return juce::Result::fail("a second gesture must not start while one is active");

        session.updateMove(document, { 50.0f, 50.0f });
        session.cancel();
        if (session.isActive() || session.getMode() != TransformSession::Mode::idle)
            return juce::Result::fail("cancel must end the session");
        if (!nearlyEqual(document.findLayer(textId)->x, 100.0f))
            return juce::Result::fail("cancel must leave the layer untouched");
        if (session.commit(document).wasOk())
            return juce::Result::fail("commit without a gesture must fail");

        const auto shapeId = document.addShapeLayer(Tessera::ShapeType::rect);
        TransformSession resizeSession(SnapEngine {});
        if (resizeSession.beginResize(document, shapeId, ResizeHandle::se).failed())
            return juce::Result::fail("beginResize failed");
        if (resizeSession.beginResize(document, shapeId, ResizeHandle::nw).wasOk())
            return juce::Result::fail("a second resize must not start while one is active");

        const auto grown = resizeSession.updateResize(document, { 100.0f, 100.0f, 1176.0f, 150.0f });
        if (!grown.accepted || !nearlyEqualRect(grown.bounds, { 100.0f, 100.0f, 1180.0f, 150.0f }))
            return juce::Result::fail("a refused resize must keep the active handle: " + describeRect(grown.bounds));

        resizeSession.cancel();
        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Move snap rules", testMoveSnapRules },
        { "Move snap idempotent", testMoveSnapIdempotent },
        { "Snap disabled", testSnapDisabled },
        { "Settings drive interaction", testSettingsDriveInteraction },
        { "Resize rejection", testResizeRejection },
        { "Resize edge snapping", testResizeEdgeSnapping },
        { "Handle geometry", testHandleGeometry },
        { "Screen to canvas", testScreenToCanvas },
        { "Layer bounds and commit", testLayerBoundsAndCommit },
        { "History debounce", testHistoryDebounce },
        { "Tool state machine", testToolStateMachine },
        { "Transform session move", testTransformSessionMove },
        { "Transform session resize", testTransformSessionResize },
        { "Transform session refusals", testTransformSessionRefusals }
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

    std::cout << "Tessera interaction smoke passed." << std::endl;
    return 0;
}
