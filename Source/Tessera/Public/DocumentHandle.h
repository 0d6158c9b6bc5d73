#pragma once

#include "Tessera/Config/EditorSettings.h"
#include "Tessera/Public/LayerPatch.h"
#include "Tessera/Public/Types.h"
#include <memory>

namespace Tessera
{
    // Owns the document and its history. Mutations return true (or a non-empty id)
    // when the document changed; rejected operations change nothing.
    class DocumentHandle
    {
    public:
        DocumentHandle();
        explicit DocumentHandle(const EditorSettings& settings);
        ~DocumentHandle();
        DocumentHandle(DocumentHandle&&) noexcept;
        DocumentHandle& operator=(DocumentHandle&&) noexcept;

        DocumentHandle(const DocumentHandle&) = delete;
        DocumentHandle& operator=(const DocumentHandle&) = delete;

        const DocumentModel& snapshot() const noexcept;
        const PageModel& activePage() const noexcept;
        const LayerModel* findLayer(const LayerId& id) const noexcept;
        const LayerModel* findLayerAnywhere(const LayerId& id) const noexcept;
        int pageCount() const noexcept;

        LayerId addImageLayer(const juce::String& source, float width, float height);
        LayerId addTextLayer(const juce::String& text);
        LayerId addShapeLayer(ShapeType shapeType);
        bool updateLayer(const LayerId& id, const LayerPatch& patch);
        bool removeLayer(const LayerId& id);
        bool moveLayer(const LayerId& id, LayerMoveDirection direction);
        bool reorderLayers(int fromIndex, int toIndex);

        bool addPage();
        bool removePage(int index);
        bool duplicatePage(int index);
        bool reorderPages(int fromIndex, int toIndex);
        bool setActivePage(int index);

        bool setActiveLayer(std::optional<LayerId> id);
        void setActiveTool(ToolKind tool);
        bool setCanvasSize(int width, int height);

        void reset();
        juce::Result loadDocument(PageList pages, int canvasWidth, int canvasHeight);

        // Snapshot of the current pages, used before continuous edits.
        void pushHistory();
        bool undo();
        bool redo();
        bool canUndo() const noexcept;
        bool canRedo() const noexcept;
        int historySize() const noexcept;
        int historyPosition() const noexcept;

        void markSaved();
        bool hasUnsavedChanges() const noexcept;

        juce::Result saveToFile(const juce::File& file);
        juce::Result loadFromFile(const juce::File& file);

    private:
        class Impl;
        std::unique_ptr<Impl> impl;
    };
}
