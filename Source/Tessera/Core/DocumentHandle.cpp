#include "Tessera/Public/DocumentHandle.h"

#include "Tessera/Core/Document.h"
#include "Tessera/Core/DocumentValidator.h"
#include "Tessera/Core/History.h"
#include "Tessera/Core/PageOps.h"
#include "Tessera/Serialization/DocumentJson.h"
#include <algorithm>
#include <cmath>

namespace Tessera
{
    namespace
    {
        const LayerModel* findLayerOnPage(const PageModel& page, const LayerId& id) noexcept
        {
            const auto it = std::find_if(page.layers.begin(),
                                         page.layers.end(),
                                         [&id](const LayerModel& layer)
                                         {
                                             return layer.id == id;
                                         });

            if (it == page.layers.end())
                return nullptr;

            return &(*it);
        }

        void logRejected(const juce::String& operation, const juce::String& reason)
        {
            DBG("[Tessera] " + operation + " rejected: " + reason);
            juce::ignoreUnused(operation, reason);
        }
    }

    class DocumentHandle::Impl
    {
    public:
        explicit Impl(const EditorSettings& settingsIn)
            : settings(settingsIn),
              history(static_cast<size_t>(std::max(1, settingsIn.historyLimit)))
        {
            model.canvasWidth = std::max(1, settings.canvasDefaultWidth);
            model.canvasHeight = std::max(1, settings.canvasDefaultHeight);
            model.pages.push_back(Core::makeBlankPage(takenIds));
            savedPages = model.pages;
        }

        EditorSettings settings;
        DocumentModel model;
        Core::History history;
        Core::IdSet takenIds;
        PageList savedPages;

        // Applies a structural edit to a copy; history and model change only on success.
        template <typename Mutator>
        bool commitStructural(Mutator&& mutate)
        {
            DocumentModel next = model;
            auto nextIds = takenIds;
            if (!mutate(next, nextIds))
                return false;

            Core::PageOps::normalizeActiveState(next);
            history.push(model.pages);
            model = std::move(next);
            takenIds = std::move(nextIds);
            return true;
        }

        LayerId addLayer(LayerModel layer)
        {
            const auto id = layer.id;
            const auto added = commitStructural([&layer, &id](DocumentModel& next, Core::IdSet& ids)
                                                {
                                                    ids.insert(id);
                                                    return Core::PageOps::appendLayer(next, std::move(layer));
                                                });

            return added ? id : LayerId();
        }

        void restorePages(PageList pages)
        {
            model.pages = std::move(pages);
            takenIds = Core::collectIds(model.pages);
            Core::PageOps::normalizeActiveState(model);
        }
    };

    DocumentHandle::DocumentHandle()
        : DocumentHandle(EditorSettings {})
    {
    }

    DocumentHandle::DocumentHandle(const EditorSettings& settings)
        : impl(std::make_unique<Impl>(settings))
    {
    }

    DocumentHandle::~DocumentHandle() = default;
    DocumentHandle::DocumentHandle(DocumentHandle&&) noexcept = default;
    DocumentHandle& DocumentHandle::operator=(DocumentHandle&&) noexcept = default;

    const DocumentModel& DocumentHandle::snapshot() const noexcept
    {
        return impl->model;
    }

    const PageModel& DocumentHandle::activePage() const noexcept
    {
        return impl->model.pages[static_cast<size_t>(impl->model.activePageIndex)];
    }

    const LayerModel* DocumentHandle::findLayer(const LayerId& id) const noexcept
    {
        return findLayerOnPage(activePage(), id);
    }

    const LayerModel* DocumentHandle::findLayerAnywhere(const LayerId& id) const noexcept
    {
        for (const auto& page : impl->model.pages)
        {
            if (const auto* layer = findLayerOnPage(page, id))
                return layer;
        }

        return nullptr;
    }

    int DocumentHandle::pageCount() const noexcept
    {
        return static_cast<int>(impl->model.pages.size());
    }

    LayerId DocumentHandle::addImageLayer(const juce::String& source, float width, float height)
    {
        if (!std::isfinite(width) || !std::isfinite(height) || width < 0.0f || height < 0.0f)
        {
            logRejected("addImageLayer", "image size must be finite and >= 0");
            return {};
        }

        auto ids = impl->takenIds;
        auto layer = Core::makeImageLayer(Core::createUniqueId(ids), source, width, height);
        return impl->addLayer(std::move(layer));
    }

    LayerId DocumentHandle::addTextLayer(const juce::String& text)
    {
        auto ids = impl->takenIds;
        return impl->addLayer(Core::makeTextLayer(Core::createUniqueId(ids), text));
    }

    LayerId DocumentHandle::addShapeLayer(ShapeType shapeType)
    {
        auto ids = impl->takenIds;
        return impl->addLayer(Core::makeShapeLayer(Core::createUniqueId(ids), shapeType));
    }

    bool DocumentHandle::updateLayer(const LayerId& id, const LayerPatch& patch)
    {
        const auto validation = validateLayerPatch(patch);
        if (validation.failed())
        {
            logRejected("updateLayer", validation.getErrorMessage());
            return false;
        }

        return Core::PageOps::updateLayer(impl->model, id, patch);
    }

    bool DocumentHandle::removeLayer(const LayerId& id)
    {
        if (findLayer(id) == nullptr)
            return false;

        return impl->commitStructural([&id](DocumentModel& next, Core::IdSet& ids)
                                      {
                                          ids.erase(id);
                                          return Core::PageOps::removeLayer(next, id);
                                      });
    }

    bool DocumentHandle::moveLayer(const LayerId& id, LayerMoveDirection direction)
    {
        return impl->commitStructural([&id, direction](DocumentModel& next, Core::IdSet&)
                                      {
                                          return Core::PageOps::moveLayer(next, id, direction);
                                      });
    }

    bool DocumentHandle::reorderLayers(int fromIndex, int toIndex)
    {
        return impl->commitStructural([fromIndex, toIndex](DocumentModel& next, Core::IdSet&)
                                      {
                                          return Core::PageOps::reorderLayers(next, fromIndex, toIndex);
                                      });
    }

    bool DocumentHandle::addPage()
    {
        return impl->commitStructural([](DocumentModel& next, Core::IdSet& ids)
                                      {
                                          return Core::PageOps::addPage(next, ids);
                                      });
    }

    bool DocumentHandle::removePage(int index)
    {
        if (pageCount() <= 1)
        {
            logRejected("removePage", "a document keeps at least one page");
            return false;
        }

        return impl->commitStructural([index](DocumentModel& next, Core::IdSet&)
                                      {
                                          return Core::PageOps::removePage(next, index);
                                      });
    }

    bool DocumentHandle::duplicatePage(int index)
    {
        return impl->commitStructural([index](DocumentModel& next, Core::IdSet& ids)
                                      {
                                          return Core::PageOps::duplicatePage(next, index, ids);
                                      });
    }

    bool DocumentHandle::reorderPages(int fromIndex, int toIndex)
    {
        return impl->commitStructural([fromIndex, toIndex](DocumentModel& next, Core::IdSet&)
                                      {
                                          return Core::PageOps::reorderPages(next, fromIndex, toIndex);
                                      });
    }

    bool DocumentHandle::setActivePage(int index)
    {
        if (index < 0 || index >= pageCount())
            return false;

        impl->model.activePageIndex = index;
        impl->model.activeLayerId.reset();
        return true;
    }

    bool DocumentHandle::setActiveLayer(std::optional<LayerId> id)
    {
        if (id.has_value() && findLayer(*id) == nullptr)
            return false;

        impl->model.activeLayerId = std::move(id);
        return true;
    }

    void DocumentHandle::setActiveTool(ToolKind tool)
    {
        impl->model.activeTool = tool;
    }

    bool DocumentHandle::setCanvasSize(int width, int height)
    {
        const auto validation = Core::DocumentValidator::validateCanvasSize(width, height);
        if (validation.failed())
        {
            logRejected("setCanvasSize", validation.getErrorMessage());
            return false;
        }

        impl->model.canvasWidth = width;
        impl->model.canvasHeight = height;
        return true;
    }

    void DocumentHandle::reset()
    {
        DocumentModel fresh;
        fresh.canvasWidth = std::max(1, impl->settings.canvasDefaultWidth);
        fresh.canvasHeight = std::max(1, impl->settings.canvasDefaultHeight);

        Core::IdSet ids;
        fresh.pages.push_back(Core::makeBackgroundPage(ids, fresh.canvasWidth, fresh.canvasHeight));

        impl->model = std::move(fresh);
        impl->takenIds = std::move(ids);
        impl->history.clear();
        impl->savedPages = impl->model.pages;
    }

    juce::Result DocumentHandle::loadDocument(PageList pages, int canvasWidth, int canvasHeight)
    {
        const auto canvasResult = Core::DocumentValidator::validateCanvasSize(canvasWidth, canvasHeight);
        if (canvasResult.failed())
            return canvasResult;

        const auto pagesResult = Core::DocumentValidator::validatePages(pages);
        if (pagesResult.failed())
        {
            logRejected("loadDocument", pagesResult.getErrorMessage());
            return pagesResult;
        }

        DocumentModel loaded;
        loaded.pages = std::move(pages);
        loaded.canvasWidth = canvasWidth;
        loaded.canvasHeight = canvasHeight;
        loaded.activeTool = impl->model.activeTool;

        impl->takenIds = Core::collectIds(loaded.pages);
        impl->model = std::move(loaded);
        impl->history.clear();
        impl->savedPages = impl->model.pages;
        return juce::Result::ok();
    }

    void DocumentHandle::pushHistory()
    {
        impl->history.push(impl->model.pages);
    }

    bool DocumentHandle::undo()
    {
        auto pages = impl->history.undo(impl->model.pages);
        if (!pages.has_value())
            return false;

        impl->restorePages(std::move(*pages));
        return true;
    }

    bool DocumentHandle::redo()
    {
        auto pages = impl->history.redo();
        if (!pages.has_value())
            return false;

        impl->restorePages(std::move(*pages));
        return true;
    }

    bool DocumentHandle::canUndo() const noexcept
    {
        return impl->history.canUndo();
    }

    bool DocumentHandle::canRedo() const noexcept
    {
        return impl->history.canRedo();
    }

    int DocumentHandle::historySize() const noexcept
    {
        return static_cast<int>(impl->history.size());
    }

    int DocumentHandle::historyPosition() const noexcept
    {
        return impl->history.position();
    }

    void DocumentHandle::markSaved()
    {
        impl->savedPages = impl->model.pages;
    }

    bool DocumentHandle::hasUnsavedChanges() const noexcept
    {
        return impl->model.pages != impl->savedPages;
    }

    juce::Result DocumentHandle::saveToFile(const juce::File& file)
    {
        const auto result = Serialization::saveDocumentToFile(file, impl->model);
        if (result.failed())
        {
            logRejected("saveToFile", result.getErrorMessage());
            return result;
        }

        markSaved();
        return result;
    }

    juce::Result DocumentHandle::loadFromFile(const juce::File& file)
    {
        Serialization::LoadedDocument loaded;
        const auto parseResult = Serialization::loadDocumentFromFile(file,
                                                                     loaded,
                                                                     impl->settings.canvasDefaultWidth,
                                                                     impl->settings.canvasDefaultHeight);
        if (parseResult.failed())
        {
            logRejected("loadFromFile", parseResult.getErrorMessage());
            return parseResult;
        }

        return loadDocument(std::move(loaded.pages), loaded.canvasWidth, loaded.canvasHeight);
    }
}
