#pragma once

#include "Tessera/Core/Document.h"
#include "Tessera/Public/LayerPatch.h"
#include <algorithm>
#include <optional>

// In-place edits on a DocumentModel. Each returns false and leaves the model
// untouched when the edit does not apply.
namespace Tessera::Core::PageOps
{
    namespace detail
    {
        inline std::optional<size_t> findLayerIndex(const PageModel& page, const LayerId& id) noexcept
        {
            const auto it = std::find_if(page.layers.begin(),
                                         page.layers.end(),
                                         [&id](const LayerModel& layer)
                                         {
                                             return layer.id == id;
                                         });

            if (it == page.layers.end())
                return std::nullopt;

            return static_cast<size_t>(std::distance(page.layers.begin(), it));
        }

        inline bool isValidIndex(int index, size_t count) noexcept
        {
            return index >= 0 && index < static_cast<int>(count);
        }

        template <typename T>
        void moveElement(std::vector<T>& items, int from, int to)
        {
            auto moved = std::move(items[static_cast<size_t>(from)]);
            items.erase(items.begin() + from);
            items.insert(items.begin() + to, std::move(moved));
        }
    }

    inline PageModel* activePage(DocumentModel& model) noexcept
    {
        if (!detail::isValidIndex(model.activePageIndex, model.pages.size()))
            return nullptr;

        return &model.pages[static_cast<size_t>(model.activePageIndex)];
    }

    inline const PageModel* activePage(const DocumentModel& model) noexcept
    {
        if (!detail::isValidIndex(model.activePageIndex, model.pages.size()))
            return nullptr;

        return &model.pages[static_cast<size_t>(model.activePageIndex)];
    }

    inline bool appendLayer(DocumentModel& model, LayerModel layer)
    {
        auto* page = activePage(model);
        if (page == nullptr)
            return false;

        model.activeLayerId = layer.id;
        page->layers.push_back(std::move(layer));
        return true;
    }

    inline bool updateLayer(DocumentModel& model, const LayerId& id, const LayerPatch& patch)
    {
        auto* page = activePage(model);
        if (page == nullptr)
            return false;

        const auto index = detail::findLayerIndex(*page, id);
        if (!index.has_value())
            return false;

        applyLayerPatch(page->layers[*index], patch);
        return true;
    }

    inline bool removeLayer(DocumentModel& model, const LayerId& id)
    {
        auto* page = activePage(model);
        if (page == nullptr)
            return false;

        const auto index = detail::findLayerIndex(*page, id);
        if (!index.has_value())
            return false;

        page->layers.erase(page->layers.begin() + static_cast<std::ptrdiff_t>(*index));
        if (model.activeLayerId.has_value() && *model.activeLayerId == id)
            model.activeLayerId.reset();

        return true;
    }

    // up = toward the top of the stack (higher index).
    inline bool moveLayer(DocumentModel& model, const LayerId& id, LayerMoveDirection direction)
    {
        auto* page = activePage(model);
        if (page == nullptr)
            return false;

        const auto index = detail::findLayerIndex(*page, id);
        if (!index.has_value())
            return false;

        const auto from = static_cast<int>(*index);
        const auto to = direction == LayerMoveDirection::up ? from + 1 : from - 1;
        if (!detail::isValidIndex(to, page->layers.size()))
            return false;

        std::swap(page->layers[static_cast<size_t>(from)], page->layers[static_cast<size_t>(to)]);
        return true;
    }

    inline bool reorderLayers(DocumentModel& model, int from, int to)
    {
        auto* page = activePage(model);
        if (page == nullptr || from == to)
            return false;

        if (!detail::isValidIndex(from, page->layers.size()) || !detail::isValidIndex(to, page->layers.size()))
            return false;

        detail::moveElement(page->layers, from, to);
        return true;
    }

    inline bool addPage(DocumentModel& model, IdSet& takenIds)
    {
        model.pages.push_back(makeBackgroundPage(takenIds, model.canvasWidth, model.canvasHeight));
        model.activePageIndex = static_cast<int>(model.pages.size()) - 1;
        model.activeLayerId.reset();
        return true;
    }

    inline bool removePage(DocumentModel& model, int index)
    {
        if (model.pages.size() <= 1 || !detail::isValidIndex(index, model.pages.size()))
            return false;

        model.pages.erase(model.pages.begin() + index);

        if (index < model.activePageIndex)
        {
            --model.activePageIndex;
        }
        else if (index == model.activePageIndex)
        {
            model.activePageIndex = std::max(0, index - 1);
            model.activeLayerId.reset();
        }

        model.activePageIndex = std::min(model.activePageIndex, static_cast<int>(model.pages.size()) - 1);
        return true;
    }

    inline bool duplicatePage(DocumentModel& model, int index, IdSet& takenIds)
    {
        if (!detail::isValidIndex(index, model.pages.size()))
            return false;

        auto copy = clonePageWithFreshIds(model.pages[static_cast<size_t>(index)], takenIds);
        model.pages.insert(model.pages.begin() + index + 1, std::move(copy));
        model.activePageIndex = index + 1;
        model.activeLayerId.reset();
        return true;
    }

    inline bool reorderPages(DocumentModel& model, int from, int to)
    {
        if (from == to)
            return false;

        if (!detail::isValidIndex(from, model.pages.size()) || !detail::isValidIndex(to, model.pages.size()))
            return false;

        detail::moveElement(model.pages, from, to);

        auto& active = model.activePageIndex;
        if (active == from)
            active = to;
        else if (from < active && to >= active)
            --active;
        else if (from > active && to <= active)
            ++active;

        return true;
    }

    // Clamps the active page and drops an active layer that is not on it.
    inline void normalizeActiveState(DocumentModel& model)
    {
        const auto pageCount = static_cast<int>(model.pages.size());
        model.activePageIndex = juce::jlimit(0, std::max(0, pageCount - 1), model.activePageIndex);

        if (!model.activeLayerId.has_value())
            return;

        const auto* page = activePage(model);
        if (page == nullptr || !detail::findLayerIndex(*page, *model.activeLayerId).has_value())
            model.activeLayerId.reset();
    }
}
