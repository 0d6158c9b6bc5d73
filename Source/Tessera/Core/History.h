#pragma once

#include "Tessera/Public/Types.h"
#include <algorithm>
#include <optional>
#include <vector>

namespace Tessera::Core
{
    // Linear snapshot history over page lists. Active pointers, tool and canvas
    // size are never recorded.
    class History
    {
    public:
        History() = default;
        explicit History(size_t limit)
            : historyLimit(std::max<size_t>(1, limit))
        {
        }

        void push(const PageList& pages)
        {
            if (index + 1 < static_cast<int>(entries.size()))
                entries.erase(entries.begin() + (index + 1), entries.end());

            entries.push_back(pages);
            trimToLimit();
            index = static_cast<int>(entries.size()) - 1;
        }

        // When called at the tip the live pages are appended first, so a later
        // redo can return to them.
        std::optional<PageList> undo(const PageList& livePages)
        {
            if (index < 0)
                return std::nullopt;

            if (index == static_cast<int>(entries.size()) - 1)
                entries.push_back(livePages);

            index = std::max(0, index - 1);
            return entries[static_cast<size_t>(index)];
        }

        std::optional<PageList> redo()
        {
            if (index >= static_cast<int>(entries.size()) - 1)
                return std::nullopt;

            ++index;
            return entries[static_cast<size_t>(index)];
        }

        bool canUndo() const noexcept
        {
            return index >= 0;
        }

        bool canRedo() const noexcept
        {
            return index < static_cast<int>(entries.size()) - 1;
        }

        void clear() noexcept
        {
            entries.clear();
            index = -1;
        }

        void setLimit(size_t limit)
        {
            historyLimit = std::max<size_t>(1, limit);
            trimToLimit();
            index = std::min(index, static_cast<int>(entries.size()) - 1);
        }

        size_t getLimit() const noexcept
        {
            return historyLimit;
        }

        size_t size() const noexcept
        {
            return entries.size();
        }

        int position() const noexcept
        {
            return index;
        }

        const std::vector<PageList>& getEntries() const noexcept
        {
            return entries;
        }

    private:
        void trimToLimit()
        {
            if (entries.size() <= historyLimit)
                return;

            const auto overflow = entries.size() - historyLimit;
            entries.erase(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(overflow));
            index = std::max(-1, index - static_cast<int>(overflow));
        }

        std::vector<PageList> entries;
        int index = -1;
        size_t historyLimit = 50;
    };
}
