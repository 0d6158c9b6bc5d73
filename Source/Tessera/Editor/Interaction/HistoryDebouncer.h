#pragma once

#include "Tessera/Public/DocumentHandle.h"
#include <optional>

namespace Tessera::Ui::Interaction
{
    // Coalesces a burst of continuous edits (sliders, colour pickers) into one
    // undo step. One instance per interactive session.
    class HistoryDebouncer
    {
    public:
        static constexpr juce::int64 kDefaultIntervalMs = 500;

        HistoryDebouncer() = default;
        explicit HistoryDebouncer(juce::int64 intervalMsIn) noexcept
            : intervalMs(intervalMsIn)
        {
        }

        // Pushes history on the first call and whenever strictly more than the
        // interval has elapsed since the last push. Returns true when it pushed.
        bool pushIfDue(DocumentHandle& document, juce::int64 nowMs);
        bool pushIfDue(DocumentHandle& document);

        bool updateWithHistory(DocumentHandle& document, const LayerId& id, const LayerPatch& patch, juce::int64 nowMs);
        bool updateWithHistory(DocumentHandle& document, const LayerId& id, const LayerPatch& patch);

        void reset() noexcept;
        juce::int64 getIntervalMs() const noexcept { return intervalMs; }
        int getPushCount() const noexcept { return pushCount; }

    private:
        juce::int64 intervalMs = kDefaultIntervalMs;
        std::optional<juce::int64> lastPushMs;
        int pushCount = 0;
    };
}
