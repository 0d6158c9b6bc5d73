#include "Tessera/Editor/Interaction/HistoryDebouncer.h"

namespace Tessera::Ui::Interaction
{
    bool HistoryDebouncer::pushIfDue(DocumentHandle& document, juce::int64 nowMs)
    {
        if (lastPushMs.has_value() && nowMs - *lastPushMs <= intervalMs)
            return false;

        document.pushHistory();
        lastPushMs = nowMs;
        ++pushCount;
        return true;
    }

    bool HistoryDebouncer::pushIfDue(DocumentHandle& document)
    {
        return pushIfDue(document, juce::Time::currentTimeMillis());
    }

    bool HistoryDebouncer::updateWithHistory(DocumentHandle& document,
                                             const LayerId& id,
                                             const LayerPatch& patch,
                                             juce::int64 nowMs)
    {
        if (document.findLayer(id) == nullptr || validateLayerPatch(patch).failed())
            return false;

        pushIfDue(document, nowMs);
        return document.updateLayer(id, patch);
    }

    bool HistoryDebouncer::updateWithHistory(DocumentHandle& document, const LayerId& id, const LayerPatch& patch)
    {
        return updateWithHistory(document, id, patch, juce::Time::currentTimeMillis());
    }

    void HistoryDebouncer::reset() noexcept
    {
        lastPushMs.reset();
        pushCount = 0;
    }
}
