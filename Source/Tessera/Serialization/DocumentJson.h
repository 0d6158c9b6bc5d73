#pragma once

#include "Tessera/Public/Types.h"
#include <juce_core/juce_core.h>

namespace Tessera::Serialization
{
    enum class DocumentShape
    {
        current,          // { version, canvasWidth, canvasHeight, pages }
        pageArray,        // [ { id, layers }, ... ]
        legacyLayerArray  // [ layer, ... ] from single-page saves
    };

    struct LoadedDocument
    {
        PageList pages;
        int canvasWidth = kDefaultCanvasWidth;
        int canvasHeight = kDefaultCanvasHeight;
        DocumentShape shape = DocumentShape::current;
    };

    juce::var serializeLayer(const LayerModel& layer);
    juce::var serializePage(const PageModel& page);
    juce::var serializeDocument(const DocumentModel& document);

    juce::Result serializeDocumentToJsonString(const DocumentModel& document, juce::String& jsonOut);

    // Accepts all three stored shapes. Missing canvas size takes the given defaults.
    juce::Result parseDocument(const juce::var& root,
                               LoadedDocument& documentOut,
                               int defaultCanvasWidth = kDefaultCanvasWidth,
                               int defaultCanvasHeight = kDefaultCanvasHeight);

    juce::Result parseDocumentFromJsonString(const juce::String& json,
                                             LoadedDocument& documentOut,
                                             int defaultCanvasWidth = kDefaultCanvasWidth,
                                             int defaultCanvasHeight = kDefaultCanvasHeight);

    juce::Result saveDocumentToFile(const juce::File& file, const DocumentModel& document);

    juce::Result loadDocumentFromFile(const juce::File& file,
                                      LoadedDocument& documentOut,
                                      int defaultCanvasWidth = kDefaultCanvasWidth,
                                      int defaultCanvasHeight = kDefaultCanvasHeight);
}
