#pragma once

#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>

namespace Tessera
{
    struct EditorSettings
    {
        int historyLimit = 50;
        int historyDebounceMs = 500;
        bool snapEnabled = true;
        float snapThreshold = 8.0f;
        float resizeMinSize = 10.0f;
        int canvasDefaultWidth = 1280;
        int canvasDefaultHeight = 720;
    };

    namespace Config
    {
        juce::PropertiesFile::Options makeSettingsFileOptions();

        // Reads every key, falling back to the default for missing or out-of-range values.
        EditorSettings loadEditorSettings(const juce::PropertySet& properties);
        void storeEditorSettings(const EditorSettings& settings, juce::PropertySet& properties);

        juce::Result loadEditorSettingsFromFile(const juce::File& file, EditorSettings& settingsOut);
        juce::Result saveEditorSettingsToFile(const juce::File& file, const EditorSettings& settings);

        juce::String describeEditorSettings(const EditorSettings& settings);
    }
}
