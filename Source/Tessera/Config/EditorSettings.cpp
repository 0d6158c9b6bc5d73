#include "Tessera/Config/EditorSettings.h"

#include <cmath>

namespace
{
    constexpr auto kHistoryLimitKey = "history.limit";
    constexpr auto kHistoryDebounceKey = "history.debounceMs";
    constexpr auto kSnapEnabledKey = "snap.enabled";
    constexpr auto kSnapThresholdKey = "snap.threshold";
    constexpr auto kResizeMinSizeKey = "resize.minSize";
    constexpr auto kCanvasWidthKey = "canvas.defaultWidth";
    constexpr auto kCanvasHeightKey = "canvas.defaultHeight";

    int readIntAtLeast(const juce::PropertySet& properties, const juce::String& key, int minimum, int fallback)
    {
        if (!properties.containsKey(key))
            return fallback;

        const auto value = properties.getIntValue(key, fallback);
        if (value < minimum)
        {
            DBG("[Tessera] settings: " + key + " out of range, using default");
            return fallback;
        }

        return value;
    }

    float readFloatAtLeast(const juce::PropertySet& properties, const juce::String& key, float minimum, float fallback)
    {
        if (!properties.containsKey(key))
            return fallback;

        const auto value = static_cast<float>(properties.getDoubleValue(key, fallback));
        if (!std::isfinite(value) || value < minimum)
        {
            DBG("[Tessera] settings: " + key + " out of range, using default");
            return fallback;
        }

        return value;
    }
}

namespace Tessera::Config
{
    juce::PropertiesFile::Options makeSettingsFileOptions()
    {
        juce::PropertiesFile::Options options;
        options.applicationName = "Tessera";
        options.folderName = "Tessera";
        options.filenameSuffix = "settings";
        options.osxLibrarySubFolder = "Application Support";
        options.millisecondsBeforeSaving = -1; // saved explicitly
        return options;
    }

    EditorSettings loadEditorSettings(const juce::PropertySet& properties)
    {
        const EditorSettings defaults;
        EditorSettings settings;
        settings.historyLimit = readIntAtLeast(properties, kHistoryLimitKey, 1, defaults.historyLimit);
        settings.historyDebounceMs = readIntAtLeast(properties, kHistoryDebounceKey, 0, defaults.historyDebounceMs);
        settings.snapEnabled = properties.getBoolValue(kSnapEnabledKey, defaults.snapEnabled);
        settings.snapThreshold = readFloatAtLeast(properties, kSnapThresholdKey, 0.0f, defaults.snapThreshold);
        settings.resizeMinSize = readFloatAtLeast(properties, kResizeMinSizeKey, 0.0f, defaults.resizeMinSize);
        settings.canvasDefaultWidth = readIntAtLeast(properties, kCanvasWidthKey, 1, defaults.canvasDefaultWidth);
        settings.canvasDefaultHeight = readIntAtLeast(properties, kCanvasHeightKey, 1, defaults.canvasDefaultHeight);
        return settings;
    }

    void storeEditorSettings(const EditorSettings& settings, juce::PropertySet& properties)
    {
        properties.setValue(kHistoryLimitKey, settings.historyLimit);
        properties.setValue(kHistoryDebounceKey, settings.historyDebounceMs);
        properties.setValue(kSnapEnabledKey, settings.snapEnabled);
        properties.setValue(kSnapThresholdKey, settings.snapThreshold);
        properties.setValue(kResizeMinSizeKey, settings.resizeMinSize);
        properties.setValue(kCanvasWidthKey, settings.canvasDefaultWidth);
        properties.setValue(kCanvasHeightKey, settings.canvasDefaultHeight);
    }

    juce::Result loadEditorSettingsFromFile(const juce::File& file, EditorSettings& settingsOut)
    {
        if (!file.existsAsFile())
        {
            settingsOut = {};
            return juce::Result::ok();
        }

        juce::PropertiesFile propertiesFile(file, makeSettingsFileOptions());
        if (!propertiesFile.isValidFile())
            return juce::Result::fail("Failed to read settings file: " + file.getFullPathName());

        settingsOut = loadEditorSettings(propertiesFile);
        return juce::Result::ok();
    }

    juce::Result saveEditorSettingsToFile(const juce::File& file, const EditorSettings& settings)
    {
        juce::PropertiesFile propertiesFile(file, makeSettingsFileOptions());
        storeEditorSettings(settings, propertiesFile);
        if (!propertiesFile.save())
            return juce::Result::fail("Failed to write settings file: " + file.getFullPathName());

        return juce::Result::ok();
    }

    juce::String describeEditorSettings(const EditorSettings& settings)
    {
        juce::StringArray lines;
        lines.add(juce::String(kHistoryLimitKey) + " = " + juce::String(settings.historyLimit));
        lines.add(juce::String(kHistoryDebounceKey) + " = " + juce::String(settings.historyDebounceMs));
        lines.add(juce::String(kSnapEnabledKey) + " = " + (settings.snapEnabled ? "true" : "false"));
        lines.add(juce::String(kSnapThresholdKey) + " = " + juce::String(settings.snapThreshold));
        lines.add(juce::String(kResizeMinSizeKey) + " = " + juce::String(settings.resizeMinSize));
        lines.add(juce::String(kCanvasWidthKey) + " = " + juce::String(settings.canvasDefaultWidth));
        lines.add(juce::String(kCanvasHeightKey) + " = " + juce::String(settings.canvasDefaultHeight));
        return lines.joinIntoString("\n");
    }
}
