#include "Tessera/Config/EditorSettings.h"
#include "Tessera/Public/DocumentHandle.h"
#include "Tessera/Serialization/DocumentJson.h"
#include <iostream>

namespace
{
    juce::StringArray collectArgs(int argc, char* argv[])
    {
        juce::StringArray args;
        for (int i = 1; i < argc; ++i)
            args.add(juce::String::fromUTF8(argv[i]));

        args.trim();
        args.removeEmptyStrings();
        return args;
    }

    bool hasArg(const juce::StringArray& args, const juce::String& key)
    {
        for (const auto& arg : args)
        {
            if (arg == key)
                return true;
        }

        return false;
    }

    juce::String argValue(const juce::StringArray& args, const juce::String& prefix)
    {
        for (const auto& arg : args)
        {
            if (arg.startsWith(prefix))
                return arg.fromFirstOccurrenceOf(prefix, false, false).unquoted();
        }

        return {};
    }

    juce::File resolveFileArg(const juce::String& path)
    {
        return juce::File::getCurrentWorkingDirectory().getChildFile(path);
    }

    juce::File settingsFileFromArgs(const juce::StringArray& args)
    {
        const auto explicitPath = argValue(args, "--settings-file=");
        if (explicitPath.isNotEmpty())
            return resolveFileArg(explicitPath);

        return Tessera::Config::makeSettingsFileOptions().getDefaultFile();
    }

    juce::String shapeLabel(Tessera::Serialization::DocumentShape shape)
    {
        switch (shape)
        {
            case Tessera::Serialization::DocumentShape::current:          return "current";
            case Tessera::Serialization::DocumentShape::pageArray:        return "page array";
            case Tessera::Serialization::DocumentShape::legacyLayerArray: return "legacy layer array";
        }

        return {};
    }

    juce::String describeLayer(const Tessera::LayerModel& layer)
    {
        auto line = layerTypeToKey(getLayerType(layer)) + " \"" + layer.name + "\" at ("
                  + juce::String(layer.x, 1) + ", " + juce::String(layer.y, 1) + ")";

        if (const auto* shape = std::get_if<Tessera::ShapeContent>(&layer.content))
            line << " " << Tessera::shapeTypeToKey(shape->shapeType);
        if (!layer.visible)
            line << " hidden";
        if (layer.locked)
            line << " locked";

        return line;
    }

    int runInspect(const juce::StringArray& args, const Tessera::EditorSettings& settings)
    {
        const auto file = resolveFileArg(argValue(args, "--inspect="));

        Tessera::Serialization::LoadedDocument loaded;
        const auto result = Tessera::Serialization::loadDocumentFromFile(file,
                                                                         loaded,
                                                                         settings.canvasDefaultWidth,
                                                                         settings.canvasDefaultHeight);
        if (result.failed())
        {
            std::cerr << "Inspect failed: " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << file.getFullPathName() << std::endl;
        std::cout << "format: " << shapeLabel(loaded.shape) << std::endl;
        std::cout << "canvas: " << loaded.canvasWidth << "x" << loaded.canvasHeight << std::endl;
        std::cout << "pages: " << loaded.pages.size() << std::endl;

        for (size_t pageIndex = 0; pageIndex < loaded.pages.size(); ++pageIndex)
        {
            const auto& page = loaded.pages[pageIndex];
            std::cout << "  [" << pageIndex << "] " << page.id << " (" << page.layers.size() << " layers)" << std::endl;
            for (const auto& layer : page.layers)
                std::cout << "      " << describeLayer(layer) << std::endl;
        }

        return 0;
    }

    int runMigrate(const juce::StringArray& args, const Tessera::EditorSettings& settings)
    {
        const auto inputArg = argValue(args, "--input=");
        const auto outputArg = argValue(args, "--output=");
        if (inputArg.isEmpty() || outputArg.isEmpty())
        {
            std::cerr << "Migrate requires --input=<file> and --output=<file>" << std::endl;
            return 1;
        }

        Tessera::DocumentHandle document(settings);
        const auto loadResult = document.loadFromFile(resolveFileArg(inputArg));
        if (loadResult.failed())
        {
            std::cerr << "Migrate failed: " << loadResult.getErrorMessage() << std::endl;
            return 1;
        }

        const auto outputFile = resolveFileArg(outputArg);
        const auto saveResult = document.saveToFile(outputFile);
        if (saveResult.failed())
        {
            std::cerr << "Migrate failed: " << saveResult.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "Migrated " << document.pageCount() << " page(s) to " << outputFile.getFullPathName() << std::endl;
        return 0;
    }

    void printUsage()
    {
        std::cout << "Usage: TesseraTool [--settings-file=<file>] <command>" << std::endl
                  << "  --inspect=<file>                        print pages and layers" << std::endl
                  << "  --migrate --input=<file> --output=<file> rewrite in the current format" << std::endl
                  << "  --settings                              print the effective settings" << std::endl;
    }
}

int main(int argc, char* argv[])
{
    const auto args = collectArgs(argc, argv);

    Tessera::EditorSettings settings;
    const auto settingsFile = settingsFileFromArgs(args);
    const auto settingsResult = Tessera::Config::loadEditorSettingsFromFile(settingsFile, settings);
    if (settingsResult.failed())
    {
        std::cerr << settingsResult.getErrorMessage() << std::endl;
        return 1;
    }

    if (hasArg(args, "--settings"))
    {
        std::cout << "settings file: " << settingsFile.getFullPathName() << std::endl;
        std::cout << Tessera::Config::describeEditorSettings(settings) << std::endl;
        return 0;
    }

    if (argValue(args, "--inspect=").isNotEmpty())
        return runInspect(args, settings);

    if (hasArg(args, "--migrate"))
        return runMigrate(args, settings);

    printUsage();
    return args.isEmpty() ? 0 : 1;
}
