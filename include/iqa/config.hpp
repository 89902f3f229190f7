#pragma once
#include <cstdlib>
#include <filesystem>
#include <string>

namespace iqa::config
{
    // Expected layout: <root>/<label>/<image files>
    inline constexpr const char *kDefaultDataRoot = "seg_train/seg_train";

    // Sampling cap per label (successfully processed images only)
    inline constexpr int kImagesPerClass = 100;

    // Specification limits on the [0, 255] grayscale range
    inline constexpr double kBrightnessMin = 60.0;
    inline constexpr double kBrightnessMax = 200.0;
    inline constexpr double kContrastMin = 20.0;

    inline constexpr const char *kDatasetTable = "image_quality.csv";
    inline constexpr const char *kAnnotatedTable = "image_quality_annotated.csv";

    // Rows shown by the "head" section of the report
    inline constexpr int kHeadRows = 5;

    // Run-time locations. Defaults come from the constants above,
    // overridden by IQA_DATA_ROOT / IQA_OUTPUT_ROOT / IQA_DEBUG.
    struct Settings
    {
        std::filesystem::path dataRoot{kDefaultDataRoot};
        std::filesystem::path outputRoot{"."};
        int imagesPerClass{kImagesPerClass};
        bool sortFiles{true};
        bool debug{false};

        std::filesystem::path datasetTable() const { return outputRoot / kDatasetTable; }
        std::filesystem::path annotatedTable() const { return outputRoot / kAnnotatedTable; }
    };

    inline Settings from_environment()
    {
        Settings s;
        if (const char *env = std::getenv("IQA_DATA_ROOT"); env && *env)
            s.dataRoot = env;
        if (const char *env = std::getenv("IQA_OUTPUT_ROOT"); env && *env)
            s.outputRoot = env;
        if (const char *env = std::getenv("IQA_DEBUG"); env && *env)
            s.debug = std::string(env) != "0";
        return s;
    }
}
