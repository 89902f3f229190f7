#pragma once
#include "iqa/config.hpp"
#include "iqa/record.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace iqa
{
    struct BuildOptions
    {
        std::filesystem::path root{config::kDefaultDataRoot};
        int imagesPerClass{config::kImagesPerClass};

        // true: file names sorted per label, false: native listing order
        bool sortFiles{true};
    };

    struct ExtractionFailure
    {
        std::string path;
        std::string cause;
    };

    struct BuildOutput
    {
        std::vector<ImageRecord> records; // ids 0..N-1 in acceptance order
        std::vector<ExtractionFailure> failures;
        std::vector<std::string> labels; // label directories visited, sorted
    };

    // .jpg / .jpeg / .png, case-insensitive
    bool is_eligible_image(const std::filesystem::path &p);

    // Walks <root>/<label>/<file>. Throws iqa::Error when root is missing,
    // not a directory, or imagesPerClass is not positive. Unreadable images
    // are logged, collected in out.failures and skipped.
    BuildOutput build_dataset(const BuildOptions &opt);
}
