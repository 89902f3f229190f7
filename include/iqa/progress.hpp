#pragma once
#include "iqa/config.hpp"
#include "iqa/dataset.hpp"
#include "iqa/report.hpp"

#include <iosfwd>

namespace app::progress
{
    // Build stage: walk settings.dataRoot, measure every sampled image and
    // save <outputRoot>/image_quality.csv. Throws iqa::Error on a bad root,
    // in which case nothing is written.
    iqa::BuildOutput run_build(const iqa::config::Settings &settings, std::ostream &os);

    // Analyze stage: load the dataset table, classify each row, print the
    // report and save <outputRoot>/image_quality_annotated.csv.
    iqa::Report run_analyze(const iqa::config::Settings &settings, std::ostream &os);

} // namespace app::progress
