#pragma once
#include "iqa/config.hpp"
#include "iqa/record.hpp"

#include <vector>

namespace iqa
{
    // Inclusive pass band: a value equal to a limit passes.
    struct QualityLimits
    {
        double brightnessMin = config::kBrightnessMin;
        double brightnessMax = config::kBrightnessMax;
        double contrastMin = config::kContrastMin;
    };

    // All rules are evaluated; reasons accumulate in FailReason order.
    Classification classify(double brightness, double contrast,
                            const QualityLimits &limits = QualityLimits{});

    // Fills record.quality for rows not yet classified; metrics/ids are
    // left untouched.
    void classify_all(std::vector<ImageRecord> &records,
                      const QualityLimits &limits = QualityLimits{});
}
