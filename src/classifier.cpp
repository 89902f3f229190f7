#include "iqa/classifier.hpp"

namespace iqa
{
    std::string join_reasons(const std::vector<FailReason> &reasons)
    {
        std::string out;
        for (std::size_t i = 0; i < reasons.size(); ++i)
        {
            if (i > 0)
                out += ';';
            out += reason_to_cstr(reasons[i]);
        }
        return out;
    }

    Classification classify(double brightness, double contrast, const QualityLimits &limits)
    {
        Classification c;
        if (brightness < limits.brightnessMin)
            c.reasons.push_back(FailReason::TOO_DARK);
        if (brightness > limits.brightnessMax)
            c.reasons.push_back(FailReason::TOO_BRIGHT);
        if (contrast < limits.contrastMin)
            c.reasons.push_back(FailReason::LOW_CONTRAST);

        c.status = c.reasons.empty() ? Status::PASS : Status::FAIL;
        return c;
    }

    void classify_all(std::vector<ImageRecord> &records, const QualityLimits &limits)
    {
        for (auto &r : records)
        {
            if (r.quality)
                continue; // already classified, keep it
            r.quality = classify(r.brightness, r.contrast, limits);
        }
    }
}
