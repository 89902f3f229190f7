#pragma once
#include <optional>
#include <string>
#include <vector>

namespace iqa
{
    enum class Status
    {
        PASS = 0,
        FAIL = 1
    };

    // Declaration order is the evaluation (and serialization) order.
    enum class FailReason
    {
        TOO_DARK = 0,
        TOO_BRIGHT = 1,
        LOW_CONTRAST = 2
    };

    inline const char *status_to_cstr(Status s)
    {
        return s == Status::FAIL ? "FAIL" : "PASS";
    }

    inline const char *reason_to_cstr(FailReason r)
    {
        switch (r)
        {
        case FailReason::TOO_DARK:     return "too_dark";
        case FailReason::TOO_BRIGHT:   return "too_bright";
        case FailReason::LOW_CONTRAST: return "low_contrast";
        default:                       return "unknown";
        }
    }

    struct Classification
    {
        Status status{Status::PASS};
        std::vector<FailReason> reasons; // empty iff PASS
    };

    // One row per successfully measured image.
    struct ImageRecord
    {
        int imageId{0};
        std::string filepath;
        std::string label;
        double brightness{0.0};
        double contrast{0.0};

        // set once by the classifier
        std::optional<Classification> quality;
    };

    // "too_dark;low_contrast", "" for PASS
    std::string join_reasons(const std::vector<FailReason> &reasons);
}
