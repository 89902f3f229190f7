#pragma once
#include <opencv2/core.hpp>
#include <string>

namespace iqa
{
    struct MetricsOutput
    {
        double brightness = 0.0; // mean gray level, [0, 255]
        double contrast = 0.0;   // population std-dev of gray levels

        // cause, set when extraction fails
        std::string error;
    };

    // Metrics of an already decoded image (1, 3 or 4 channels, any depth
    // cv::imread can produce). Returns false for an empty image.
    bool compute_metrics(const cv::Mat &img, MetricsOutput &out);

    // Load + measure one image file. Never throws for I/O or decode
    // problems; returns false and fills out.error instead.
    bool extract_metrics(const std::string &path, MetricsOutput &out);
}
