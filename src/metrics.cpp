#include "iqa/metrics.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace iqa
{
    namespace
    {
        // 16-bit / float inputs are reduced to 8 bits the way imread(IMREAD_COLOR) does
        cv::Mat to_u8(const cv::Mat &img)
        {
            if (img.depth() == CV_8U)
                return img;
            cv::Mat u8;
            if (img.depth() == CV_16U)
                img.convertTo(u8, CV_8U, 1.0 / 256.0);
            else if (img.depth() == CV_32F || img.depth() == CV_64F)
                img.convertTo(u8, CV_8U, 255.0);
            else
                img.convertTo(u8, CV_8U);
            return u8;
        }

        // Single channel, ITU-R 601 luma; alpha is dropped.
        cv::Mat to_gray(const cv::Mat &u8)
        {
            cv::Mat gray;
            switch (u8.channels())
            {
            case 1:
                gray = u8;
                break;
            case 3:
                cv::cvtColor(u8, gray, cv::COLOR_BGR2GRAY);
                break;
            case 4:
                cv::cvtColor(u8, gray, cv::COLOR_BGRA2GRAY);
                break;
            default:
                break;
            }
            return gray;
        }

        std::string read_failure_cause(const std::string &path)
        {
            std::error_code ec;
            const fs::path p(path);
            if (!fs::exists(p, ec))
                return "no such file";
            if (!fs::is_regular_file(p, ec))
                return "not a regular file";
            const auto size = fs::file_size(p, ec);
            if (ec)
                return "cannot stat file (" + ec.message() + ")";
            if (size == 0)
                return "empty file";
            return "cannot decode image data (corrupt or unsupported format)";
        }
    } // namespace (anon)

    bool compute_metrics(const cv::Mat &img, MetricsOutput &out)
    {
        out = MetricsOutput{};
        if (img.empty())
        {
            out.error = "empty image";
            return false;
        }

        cv::Mat gray = to_gray(to_u8(img));
        if (gray.empty())
        {
            out.error = "unsupported channel count " + std::to_string(img.channels());
            return false;
        }

        // meanStdDev divides by N
        cv::Scalar mean, stddev;
        cv::meanStdDev(gray, mean, stddev);
        out.brightness = mean[0];
        out.contrast = stddev[0];
        return true;
    }

    bool extract_metrics(const std::string &path, MetricsOutput &out)
    {
        out = MetricsOutput{};
        cv::Mat img;
        try
        {
            img = cv::imread(path, cv::IMREAD_COLOR);
        }
        catch (const cv::Exception &ex)
        {
            out.error = ex.what();
            return false;
        }

        if (img.empty())
        {
            out.error = read_failure_cause(path);
            return false;
        }

        return compute_metrics(img, out);
    }
}
