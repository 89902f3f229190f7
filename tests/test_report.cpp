#include "iqa/classifier.hpp"
#include "iqa/error.hpp"
#include "iqa/report.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <sstream>

using namespace iqa;

namespace
{
    ImageRecord row(int id, const std::string &label, double b, double c)
    {
        ImageRecord r;
        r.imageId = id;
        r.filepath = "root/" + label + "/" + std::to_string(id) + ".jpg";
        r.label = label;
        r.brightness = b;
        r.contrast = c;
        return r;
    }

    std::vector<ImageRecord> classified(std::vector<ImageRecord> rows)
    {
        classify_all(rows);
        return rows;
    }
}

TEST(Describe, QuartilesInterpolateLinearly)
{
    const Describe d = describe({4.0, 1.0, 3.0, 2.0});
    EXPECT_EQ(d.count, 4u);
    EXPECT_DOUBLE_EQ(d.mean, 2.5);
    EXPECT_NEAR(d.stddev, std::sqrt(5.0 / 3.0), 1e-12);
    EXPECT_DOUBLE_EQ(d.min, 1.0);
    EXPECT_DOUBLE_EQ(d.q25, 1.75);
    EXPECT_DOUBLE_EQ(d.q50, 2.5);
    EXPECT_DOUBLE_EQ(d.q75, 3.25);
    EXPECT_DOUBLE_EQ(d.max, 4.0);
}

TEST(Describe, SingleValueHasUndefinedStd)
{
    const Describe d = describe({42.0});
    EXPECT_EQ(d.count, 1u);
    EXPECT_DOUBLE_EQ(d.mean, 42.0);
    EXPECT_TRUE(std::isnan(d.stddev));
    EXPECT_DOUBLE_EQ(d.q25, 42.0);
    EXPECT_DOUBLE_EQ(d.max, 42.0);
}

TEST(Describe, EmptyColumn)
{
    const Describe d = describe({});
    EXPECT_EQ(d.count, 0u);
    EXPECT_TRUE(std::isnan(d.mean));
    EXPECT_TRUE(std::isnan(d.min));
    EXPECT_TRUE(std::isnan(d.max));
}

TEST(Report, CountsAndFailureRate)
{
    const auto rows = classified({
        row(0, "forest", 120, 40),
        row(1, "forest", 30, 10),
        row(2, "sea", 220, 50),
    });
    const Report rep = build_report(rows);

    EXPECT_EQ(rep.summary.total, 3u);
    EXPECT_EQ(rep.summary.passed, 1u);
    EXPECT_EQ(rep.summary.failed, 2u);
    EXPECT_EQ(rep.summary.passed + rep.summary.failed, rep.summary.total);
    EXPECT_DOUBLE_EQ(rep.summary.failureRatePct, 66.67);
    EXPECT_EQ(rep.brightness.count, 3u);
    EXPECT_DOUBLE_EQ(rep.brightness.max, 220.0);
    EXPECT_DOUBLE_EQ(rep.contrast.min, 10.0);
}

TEST(Report, EmptyCollectionIsNotAnError)
{
    const Report rep = build_report({});
    EXPECT_EQ(rep.summary.total, 0u);
    EXPECT_EQ(rep.summary.failed, 0u);
    EXPECT_DOUBLE_EQ(rep.summary.failureRatePct, 0.0);
    EXPECT_TRUE(rep.reasonCounts.empty());
    EXPECT_TRUE(rep.byLabel.labels.empty());
    EXPECT_TRUE(rep.byLabel.statuses.empty());
}

TEST(Report, ReasonCombinationsCountFailuresOnly)
{
    const auto rows = classified({
        row(0, "a", 30, 10),  // too_dark;low_contrast
        row(1, "a", 220, 50), // too_bright
        row(2, "b", 30, 5),   // too_dark;low_contrast
        row(3, "b", 100, 40), // pass
        row(4, "b", 50, 40),  // too_dark
        row(5, "c", 240, 60), // too_bright
        row(6, "c", 35, 2),   // too_dark;low_contrast
    });
    const Report rep = build_report(rows);

    ASSERT_EQ(rep.reasonCounts.size(), 3u);
    EXPECT_EQ(rep.reasonCounts[0].first, "too_dark;low_contrast");
    EXPECT_EQ(rep.reasonCounts[0].second, 3u);
    // tie broken by first appearance
    EXPECT_EQ(rep.reasonCounts[1].first, "too_bright");
    EXPECT_EQ(rep.reasonCounts[1].second, 2u);
    EXPECT_EQ(rep.reasonCounts[2].first, "too_dark");
    EXPECT_EQ(rep.reasonCounts[2].second, 1u);
}

TEST(Report, AllPassMeansNoReasons)
{
    const auto rows = classified({row(0, "a", 100, 40), row(1, "b", 150, 60)});
    const Report rep = build_report(rows);
    EXPECT_TRUE(rep.reasonCounts.empty());
    EXPECT_DOUBLE_EQ(rep.summary.failureRatePct, 0.0);
    ASSERT_EQ(rep.byLabel.statuses.size(), 1u);
    EXPECT_EQ(rep.byLabel.statuses[0], Status::PASS);

    std::ostringstream os;
    print_report(os, rep);
    EXPECT_NE(os.str().find("No failed images"), std::string::npos);
    EXPECT_NE(os.str().find("Failure rate: 0.00%"), std::string::npos);
}

TEST(Report, LabelStatusTableIsZeroFilled)
{
    const auto rows = classified({
        row(0, "street", 100, 40),
        row(1, "forest", 30, 10),
        row(2, "forest", 100, 40),
        row(3, "mountain", 30, 10),
    });
    const Report rep = build_report(rows);
    const auto &t = rep.byLabel;

    ASSERT_EQ(t.labels.size(), 3u);
    EXPECT_EQ(t.labels[0], "forest");
    EXPECT_EQ(t.labels[1], "mountain");
    EXPECT_EQ(t.labels[2], "street");
    ASSERT_EQ(t.statuses.size(), 2u);
    EXPECT_EQ(t.statuses[0], Status::PASS);
    EXPECT_EQ(t.statuses[1], Status::FAIL);

    EXPECT_EQ(t.at("forest", Status::PASS), 1u);
    EXPECT_EQ(t.at("forest", Status::FAIL), 1u);
    EXPECT_EQ(t.at("mountain", Status::PASS), 0u);
    EXPECT_EQ(t.at("mountain", Status::FAIL), 1u);
    EXPECT_EQ(t.at("street", Status::FAIL), 0u);
}

TEST(Report, UnclassifiedRowIsRejected)
{
    EXPECT_THROW(build_report({row(0, "a", 100, 40)}), iqa::Error);
}

TEST(Report, PrintedSummaryUsesTwoDecimals)
{
    const auto rows = classified({row(0, "a", 30, 10), row(1, "a", 100, 40), row(2, "a", 100, 40)});
    std::ostringstream os;
    print_report(os, build_report(rows));
    const std::string s = os.str();
    EXPECT_NE(s.find("Total images: 3"), std::string::npos);
    EXPECT_NE(s.find("Failure rate: 33.33%"), std::string::npos);
    EXPECT_NE(s.find("too_dark;low_contrast"), std::string::npos);
}

TEST(Report, HeadShowsFirstRowsOnly)
{
    std::vector<ImageRecord> rows;
    for (int i = 0; i < 8; ++i)
        rows.push_back(row(i, "a", 100, 40));
    std::ostringstream os;
    print_head(os, rows, 5);
    const std::string s = os.str();
    EXPECT_EQ(s.rfind("Image_ID,Filepath,Label,Brightness,Contrast\n", 0), 0u);
    EXPECT_NE(s.find("\n4,root/a/4.jpg,a,100,40\n"), std::string::npos);
    EXPECT_EQ(s.find("root/a/5.jpg"), std::string::npos);
    EXPECT_NE(s.find("3 more rows"), std::string::npos);
}
