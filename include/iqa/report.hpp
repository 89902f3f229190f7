#pragma once
#include "iqa/record.hpp"

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace iqa
{
    // count/mean/std/min/quartiles/max of one metric column. stddev is the
    // sample (N-1) deviation; quartiles interpolate linearly. Everything
    // but count is NaN for an empty column (stddev also for a single value).
    struct Describe
    {
        std::size_t count = 0;
        double mean = 0.0;
        double stddev = 0.0;
        double min = 0.0;
        double q25 = 0.0;
        double q50 = 0.0;
        double q75 = 0.0;
        double max = 0.0;
    };

    struct PassFailSummary
    {
        std::size_t total = 0;
        std::size_t passed = 0;
        std::size_t failed = 0;
        double failureRatePct = 0.0; // rounded to 2 decimals, 0 when total == 0
    };

    // Count of rows per (label, status); only statuses that occur are columns.
    struct LabelStatusTable
    {
        std::vector<std::string> labels; // sorted
        std::vector<Status> statuses;    // PASS before FAIL
        std::map<std::pair<std::string, Status>, std::size_t> counts;

        std::size_t at(const std::string &label, Status s) const;
    };

    struct Report
    {
        Describe brightness;
        Describe contrast;
        PassFailSummary summary;

        // FAIL rows only, most frequent first (ties: first seen first).
        // Empty means "none".
        std::vector<std::pair<std::string, std::size_t>> reasonCounts;

        LabelStatusTable byLabel;
    };

    Describe describe(std::vector<double> values);

    // Every record must be classified; throws iqa::Error otherwise.
    Report build_report(const std::vector<ImageRecord> &records);

    void print_head(std::ostream &os, const std::vector<ImageRecord> &records, int rows);
    void print_report(std::ostream &os, const Report &rep);
}
