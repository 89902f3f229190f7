#include "iqa/report.hpp"
#include "iqa/ansi.hpp"
#include "iqa/error.hpp"
#include "iqa/table.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <ostream>
#include <set>

namespace iqa
{
    namespace
    {
        constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

        // linear interpolation between closest ranks; v is sorted
        double quantile(const std::vector<double> &v, double q)
        {
            const double pos = q * (double)(v.size() - 1);
            const std::size_t lo = (std::size_t)std::floor(pos);
            const std::size_t hi = std::min(lo + 1, v.size() - 1);
            const double frac = pos - (double)lo;
            return v[lo] + (v[hi] - v[lo]) * frac;
        }

        void print_describe(std::ostream &os, const Describe &d)
        {
            const auto row = [&os](const char *name, double v)
            {
                os << std::left << std::setw(8) << name << std::right
                   << std::setw(14) << std::fixed << std::setprecision(6) << v << "\n";
            };
            row("count", (double)d.count);
            row("mean", d.mean);
            row("std", d.stddev);
            row("min", d.min);
            row("25%", d.q25);
            row("50%", d.q50);
            row("75%", d.q75);
            row("max", d.max);
        }
    } // namespace (anon)

    std::size_t LabelStatusTable::at(const std::string &label, Status s) const
    {
        auto it = counts.find({label, s});
        return it == counts.end() ? 0 : it->second;
    }

    Describe describe(std::vector<double> values)
    {
        Describe d;
        d.count = values.size();
        if (values.empty())
        {
            d.mean = d.stddev = d.min = d.q25 = d.q50 = d.q75 = d.max = kNaN;
            return d;
        }

        std::sort(values.begin(), values.end());
        double sum = 0.0;
        for (double v : values)
            sum += v;
        d.mean = sum / (double)d.count;

        if (d.count > 1)
        {
            double ss = 0.0;
            for (double v : values)
                ss += (v - d.mean) * (v - d.mean);
            d.stddev = std::sqrt(ss / (double)(d.count - 1));
        }
        else
            d.stddev = kNaN;

        d.min = values.front();
        d.max = values.back();
        d.q25 = quantile(values, 0.25);
        d.q50 = quantile(values, 0.50);
        d.q75 = quantile(values, 0.75);
        return d;
    }

    Report build_report(const std::vector<ImageRecord> &records)
    {
        Report rep;

        std::vector<double> bright, contrast;
        bright.reserve(records.size());
        contrast.reserve(records.size());

        std::vector<std::string> reasonOrder; // first-seen order
        std::map<std::string, std::size_t> reasonTally;
        std::set<std::string> labels;
        bool seen[2] = {false, false};

        for (const auto &r : records)
        {
            if (!r.quality)
                throw Error("record " + std::to_string(r.imageId) + " has not been classified");

            bright.push_back(r.brightness);
            contrast.push_back(r.contrast);

            const Status st = r.quality->status;
            ++rep.summary.total;
            if (st == Status::FAIL)
            {
                ++rep.summary.failed;
                const std::string key = join_reasons(r.quality->reasons);
                if (reasonTally[key]++ == 0)
                    reasonOrder.push_back(key);
            }
            else
                ++rep.summary.passed;

            labels.insert(r.label);
            seen[(int)st] = true;
            ++rep.byLabel.counts[{r.label, st}];
        }

        rep.brightness = describe(std::move(bright));
        rep.contrast = describe(std::move(contrast));

        if (rep.summary.total > 0)
        {
            const double pct = 100.0 * (double)rep.summary.failed / (double)rep.summary.total;
            rep.summary.failureRatePct = std::round(pct * 100.0) / 100.0;
        }

        for (const auto &key : reasonOrder)
            rep.reasonCounts.emplace_back(key, reasonTally[key]);
        std::stable_sort(rep.reasonCounts.begin(), rep.reasonCounts.end(),
                         [](const auto &a, const auto &b)
                         { return a.second > b.second; });

        rep.byLabel.labels.assign(labels.begin(), labels.end());
        if (seen[(int)Status::PASS])
            rep.byLabel.statuses.push_back(Status::PASS);
        if (seen[(int)Status::FAIL])
            rep.byLabel.statuses.push_back(Status::FAIL);
        return rep;
    }

    void print_head(std::ostream &os, const std::vector<ImageRecord> &records, int rows)
    {
        os << table::kDatasetHeader << "\n";
        const std::size_t n = std::min(records.size(), (std::size_t)std::max(rows, 0));
        for (std::size_t i = 0; i < n; ++i)
        {
            const auto &r = records[i];
            os << r.imageId << "," << table::escape_field(r.filepath) << ","
               << table::escape_field(r.label) << ","
               << table::format_metric(r.brightness) << ","
               << table::format_metric(r.contrast) << "\n";
        }
        if (records.size() > n)
            os << ansi::muted << "... (" << records.size() - n << " more rows)" << ansi::reset << "\n";
    }

    void print_report(std::ostream &os, const Report &rep)
    {
        const auto flags = os.flags();
        const auto prec = os.precision();

        ansi::heading(os, "Brightness statistics");
        print_describe(os, rep.brightness);
        os << "\n";

        ansi::heading(os, "Contrast statistics");
        print_describe(os, rep.contrast);
        os << "\n";

        os << "Total images: " << rep.summary.total << "\n"
           << ansi::ok << "Passed: " << rep.summary.passed << ansi::reset << "\n"
           << ansi::err << "Failed: " << rep.summary.failed << ansi::reset << "\n"
           << ansi::bold << "Failure rate: " << std::fixed << std::setprecision(2)
           << rep.summary.failureRatePct << "%" << ansi::reset << "\n\n";

        if (rep.reasonCounts.empty())
        {
            os << ansi::muted << "No failed images, so no failure reasons to show."
               << ansi::reset << "\n\n";
        }
        else
        {
            ansi::heading(os, "Failure reasons breakdown (combinations)");
            std::size_t w = 0;
            for (const auto &rc : rep.reasonCounts)
                w = std::max(w, rc.first.size());
            for (const auto &rc : rep.reasonCounts)
                os << std::left << std::setw((int)w + 2) << rc.first << std::right
                   << rc.second << "\n";
            os << "\n";
        }

        ansi::heading(os, "Pass/Fail by label");
        const auto &t = rep.byLabel;
        std::size_t lw = 5; // "Label"
        for (const auto &l : t.labels)
            lw = std::max(lw, l.size());
        os << std::left << std::setw((int)lw + 2) << "Label" << std::right;
        for (Status s : t.statuses)
            os << std::setw(8) << status_to_cstr(s);
        os << "\n";
        for (const auto &l : t.labels)
        {
            os << std::left << std::setw((int)lw + 2) << l << std::right;
            for (Status s : t.statuses)
                os << std::setw(8) << t.at(l, s);
            os << "\n";
        }
        os << "\n";

        os.flags(flags);
        os.precision(prec);
    }
}
