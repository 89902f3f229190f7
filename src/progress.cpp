#include "iqa/progress.hpp"
#include "iqa/ansi.hpp"
#include "iqa/classifier.hpp"
#include "iqa/log.hpp"
#include "iqa/table.hpp"

#include <chrono>
#include <iomanip>
#include <ostream>

namespace
{
    using clock_type = std::chrono::steady_clock;

    long long elapsed_ms(clock_type::time_point t0)
    {
        using std::chrono::duration_cast;
        using std::chrono::milliseconds;
        return duration_cast<milliseconds>(clock_type::now() - t0).count();
    }
} // namespace

namespace app::progress
{

    iqa::BuildOutput run_build(const iqa::config::Settings &settings, std::ostream &os)
    {
        iqa::log::set(settings.debug);
        iqa::log::Stage stage("build");

        iqa::BuildOptions opt;
        opt.root = settings.dataRoot;
        opt.imagesPerClass = settings.imagesPerClass;
        opt.sortFiles = settings.sortFiles;

        os << iqa::ansi::title << "Building quality dataset from " << opt.root.string()
           << iqa::ansi::reset << "\n";
        os << iqa::ansi::muted << "Up to " << opt.imagesPerClass << " image(s) per class, "
           << (opt.sortFiles ? "sorted by file name" : "directory order")
           << iqa::ansi::reset << "\n\n";

        const auto t0 = clock_type::now();
        iqa::BuildOutput out = iqa::build_dataset(opt);
        const long long build_ms = elapsed_ms(t0);

        const auto csvPath = settings.datasetTable();
        iqa::table::save_dataset(csvPath, out.records);

        const std::size_t n = out.records.size();
        const double avg_ms = (n > 0) ? (double)build_ms / (double)n : 0.0;

        os << iqa::ansi::bold << "Finished! Saved " << n << " rows to " << csvPath.string()
           << iqa::ansi::reset << "\n";
        os << iqa::ansi::muted << out.labels.size() << " class(es), "
           << out.failures.size() << " unreadable image(s) skipped, "
           << "Total: " << build_ms << " ms, "
           << "Avg: " << std::fixed << std::setprecision(1) << avg_ms << " ms/img"
           << iqa::ansi::reset << "\n";
        for (const auto &f : out.failures)
            os << iqa::ansi::warn << "  skipped " << f.path << ": " << f.cause
               << iqa::ansi::reset << "\n";
        os << "\n";
        return out;
    }

    iqa::Report run_analyze(const iqa::config::Settings &settings, std::ostream &os)
    {
        iqa::log::set(settings.debug);
        iqa::log::Stage stage("analyze");

        const auto inPath = settings.datasetTable();
        os << "Loading data from " << inPath.string() << " ...\n";
        std::vector<iqa::ImageRecord> records = iqa::table::load_dataset(inPath);
        iqa::log::d("loaded " + std::to_string(records.size()) + " row(s)");

        os << "First few rows of data:\n";
        iqa::print_head(os, records, iqa::config::kHeadRows);
        os << "\n";

        iqa::classify_all(records);
        iqa::Report rep = iqa::build_report(records);
        iqa::print_report(os, rep);

        const auto outPath = settings.annotatedTable();
        iqa::table::save_annotated(outPath, records);
        os << iqa::ansi::ok << "Annotated data saved to " << outPath.string()
           << iqa::ansi::reset << "\n";
        return rep;
    }

} // namespace app::progress
