#include "iqa/dataset.hpp"
#include "iqa/error.hpp"
#include "iqa/log.hpp"
#include "iqa/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fs = std::filesystem;

namespace iqa
{
    namespace
    {
        std::vector<std::string> list_labels(const fs::path &root)
        {
            std::vector<std::string> labels;
            for (const auto &e : fs::directory_iterator(root))
            {
                std::error_code ec;
                if (e.is_directory(ec))
                    labels.push_back(e.path().filename().string());
            }
            std::sort(labels.begin(), labels.end());
            return labels;
        }

        std::vector<fs::path> list_images(const fs::path &dir, bool sortFiles)
        {
            std::vector<fs::path> files;
            for (const auto &e : fs::directory_iterator(dir))
            {
                std::error_code ec;
                if (!e.is_regular_file(ec))
                    continue;
                if (is_eligible_image(e.path()))
                    files.push_back(e.path());
            }
            if (sortFiles)
            {
                std::sort(files.begin(), files.end(),
                          [](const fs::path &a, const fs::path &b)
                          { return a.filename().string() < b.filename().string(); });
            }
            return files;
        }

        // Measures files[first, first+n). Results are indexed like the input
        // so acceptance below happens in scan order.
        std::vector<MetricsOutput> extract_batch(const std::vector<fs::path> &files,
                                                 std::size_t first, std::size_t n,
                                                 std::vector<char> &ok)
        {
            std::vector<MetricsOutput> outs(n);
            ok.assign(n, 0);
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
            for (int i = 0; i < (int)n; ++i)
                ok[i] = extract_metrics(files[first + i].string(), outs[i]) ? 1 : 0;
            return outs;
        }
    } // namespace (anon)

    bool is_eligible_image(const fs::path &p)
    {
        // suffix match on the whole name, so ".png" itself is eligible
        std::string name = p.filename().string();
        for (auto &c : name)
            c = (char)std::tolower((unsigned char)c);
        const auto ends_with = [&name](const std::string &suffix)
        {
            return name.size() >= suffix.size() &&
                   name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
        };
        return ends_with(".jpg") || ends_with(".jpeg") || ends_with(".png");
    }

    BuildOutput build_dataset(const BuildOptions &opt)
    {
        std::error_code ec;
        if (!fs::exists(opt.root, ec))
            throw Error("dataset root not found: " + opt.root.string());
        if (!fs::is_directory(opt.root, ec))
            throw Error("dataset root is not a directory: " + opt.root.string());
        if (opt.imagesPerClass <= 0)
            throw Error("images per class must be positive, got " +
                        std::to_string(opt.imagesPerClass));

        BuildOutput out;
        try
        {
            out.labels = list_labels(opt.root);
        }
        catch (const fs::filesystem_error &ex)
        {
            throw Error(std::string("cannot list dataset root: ") + ex.what());
        }

        int nextId = 0;
        const std::size_t cap = (std::size_t)opt.imagesPerClass;

        for (const auto &label : out.labels)
        {
            log::i("Processing class: " + label);
            std::vector<fs::path> files;
            try
            {
                files = list_images(opt.root / label, opt.sortFiles);
            }
            catch (const fs::filesystem_error &ex)
            {
                throw Error(std::string("cannot list class directory: ") + ex.what());
            }

            // Each batch holds exactly the remaining quota, so even if every
            // file succeeds the cap is met and no file past the sequential
            // stopping point is touched.
            std::size_t accepted = 0;
            std::size_t next = 0;
            while (accepted < cap && next < files.size())
            {
                const std::size_t n = std::min(cap - accepted, files.size() - next);
                std::vector<char> ok;
                std::vector<MetricsOutput> outs = extract_batch(files, next, n, ok);

                for (std::size_t i = 0; i < n; ++i)
                {
                    const std::string path = files[next + i].string();
                    if (!ok[i])
                    {
                        log::w("Error processing " + path + ": " + outs[i].error);
                        out.failures.push_back({path, outs[i].error});
                        continue;
                    }

                    ImageRecord r;
                    r.imageId = nextId++;
                    r.filepath = path;
                    r.label = label;
                    r.brightness = outs[i].brightness;
                    r.contrast = outs[i].contrast;
                    log::d("#" + std::to_string(r.imageId) + " " + path +
                           " brightness=" + std::to_string(r.brightness) +
                           " contrast=" + std::to_string(r.contrast));
                    out.records.push_back(std::move(r));
                    ++accepted;
                }
                next += n;
            }
        }
        return out;
    }
}
