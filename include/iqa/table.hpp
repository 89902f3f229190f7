#pragma once
#include "iqa/record.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace iqa::table
{
    // Column contracts of the two persisted tables
    inline constexpr const char *kDatasetHeader = "Image_ID,Filepath,Label,Brightness,Contrast";
    inline constexpr const char *kAnnotatedHeader =
        "Image_ID,Filepath,Label,Brightness,Contrast,Status,Fail_Reasons";

    // Quotes only when the field holds ',', '"', CR or LF.
    std::string escape_field(const std::string &field);

    // Splits one CSV line; returns false on an unterminated quote.
    bool split_line(const std::string &line, std::vector<std::string> &fields);

    // Round-trip decimal form of a metric value
    std::string format_metric(double v);

    void write_dataset(std::ostream &os, const std::vector<ImageRecord> &records);
    void write_annotated(std::ostream &os, const std::vector<ImageRecord> &records);

    // Write to "<path>.tmp" then rename over <path>. Throws iqa::Error.
    void save_dataset(const std::filesystem::path &path, const std::vector<ImageRecord> &records);
    void save_annotated(const std::filesystem::path &path, const std::vector<ImageRecord> &records);

    // Reads the intermediate table. Throws iqa::Error on a missing file,
    // wrong header or malformed row (message names the line number).
    std::vector<ImageRecord> read_dataset(std::istream &is);
    std::vector<ImageRecord> load_dataset(const std::filesystem::path &path);
}
