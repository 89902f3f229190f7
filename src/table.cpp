#include "iqa/table.hpp"
#include "iqa/error.hpp"

#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace iqa::table
{
    namespace
    {
        void write_common(std::ostream &os, const ImageRecord &r)
        {
            os << r.imageId << ","
               << escape_field(r.filepath) << ","
               << escape_field(r.label) << ","
               << format_metric(r.brightness) << ","
               << format_metric(r.contrast);
        }

        template <typename WriteFn>
        void save_atomically(const fs::path &path, WriteFn write)
        {
            std::error_code ec;
            if (path.has_parent_path())
                fs::create_directories(path.parent_path(), ec);

            fs::path tmp = path;
            tmp += ".tmp";
            {
                std::ofstream os(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
                if (!os.is_open())
                    throw Error("cannot open for writing: " + tmp.string());
                write(os);
                os.flush();
                if (!os)
                {
                    os.close();
                    fs::remove(tmp, ec);
                    throw Error("write failed: " + tmp.string());
                }
            }
            fs::rename(tmp, path, ec);
            if (ec)
            {
                std::error_code ignore;
                fs::remove(tmp, ignore);
                throw Error("cannot replace " + path.string() + ": " + ec.message());
            }
        }

        bool parse_int(const std::string &s, int &v)
        {
            try
            {
                std::size_t used = 0;
                v = std::stoi(s, &used);
                return used == s.size() && v >= 0;
            }
            catch (const std::logic_error &)
            {
                return false;
            }
        }

        bool parse_double(const std::string &s, double &v)
        {
            std::istringstream in(s);
            in.imbue(std::locale::classic());
            in >> v;
            return !s.empty() && !in.fail() && in.peek() == std::char_traits<char>::eof();
        }
    } // namespace (anon)

    std::string escape_field(const std::string &field)
    {
        if (field.find_first_of(",\"\r\n") == std::string::npos)
            return field;
        std::string out = "\"";
        for (char c : field)
        {
            if (c == '"')
                out += '"';
            out += c;
        }
        out += '"';
        return out;
    }

    bool split_line(const std::string &line, std::vector<std::string> &fields)
    {
        fields.clear();
        std::string cur;
        bool quoted = false;
        for (std::size_t i = 0; i < line.size(); ++i)
        {
            const char c = line[i];
            if (quoted)
            {
                if (c == '"')
                {
                    if (i + 1 < line.size() && line[i + 1] == '"')
                    {
                        cur += '"';
                        ++i;
                    }
                    else
                        quoted = false;
                }
                else
                    cur += c;
            }
            else if (c == '"')
                quoted = true;
            else if (c == ',')
            {
                fields.push_back(cur);
                cur.clear();
            }
            else
                cur += c;
        }
        fields.push_back(cur);
        return !quoted;
    }

    std::string format_metric(double v)
    {
        // shortest of 15..17 significant digits that reads back exactly
        for (int prec = 15; prec <= 17; ++prec)
        {
            std::ostringstream os;
            os.imbue(std::locale::classic());
            os << std::setprecision(prec) << v;
            double back = 0.0;
            if (parse_double(os.str(), back) && back == v)
                return os.str();
        }
        std::ostringstream os;
        os.imbue(std::locale::classic());
        os << std::setprecision(17) << v;
        return os.str();
    }

    void write_dataset(std::ostream &os, const std::vector<ImageRecord> &records)
    {
        os << kDatasetHeader << "\n";
        for (const auto &r : records)
        {
            write_common(os, r);
            os << "\n";
        }
    }

    void write_annotated(std::ostream &os, const std::vector<ImageRecord> &records)
    {
        os << kAnnotatedHeader << "\n";
        for (const auto &r : records)
        {
            if (!r.quality)
                throw Error("record " + std::to_string(r.imageId) + " has not been classified");
            write_common(os, r);
            os << "," << status_to_cstr(r.quality->status)
               << "," << escape_field(join_reasons(r.quality->reasons)) << "\n";
        }
    }

    void save_dataset(const fs::path &path, const std::vector<ImageRecord> &records)
    {
        save_atomically(path, [&](std::ostream &os)
                        { write_dataset(os, records); });
    }

    void save_annotated(const fs::path &path, const std::vector<ImageRecord> &records)
    {
        // validate before anything touches the disk
        for (const auto &r : records)
            if (!r.quality)
                throw Error("record " + std::to_string(r.imageId) + " has not been classified");
        save_atomically(path, [&](std::ostream &os)
                        { write_annotated(os, records); });
    }

    std::vector<ImageRecord> read_dataset(std::istream &is)
    {
        std::string line;
        if (!std::getline(is, line))
            throw Error("dataset table is empty");
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line != kDatasetHeader)
            throw Error("unexpected dataset header: '" + line + "'");

        std::vector<ImageRecord> records;
        std::vector<std::string> f;
        int lineNo = 1;
        while (std::getline(is, line))
        {
            ++lineNo;
            if (line.empty() || line == "\r")
                continue;

            const std::string where = "dataset table line " + std::to_string(lineNo);

            // A quoted field may span physical lines. A trailing CR is a
            // line terminator only once every quote is closed.
            for (;;)
            {
                std::string record = line;
                if (!record.empty() && record.back() == '\r')
                    record.pop_back();
                if (split_line(record, f))
                    break;

                std::string more;
                if (!std::getline(is, more))
                    throw Error(where + ": unterminated quote");
                ++lineNo;
                line += '\n';
                line += more;
            }
            if (f.size() != 5)
                throw Error(where + ": expected 5 fields, got " + std::to_string(f.size()));

            ImageRecord r;
            if (!parse_int(f[0], r.imageId))
                throw Error(where + ": bad Image_ID '" + f[0] + "'");
            r.filepath = f[1];
            r.label = f[2];
            if (!parse_double(f[3], r.brightness))
                throw Error(where + ": bad Brightness '" + f[3] + "'");
            if (!parse_double(f[4], r.contrast))
                throw Error(where + ": bad Contrast '" + f[4] + "'");
            records.push_back(std::move(r));
        }
        return records;
    }

    std::vector<ImageRecord> load_dataset(const fs::path &path)
    {
        std::ifstream is(path, std::ios::in | std::ios::binary);
        if (!is.is_open())
            throw Error("dataset table not found: " + path.string());
        return read_dataset(is);
    }
}
