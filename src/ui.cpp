#include "iqa/ui.hpp"
#include "iqa/app.hpp"
#include "iqa/ansi.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace app::ui
{

    static const char *kMenu = R"MENU(
Choose an option:

  1) Input: Set dataset root folder
  2) Settings: Debug logs / file order / images per class
  3) Help: How to use
  4) About
  5) Build: Measure images -> dataset table
  6) Analyze: Classify & report -> annotated table
  7) Run: Build + Analyze
  0) Exit
)MENU";

    std::string trim(std::string s)
    {
        const auto sp = [](unsigned char c)
        { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
        std::size_t a = 0;
        while (a < s.size() && sp((unsigned char)s[a]))
            ++a;
        std::size_t b = s.size();
        while (b > a && sp((unsigned char)s[b - 1]))
            --b;
        return s.substr(a, b - a);
    }

    std::string read_line(const std::string &prompt)
    {
        std::cout << iqa::ansi::info << prompt << iqa::ansi::reset;
        std::string s;
        std::getline(std::cin, s);
        return s;
    }

    void title(const std::string &t)
    {
        iqa::ansi::clear_screen();
        std::cout << iqa::ansi::title << iqa::ansi::bold << t << iqa::ansi::reset << "\n";
        std::cout << iqa::ansi::muted << std::string(t.size(), '=') << iqa::ansi::reset << "\n\n";
    }

    void main_menu(const app::State &s)
    {
        const auto &cfg = s.settings;
        title("Image Quality Audit (TUI)");
        std::cout << kMenu << "\n";
        std::cout << iqa::ansi::muted
                  << "Dataset root: " << cfg.dataRoot.string()
                  << (s.hasValidRoot ? "" : "  (not found)")
                  << iqa::ansi::reset << "\n";
        std::cout << iqa::ansi::muted
                  << "Output: " << cfg.datasetTable().string() << ", "
                  << cfg.annotatedTable().string()
                  << iqa::ansi::reset << "\n";
        std::cout << iqa::ansi::muted
                  << "Images per class: " << cfg.imagesPerClass
                  << ", Debug: " << (cfg.debug ? "ON" : "OFF")
                  << ", File order: " << (cfg.sortFiles ? "sorted" : "directory")
                  << iqa::ansi::reset << "\n\n";
    }

    void help()
    {
        title("Help");
        std::cout
            << "- Point option 1 at a folder laid out as <root>/<label>/<images>.\n"
            << "  Only .jpg, .jpeg and .png files are measured.\n"
            << "- Build (5) writes Image_ID,Filepath,Label,Brightness,Contrast.\n"
            << "- Analyze (6) applies the limits below and adds Status,Fail_Reasons:\n"
            << "    brightness < " << iqa::config::kBrightnessMin << "  -> too_dark\n"
            << "    brightness > " << iqa::config::kBrightnessMax << " -> too_bright\n"
            << "    contrast   < " << iqa::config::kContrastMin << "  -> low_contrast\n"
            << "- IQA_DATA_ROOT, IQA_OUTPUT_ROOT and IQA_DEBUG=1 override the defaults.\n\n";
        wait_for_enter();
    }

    void about()
    {
        title("About");
        std::cout
            << "Offline brightness/contrast audit of a labeled image corpus.\n"
            << "Uses OpenCV for decoding and grayscale statistics.\n\n";
        wait_for_enter();
    }

    void wait_for_enter(const std::string &prompt)
    {
        std::cout << iqa::ansi::muted << prompt << iqa::ansi::reset;
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    int read_menu_choice()
    {
        std::cout << "Select (0-7): ";
        std::string line;
        std::getline(std::cin, line);
        line = trim(line);
        if (line.empty())
            return -1;
        for (char ch : line)
            if (!std::isdigit((unsigned char)ch))
                return -1;
        try
        {
            return std::stoi(line);
        }
        catch (const std::out_of_range &)
        {
            return -1;
        }
    }

    bool validate_root(app::State &s, const std::string &pathStr)
    {
        const fs::path p = trim(pathStr);
        std::error_code ec;
        if (p.empty() || !fs::is_directory(p, ec))
        {
            s.hasValidRoot = false;
            return false;
        }
        s.settings.dataRoot = fs::absolute(p, ec);
        if (ec)
            s.settings.dataRoot = p;
        s.hasValidRoot = true;
        return true;
    }

    void input(app::State &s)
    {
        title("Input");
        std::cout << "Provide the dataset root folder (one sub-folder per label).\n\n";
        std::cout << iqa::ansi::muted
                  << "Examples:\n"
                     "  seg_train/seg_train\n"
                     "  /home/you/datasets/intel/seg_train/seg_train\n"
                  << iqa::ansi::reset << "\n";

        const std::string path = read_line("Root> ");
        if (!std::cin.good())
            return;

        if (validate_root(s, path))
        {
            std::cout << iqa::ansi::ok << "[OK] Dataset root: " << s.settings.dataRoot.string()
                      << iqa::ansi::reset << "\n";
        }
        else
        {
            std::cout << iqa::ansi::err << "[X] Not a directory. Please try again."
                      << iqa::ansi::reset << "\n";
        }
        std::cout << "\n";
        wait_for_enter();
    }

    void settings(app::State &s)
    {
        auto &cfg = s.settings;
        title("Settings");
        std::cout
            << "Toggle options (type number):\n"
            << "  1) Debug logs: " << (cfg.debug ? "ON" : "OFF") << "\n"
            << "  2) File order: " << (cfg.sortFiles ? "sorted by name" : "directory order") << "\n"
            << "  3) Images per class: " << cfg.imagesPerClass << "\n"
            << "  0) Back\n\n";
        std::cout << "Select: ";
        std::string line;
        std::getline(std::cin, line);
        line = trim(line);
        if (line == "1")
            cfg.debug = !cfg.debug;
        else if (line == "2")
            cfg.sortFiles = !cfg.sortFiles;
        else if (line == "3")
        {
            const std::string v = trim(read_line("Images per class> "));
            int n = 0;
            try
            {
                n = std::stoi(v);
            }
            catch (const std::logic_error &)
            {
                n = 0;
            }
            if (n > 0)
                cfg.imagesPerClass = n;
            else
            {
                std::cout << iqa::ansi::warn << "Must be a positive number." << iqa::ansi::reset << "\n";
                wait_for_enter();
            }
        }
    }

} // namespace app::ui
