#pragma once
#include <string>

// Only reference app::State here; it's defined in app.hpp
namespace app
{
    struct State;
}

namespace app::ui
{

    // ---- High-level UI ----
    void title(const std::string &t);
    void main_menu(const app::State &s);
    void help();
    void about();

    void wait_for_enter(const std::string &prompt = "Press Enter to continue...");

    // Menu choice from stdin; -1 for anything that is not a number
    int read_menu_choice();

    // ---- Input & validation ----
    std::string trim(std::string s);
    std::string read_line(const std::string &prompt);

    // Accepts an existing directory; stores its absolute path as the dataset root
    bool validate_root(app::State &s, const std::string &pathStr);

    // "Input" view: set the dataset root
    void input(app::State &s);

    // Toggle debug logs / file ordering, change the per-class cap
    void settings(app::State &s);

} // namespace app::ui
