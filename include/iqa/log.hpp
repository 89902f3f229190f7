#pragma once
#include <cstdlib>
#include <iostream>
#include <string>

namespace iqa::log
{
    inline bool g_debug = false;

    // Pipeline stage tag ("build", "analyze"); empty outside a stage
    inline std::string g_stage;

    inline void set(bool debug) { g_debug = debug; }
    inline bool debug_enabled() { return g_debug; }

    // IQA_DEBUG set to anything but "0" turns [DBG] lines on
    inline void init_from_env()
    {
        const char *env = std::getenv("IQA_DEBUG");
        g_debug = env && *env && std::string(env) != "0";
    }

    // Tags every line written while alive; restores the outer tag on exit
    class Stage
    {
    public:
        explicit Stage(const std::string &name) : prev_(g_stage) { g_stage = name; }
        ~Stage() { g_stage = prev_; }
        Stage(const Stage &) = delete;
        Stage &operator=(const Stage &) = delete;

    private:
        std::string prev_;
    };

    inline void write(const char *level, const std::string &msg)
    {
        std::cerr << level;
        if (!g_stage.empty())
            std::cerr << " [" << g_stage << "]";
        std::cerr << " " << msg << "\n";
    }

    inline void d(const std::string &msg)
    {
        if (g_debug)
            write("[DBG]", msg);
    }
    inline void i(const std::string &msg) { write("[INF]", msg); }
    inline void w(const std::string &msg) { write("[WRN]", msg); }
    inline void e(const std::string &msg) { write("[ERR]", msg); }
}
