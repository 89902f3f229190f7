#pragma once
#include "iqa/config.hpp"

namespace app
{
    struct State
    {
        iqa::config::Settings settings{iqa::config::from_environment()};
        bool hasValidRoot{false};
    };

    class Application
    {
    public:
        int run();

    private:
        State state_{};
        int main_loop();
        void run_stage(int choice);
    };
}
