#include <iostream> // for std::cout
#include "iqa/app.hpp"
#include "iqa/ui.hpp"
#include "iqa/ansi.hpp"
#include "iqa/error.hpp"
#include "iqa/progress.hpp"

namespace app
{

    int Application::run()
    {
        state_.hasValidRoot = ui::validate_root(state_, state_.settings.dataRoot.string());
        return main_loop();
    }

    void Application::run_stage(int choice)
    {
        iqa::ansi::clear_screen();
        try
        {
            if (choice == 5 || choice == 7)
                progress::run_build(state_.settings, std::cout);
            if (choice == 6 || choice == 7)
                progress::run_analyze(state_.settings, std::cout);
        }
        catch (const iqa::Error &ex)
        {
            std::cout << iqa::ansi::err << "[X] " << ex.what() << iqa::ansi::reset << "\n";
        }
        std::cout << "\n";
        ui::wait_for_enter();
    }

    int Application::main_loop()
    {
        for (;;)
        {
            ui::main_menu(state_);
            const int choice = ui::read_menu_choice();
            if (!std::cin.good())
                return 0;

            switch (choice)
            {
            case 1:
                ui::input(state_);
                break;
            case 2:
                ui::settings(state_);
                break;
            case 3:
                ui::help();
                break;
            case 4:
                ui::about();
                break;
            case 5: // build
            case 6: // analyze
            case 7: // both
                run_stage(choice);
                break;
            case 0:
                iqa::ansi::clear_screen();
                std::cout << iqa::ansi::muted << "Bye! " << iqa::ansi::reset << "\n";
                return 0;

            default:
                std::cout << iqa::ansi::warn << "Invalid choice." << iqa::ansi::reset << "\n";
            }
        }
    }

} // namespace app
