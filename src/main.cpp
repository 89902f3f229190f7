#include "iqa/ansi.hpp"
#include "iqa/app.hpp"

int main()
{
    iqa::ansi::enable_virtual_terminal_on_windows();
    app::Application app;
    return app.run();
}
