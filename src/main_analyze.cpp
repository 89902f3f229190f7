#include <iostream>
#include "iqa/config.hpp"
#include "iqa/log.hpp"
#include "iqa/progress.hpp"

// Analyze stage: image_quality.csv -> report + image_quality_annotated.csv
int main()
{
    iqa::log::init_from_env();
    const iqa::config::Settings settings = iqa::config::from_environment();
    try
    {
        app::progress::run_analyze(settings, std::cout);
    }
    catch (const std::exception &ex)
    {
        iqa::log::e(ex.what());
        return 1;
    }
    return 0;
}
