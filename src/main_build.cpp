#include <iostream>
#include "iqa/config.hpp"
#include "iqa/log.hpp"
#include "iqa/progress.hpp"

// Build stage: <IQA_DATA_ROOT>/<label>/<images> -> <IQA_OUTPUT_ROOT>/image_quality.csv
int main()
{
    iqa::log::init_from_env();
    const iqa::config::Settings settings = iqa::config::from_environment();
    try
    {
        app::progress::run_build(settings, std::cout);
    }
    catch (const std::exception &ex)
    {
        iqa::log::e(ex.what());
        return 1;
    }
    return 0;
}
