#include "gtest/gtest.h"
#include "tests/support/this_exe.hpp"

int main(int argc, char* argv[])
{
    this_exe::plog_init();

    // registry::instance() looks for modules next to the test executable
    // unless the caller pointed it somewhere else.
    char* backend_path = nullptr;
    if (pal_env_get("VCDIFF_BACKEND_PATH", &backend_path))
    {
        free(backend_path);
    }
    else
    {
        const auto module_directory = this_exe::get_module_directory();
        if (!module_directory.empty())
        {
            pal_env_set("VCDIFF_BACKEND_PATH", module_directory.c_str());
        }
    }

    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
