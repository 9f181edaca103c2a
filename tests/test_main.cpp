#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // Retry and failure paths log at warn and above; keep the test output readable
    spdlog::set_level(spdlog::level::err);

    return RUN_ALL_TESTS();
}
