#include "iqa/log.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace iqa;

namespace
{
    // Restores the global debug flag after each test
    class LogTest : public ::testing::Test
    {
    protected:
        void SetUp() override { saved_ = log::debug_enabled(); }
        void TearDown() override { log::set(saved_); }

    private:
        bool saved_ = false;
    };
}

TEST_F(LogTest, DebugLinesFollowTheFlag)
{
    log::set(false);
    ::testing::internal::CaptureStderr();
    log::d("hidden");
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");

    log::set(true);
    ::testing::internal::CaptureStderr();
    log::d("shown");
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "[DBG] shown\n");
}

TEST_F(LogTest, StageTagsNestAndRestore)
{
    ::testing::internal::CaptureStderr();
    {
        log::Stage outer("build");
        log::w("skipped a.png");
        {
            log::Stage inner("analyze");
            log::i("loaded");
        }
        log::e("bad root");
    }
    log::i("done");
    EXPECT_EQ(::testing::internal::GetCapturedStderr(),
              "[WRN] [build] skipped a.png\n"
              "[INF] [analyze] loaded\n"
              "[ERR] [build] bad root\n"
              "[INF] done\n");
}

TEST_F(LogTest, DebugFlagFromEnvironment)
{
    setenv("IQA_DEBUG", "1", 1);
    log::init_from_env();
    EXPECT_TRUE(log::debug_enabled());

    setenv("IQA_DEBUG", "0", 1);
    log::init_from_env();
    EXPECT_FALSE(log::debug_enabled());

    unsetenv("IQA_DEBUG");
    log::init_from_env();
    EXPECT_FALSE(log::debug_enabled());
}
