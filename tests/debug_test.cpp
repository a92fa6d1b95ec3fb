/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * tests/debug_test.cpp
 * - Phase-gated debug logging
 */
#include <gtest/gtest.h>
#include <common.hpp>
#include <debug_inner.hpp>
#include <cstdlib>

namespace {
    void log_in_phase(const char* phase, const char* text)
    {
        DebugPhaseGuard dpg(phase);
        DEBUG(text);
    }
}

class DebugTest:
    public ::testing::Test
{
protected:
    static void SetUpTestCase()
    {
        setenv("DECLMACRO_TEST_DEBUG", "Loud", 1);
        debug_init_phases("DECLMACRO_TEST_DEBUG", { "Quiet", "Loud" });
    }
    void TearDown() override
    {
        debug_set_output(false);
    }
};

#ifndef DISABLE_DEBUG
TEST_F(DebugTest, OffByDefault)
{
    ::testing::internal::CaptureStdout();
    log_in_phase("Loud", "hidden");
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "");
}

TEST_F(DebugTest, EnabledPhaseOnly)
{
    debug_set_output(true);
    ::testing::internal::CaptureStdout();
    log_in_phase("Quiet", "not shown");
    log_in_phase("Loud", "shown");
    auto out = ::testing::internal::GetCapturedStdout();
    EXPECT_EQ(out.find("not shown"), ::std::string::npos);
    EXPECT_NE(out.find("Loud- "), ::std::string::npos);
    EXPECT_NE(out.find("log_in_phase: shown"), ::std::string::npos);
}

TEST_F(DebugTest, TraceIndents)
{
    debug_set_output(true);
    ::testing::internal::CaptureStdout();
    {
        DebugPhaseGuard dpg("Loud");
        TRACE_FUNCTION_F("arg=" << 1);
        DEBUG("inner");
    }
    auto out = ::testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find(">> (arg=1)"), ::std::string::npos);
    EXPECT_NE(out.find("-  TestBody: inner"), ::std::string::npos);
    EXPECT_NE(out.find("<<"), ::std::string::npos);
}

TEST_F(DebugTest, GuardRestoresPhase)
{
    debug_set_output(true);
    DebugPhaseGuard outer("Loud");
    {
        DebugPhaseGuard inner("Quiet");
        EXPECT_FALSE(debug_enabled());
    }
    EXPECT_TRUE(debug_enabled());
}
#endif
