#include <gtest/gtest.h>
#include <rho/debug_log.hpp>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace {

std::mutex captured_mutex;
std::vector<std::string> captured;

void capture(const char* message) {
    std::lock_guard<std::mutex> lock(captured_mutex);
    captured.emplace_back(message);
}

} // namespace

class DebugLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        captured.clear();
        rho::debug::set_debug_callback(capture);
    }

    void TearDown() override {
        rho::debug::clear_debug_callback();
    }
};

TEST_F(DebugLogTest, CallbackReceivesFormattedLine) {
    rho::debug::debug_output("Request %zu rejected: %s", static_cast<std::size_t>(3),
                             "Illegal substitution [f0]");

    ASSERT_EQ(captured.size(), 1u);
    const std::string& line = captured[0];
    EXPECT_EQ(line.rfind("[DEBUG][T", 0), 0u) << line;
    EXPECT_NE(line.find("Request 3 rejected: Illegal substitution [f0]"), std::string::npos) << line;
}

TEST_F(DebugLogTest, ClearedCallbackStopsRouting) {
    rho::debug::clear_debug_callback();
    testing::internal::CaptureStdout();
    rho::debug::debug_output("to stdout");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_TRUE(captured.empty());
    EXPECT_NE(out.find("to stdout"), std::string::npos);
}

TEST_F(DebugLogTest, LongLinesAreTruncated) {
    std::string long_message(4000, 'x');
    rho::debug::debug_output("%s", long_message.c_str());

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_LT(captured[0].size(), long_message.size());
}
