#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

namespace {

class QuietLogging : public ::testing::Environment {
public:
    void SetUp() override { spdlog::set_level(spdlog::level::warn); }
};

[[maybe_unused]] const auto* const kQuietLogging = ::testing::AddGlobalTestEnvironment(new QuietLogging);

} // namespace
