#include "taskrelay/utils/logger.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace taskrelay;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // anonymous namespace

TEST(LoggerTest, FileSinkRespectsLevel) {
    test::TempDir dir;
    const auto log_path = dir / "logs" / "taskrelay.log";

    utils::Logger logger(utils::LogLevel::Warning);
    auto sink = std::make_unique<utils::FileSink>(log_path, true);
    ASSERT_TRUE(sink->is_open());
    logger.add_sink(std::move(sink));

    logger.debug("Cache", "hidden");
    logger.warning("Cache", "stale entry served");
    logger.flush();

    const auto contents = read_file(log_path);
    EXPECT_EQ(contents.find("hidden"), std::string::npos);
    EXPECT_NE(contents.find("[WARN] [Cache] stale entry served"), std::string::npos);
}

TEST(LoggerTest, LevelCanChange) {
    test::TempDir dir;
    const auto log_path = dir / "taskrelay.log";

    utils::Logger logger(utils::LogLevel::Error);
    logger.add_sink(std::make_unique<utils::FileSink>(log_path, true));

    logger.info("Main", "before");
    logger.set_level(utils::LogLevel::Debug);
    EXPECT_EQ(logger.get_level(), utils::LogLevel::Debug);
    logger.info("Main", "after");

    logger.clear_sinks();
    logger.error("Main", "dropped");
    logger.flush();

    const auto contents = read_file(log_path);
    EXPECT_EQ(contents.find("before"), std::string::npos);
    EXPECT_NE(contents.find("[INFO] [Main] after"), std::string::npos);
    EXPECT_EQ(contents.find("dropped"), std::string::npos);
}

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(utils::log_level_from_string("warn"), utils::LogLevel::Warning);
    EXPECT_EQ(utils::log_level_from_string("debug"), utils::LogLevel::Debug);
    EXPECT_EQ(utils::log_level_from_string("bogus"), utils::LogLevel::Warning);
    EXPECT_EQ(utils::to_string(utils::LogLevel::None), "none");
}
