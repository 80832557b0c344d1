#include "log.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

TEST(LogLevelTest, ParsesCaseInsensitively) {
    EXPECT_EQ(logLevelFromString("error"), LOG_ERROR);
    EXPECT_EQ(logLevelFromString("WARN"), LOG_WARN);
    EXPECT_EQ(logLevelFromString("Warning"), LOG_WARN);
    EXPECT_EQ(logLevelFromString("info"), LOG_INFO);
    EXPECT_EQ(logLevelFromString("Debug"), LOG_DEBUG);
    EXPECT_EQ(logLevelFromString("trace"), LOG_TRACE);
    EXPECT_FALSE(logLevelFromString("verbose").has_value());
    EXPECT_FALSE(logLevelFromString("").has_value());
}

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(logLevelName(LOG_ERROR), "ERROR");
    EXPECT_STREQ(logLevelName(LOG_TRACE), "TRACE");
}

TEST(LoggerTest, FiltersByLevel) {
    std::ostringstream out, err;
    CLogger            logger(LOG_WARN, out, err);

    logger.info("hidden");
    logger.debug("hidden");
    logger.warn("shown");

    EXPECT_EQ(out.str(), "[wheel-smoother] [WARN] shown\n");
    EXPECT_TRUE(err.str().empty());

    logger.setLevel(LOG_TRACE);
    EXPECT_TRUE(logger.shouldLog(LOG_TRACE));
    EXPECT_EQ(logger.level(), LOG_TRACE);
}

TEST(LoggerTest, ErrorsGoToErrorStream) {
    std::ostringstream out, err;
    CLogger            logger(LOG_ERROR, out, err);

    logger.error("boom");

    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "[wheel-smoother] [ERROR] boom\n");
}

TEST(LoggerTest, AppendsToFile) {
    const auto path = std::filesystem::temp_directory_path() / ("wheel-smoother-log-" + std::to_string(getpid()) + ".log");
    std::filesystem::remove(path);

    {
        std::ostringstream out, err;
        CLogger            logger(LOG_INFO, out, err);
        ASSERT_TRUE(logger.setFile(path.string()));
        logger.info("first");
        logger.debug("skipped");
        logger.warn("second");
    }

    std::ifstream     file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_EQ(contents.str(), "[wheel-smoother] [INFO] first\n[wheel-smoother] [WARN] second\n");

    std::filesystem::remove(path);
}

TEST(LoggerTest, UnwritableFileIsReported) {
    std::ostringstream out, err;
    CLogger            logger(LOG_INFO, out, err);

    EXPECT_FALSE(logger.setFile("/nonexistent-dir/wheel-smoother.log"));
}
