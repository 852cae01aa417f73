#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "../src/features/finder_config.hpp"

namespace fs = std::filesystem;

class FinderConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("finder_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void writeFile(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    fs::path path_;
};

TEST_F(FinderConfigTest, Defaults) {
    FinderConfig config;
    EXPECT_EQ(config.cache_limit, 10000u);
    EXPECT_EQ(config.log_directory, "logs");
    EXPECT_TRUE(config.verbose);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(FinderConfigTest, PartialJsonKeepsDefaults) {
    json j = {{"cache_limit", 64}};
    FinderConfig config = j.get<FinderConfig>();
    EXPECT_EQ(config.cache_limit, 64u);
    EXPECT_EQ(config.log_directory, "logs");
    EXPECT_EQ(config.log_rotation_size, FinderConfig{}.log_rotation_size);
}

TEST_F(FinderConfigTest, JsonRoundTrip) {
    FinderConfig config;
    config.cache_limit = 12;
    config.log_directory = "/tmp/faces";
    config.verbose = false;

    json j = config;
    FinderConfig parsed = j.get<FinderConfig>();
    EXPECT_EQ(parsed.cache_limit, 12u);
    EXPECT_EQ(parsed.log_directory, "/tmp/faces");
    EXPECT_FALSE(parsed.verbose);
}

TEST_F(FinderConfigTest, LoadsFromFile) {
    writeFile(R"({"cache_limit": 500, "log_directory": "face_logs", "verbose": false})");
    FinderConfig config = loadFinderConfig(path_.string());
    EXPECT_EQ(config.cache_limit, 500u);
    EXPECT_EQ(config.log_directory, "face_logs");
    EXPECT_FALSE(config.verbose);
}

TEST_F(FinderConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadFinderConfig(path_.string()), std::runtime_error);
}

TEST_F(FinderConfigTest, MalformedJsonThrows) {
    writeFile("{ cache_limit: ");
    EXPECT_THROW(loadFinderConfig(path_.string()), json::parse_error);
}

TEST_F(FinderConfigTest, ZeroCacheLimitRejected) {
    writeFile(R"({"cache_limit": 0})");
    EXPECT_THROW(loadFinderConfig(path_.string()), std::invalid_argument);
}
