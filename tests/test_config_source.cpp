#include <gtest/gtest.h>
#include "config_source.hpp"
#include "errors.hpp"

#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <random>

using namespace netguard;
namespace fs = std::filesystem;

class DelimitedFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        path = fs::temp_directory_path() / ("netguard_config_" + std::to_string(rd()) + ".csv");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    fs::path path;
};

TEST(InMemoryConfigSourceTest, AddAndLookup) {
    InMemoryConfigSource source;
    source.add("network", "server", "1.0", R"({"role":"server"})");

    auto hit = source.lookup("network", "server", "1.0");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, R"({"role":"server"})");

    EXPECT_FALSE(source.lookup("network", "server", "2.0").has_value());
    EXPECT_FALSE(source.lookup("storage", "server", "1.0").has_value());
    EXPECT_FALSE(source.lookup("network", "client", "1.0").has_value());
    EXPECT_EQ(source.size(), 1u);
}

TEST(InMemoryConfigSourceTest, AddReplacesEntry) {
    InMemoryConfigSource source;
    source.add("network", "server", "1.0", "{}");
    source.add("network", "server", "1.0", R"({"port":1})");
    EXPECT_EQ(*source.lookup("network", "server", "1.0"), R"({"port":1})");
    EXPECT_EQ(source.size(), 1u);
}

TEST(InMemoryConfigSourceTest, AddRejectsInvalidKeyParts) {
    InMemoryConfigSource source;
    EXPECT_THROW(source.add("network", "bad name!", "1.0", "{}"), ConfigurationError);
    EXPECT_THROW(source.add("", "server", "1.0", "{}"), ConfigurationError);
    EXPECT_THROW(source.add("network", "server", "1.0/../2", "{}"), ConfigurationError);
    EXPECT_NO_THROW(source.add("network", "edge_node-2", "1.0.3", "{}"));
    EXPECT_EQ(source.size(), 1u);
}

TEST_F(DelimitedFileTest, LoadsRowsWithCommasInSettings) {
    write("service_type,service_name,version,settings\n"
          "network,server,1.0,{\"role\":\"server\",\"host\":\"0.0.0.0\",\"port\":5000}\n"
          "\n"
          "network, client ,1.0,{\"role\":\"client\",\"host\":\"127.0.0.1\",\"port\":5000}\n");

    InMemoryConfigSource source;
    ASSERT_TRUE(source.load_delimited_file(path.string()));
    EXPECT_EQ(source.size(), 2u);

    auto server = source.lookup("network", "server", "1.0");
    ASSERT_TRUE(server.has_value());
    auto obj = boost::json::parse(*server).as_object();
    EXPECT_EQ(obj.at("port").as_int64(), 5000);
    EXPECT_EQ(obj.at("host").as_string(), "0.0.0.0");

    EXPECT_TRUE(source.lookup("network", "client", "1.0").has_value());
}

TEST_F(DelimitedFileTest, MissingFileFails) {
    InMemoryConfigSource source;
    EXPECT_FALSE(source.load_delimited_file((path / "absent").string()));
}

TEST_F(DelimitedFileTest, WrongHeaderFails) {
    write("type,name,version,settings\nnetwork,server,1.0,{}\n");
    InMemoryConfigSource source;
    EXPECT_FALSE(source.load_delimited_file(path.string()));
    EXPECT_EQ(source.size(), 0u);
}

TEST_F(DelimitedFileTest, MalformedJsonFails) {
    write("service_type,service_name,version,settings\n"
          "network,server,1.0,{\"role\":\"server\"}\n"
          "network,client,1.0,{\"role\":\n");
    InMemoryConfigSource source;
    EXPECT_FALSE(source.load_delimited_file(path.string()));
    // Rows before the bad one are kept.
    EXPECT_TRUE(source.lookup("network", "server", "1.0").has_value());
}

TEST_F(DelimitedFileTest, NonObjectSettingsFails) {
    write("service_type,service_name,version,settings\nnetwork,server,1.0,[1,2,3]\n");
    InMemoryConfigSource source;
    EXPECT_FALSE(source.load_delimited_file(path.string()));
}

TEST_F(DelimitedFileTest, InvalidServiceNameFails) {
    write("service_type,service_name,version,settings\n"
          "network,server,1.0,{}\n"
          "network,my server;drop,1.0,{}\n");
    InMemoryConfigSource source;
    EXPECT_FALSE(source.load_delimited_file(path.string()));
    EXPECT_EQ(source.size(), 1u);
}

TEST_F(DelimitedFileTest, ShortRowFails) {
    write("service_type,service_name,version,settings\nnetwork,server\n");
    InMemoryConfigSource source;
    EXPECT_FALSE(source.load_delimited_file(path.string()));
}

TEST_F(DelimitedFileTest, DeeplyNestedSettingsRejected) {
    std::string nested = "{\"a\":" + std::string(100, '[') + std::string(100, ']') + "}";
    write("service_type,service_name,version,settings\nnetwork,server,1.0," + nested + "\n");
    InMemoryConfigSource source;
    EXPECT_FALSE(source.load_delimited_file(path.string()));
}
