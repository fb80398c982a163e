#include "docsync/core/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using docsync::EntityKind;
using docsync::ErrorCode;
using docsync::NodeConfig;
using docsync::SeedKind;

TEST(ConfigTest, DefaultsCoverEveryDataset) {
    NodeConfig config;

    ASSERT_EQ(config.datasets.size(), 6u);
    EXPECT_EQ(config.datasets[0].name, "resource");
    EXPECT_EQ(config.datasets[1].name, "folder");
    EXPECT_EQ(config.datasets[1].kind, EntityKind::Folder);
    EXPECT_EQ(config.datasets[1].seed, SeedKind::Folders);
    EXPECT_EQ(config.datasets[2].name, "node");
    EXPECT_EQ(config.datasets[2].kind, EntityKind::Node);
    EXPECT_EQ(config.datasets[3].name, "resource1");
    EXPECT_EQ(config.datasets[3].seed, SeedKind::Images);
    EXPECT_EQ(config.datasets[5].name, "resource3");

    EXPECT_EQ(config.notification_capacity, 1000u);
    EXPECT_EQ(config.max_entity_bytes, 157286400u);
    EXPECT_EQ(config.missing_label, "File not found");
    EXPECT_EQ(config.untracked_datasets.count("resource"), 1u);
    EXPECT_TRUE(docsync::validate_config(config).is_ok());
}

TEST(ConfigTest, EmptyObjectIsValid) {
    auto config = docsync::parse_config("{}");
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().datasets.size(), 6u);
    EXPECT_EQ(config.value().log_level, "info");
}

TEST(ConfigTest, OverridesFields) {
    auto config = docsync::parse_config(R"({
        "clients": 3,
        "notification_capacity": 8,
        "max_entity_bytes": 1024,
        "missing_label": "Missing",
        "untracked_datasets": [],
        "log_level": "debug",
        "datasets": [
            {"name": "folder", "kind": "folder", "seed": "folders"},
            {"name": "blobs"}
        ]
    })");
    ASSERT_TRUE(config.is_ok()) << config.error().describe();

    const auto& c = config.value();
    EXPECT_EQ(c.clients, 3u);
    EXPECT_EQ(c.notification_capacity, 8u);
    EXPECT_EQ(c.max_entity_bytes, 1024u);
    EXPECT_EQ(c.missing_label, "Missing");
    EXPECT_TRUE(c.untracked_datasets.empty());
    EXPECT_EQ(c.log_level, "debug");
    ASSERT_EQ(c.datasets.size(), 2u);
    EXPECT_EQ(c.datasets[1].name, "blobs");
    EXPECT_EQ(c.datasets[1].kind, EntityKind::Resource);
    EXPECT_EQ(c.datasets[1].seed, SeedKind::None);
}

TEST(ConfigTest, RejectsInvalidInput) {
    auto bad_json = docsync::parse_config("{not json");
    ASSERT_TRUE(bad_json.is_error());
    EXPECT_EQ(bad_json.error().code, ErrorCode::InvalidConfig);

    EXPECT_TRUE(docsync::parse_config("[]").is_error());
    EXPECT_TRUE(docsync::parse_config(R"({"notification_capacity": 0})").is_error());
    EXPECT_TRUE(docsync::parse_config(R"({"clients": 17})").is_error());
    EXPECT_TRUE(docsync::parse_config(R"({"clients": -1})").is_error());
    EXPECT_TRUE(docsync::parse_config(R"({"notification_capacity": "many"})").is_error());
    EXPECT_TRUE(docsync::parse_config(R"({"author": "abcd"})").is_error());
    EXPECT_TRUE(docsync::parse_config(R"({"datasets": []})").is_error());
    EXPECT_TRUE(docsync::parse_config(R"({"datasets": [{"name": "a"}, {"name": "a"}]})").is_error());
    EXPECT_TRUE(docsync::parse_config(R"({"datasets": [{"name": "a", "kind": "table"}]})").is_error());
}

TEST(ConfigTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "docsync_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"missing_label": "Gone"})";
    }

    auto config = docsync::load_config(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().missing_label, "Gone");

    auto missing = docsync::load_config(path);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::Io);
}
