#include <gtest/gtest.h>
#include "seedkeeper/core/settings.hpp"
#include <filesystem>
#include <fstream>

using namespace seedkeeper::core;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.set_defaults();
        config_file = "test_seedkeeper_settings.conf";
    }
    
    void TearDown() override {
        std::filesystem::remove(config_file);
    }
    
    void write_config(const std::string& content) {
        std::ofstream file(config_file);
        file << content;
    }
    
    Config config;
    std::string config_file;
};

TEST_F(SettingsTest, DefaultsAreValid) {
    std::string error;
    auto settings = Settings::from_config(config, error);
    ASSERT_TRUE(settings.has_value()) << error;
    
    EXPECT_EQ(settings->min_upload_speed, 512u * 1024);
    EXPECT_EQ(settings->max_upload_speed, 102400u * 1024);
    EXPECT_DOUBLE_EQ(settings->pid_kp, 0.6);
    EXPECT_DOUBLE_EQ(settings->pid_ki, 0.15);
    EXPECT_DOUBLE_EQ(settings->pid_kd, 0.08);
    EXPECT_EQ(settings->cleanup_interval, std::chrono::seconds(300));
    EXPECT_EQ(settings->cleanup_reannounce_wait, std::chrono::seconds(5));
    EXPECT_FALSE(settings->cleanup_enabled);
}

TEST_F(SettingsTest, DefaultTiers) {
    Settings settings;
    
    EXPECT_DOUBLE_EQ(settings.tier(1).free_space_gb, 10.0);
    EXPECT_DOUBLE_EQ(settings.tier(1).upload_kib, 1024.0);
    EXPECT_DOUBLE_EQ(settings.tier(2).free_space_gb, 20.0);
    EXPECT_TRUE(settings.tier(2).upload_requires_completion);
    EXPECT_DOUBLE_EQ(settings.tier(3).free_space_gb, 5.0);
    EXPECT_DOUBLE_EQ(settings.tier(3).upload_kib, 5120.0);
    EXPECT_FALSE(settings.tier(3).upload_requires_completion);
}

TEST_F(SettingsTest, UnitsConverted) {
    config.set("max_upload_speed", "2048");
    config.set("min_limit_delta", "32");
    config.set("control_interval", "0.5");
    config.set("cleanup_space_rule3_gb", "2.5");
    
    std::string error;
    auto settings = Settings::from_config(config, error);
    ASSERT_TRUE(settings.has_value()) << error;
    
    EXPECT_EQ(settings->max_upload_speed, 2048u * 1024);
    EXPECT_EQ(settings->min_limit_delta, 32u * 1024);
    EXPECT_EQ(settings->control_interval, std::chrono::milliseconds(500));
    EXPECT_DOUBLE_EQ(settings->tier(3).free_space_gb, 2.5);
}

TEST_F(SettingsTest, RejectsInvertedSpeedRange) {
    config.set("min_upload_speed", "4096");
    config.set("max_upload_speed", "1024");
    
    std::string error;
    EXPECT_FALSE(Settings::from_config(config, error).has_value());
    EXPECT_NE(error.find("min_upload_speed"), std::string::npos);
}

TEST_F(SettingsTest, RejectsBadValues) {
    std::vector<std::pair<std::string, std::string>> cases = {
        {"control_interval", "0"},
        {"cleanup_interval", "-5"},
        {"pid_ki", "-0.1"},
        {"kalman_r", "fast"},
        {"cleanup_enabled", "maybe"},
        {"failure_threshold", "0"},
        {"cleanup_space_rule1_gb", "-1"},
        {"api_call_budget", "0"},
        {"log.level", "chatty"},
    };
    
    for (const auto& [key, value] : cases) {
        Config bad;
        bad.set_defaults();
        bad.set(key, value);
        
        std::string error;
        EXPECT_FALSE(Settings::from_config(bad, error).has_value()) << key << "=" << value;
        EXPECT_FALSE(error.empty()) << key;
    }
}

TEST_F(SettingsTest, ProviderReloadSwapsValidSnapshot) {
    write_config("max_upload_speed=4096\ncleanup_enabled=true\n");
    SettingsProvider provider(Settings{}, config_file);
    auto before = provider.current();
    auto generation = provider.generation();
    
    std::string error;
    ASSERT_TRUE(provider.reload(error)) << error;
    
    EXPECT_EQ(provider.generation(), generation + 1);
    EXPECT_EQ(provider.current()->max_upload_speed, 4096u * 1024);
    EXPECT_TRUE(provider.current()->cleanup_enabled);
    EXPECT_EQ(before->max_upload_speed, 102400u * 1024);
}

TEST_F(SettingsTest, ProviderKeepsLastValidSnapshotOnError) {
    write_config("min_upload_speed=9000\nmax_upload_speed=10\n");
    SettingsProvider provider(Settings{}, config_file);
    auto generation = provider.generation();
    
    std::string error;
    EXPECT_FALSE(provider.reload(error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(provider.generation(), generation);
    EXPECT_EQ(provider.current()->min_upload_speed, 512u * 1024);
}

TEST_F(SettingsTest, ProviderWithoutSourceCannotReload) {
    SettingsProvider provider(Settings{});
    std::string error;
    EXPECT_FALSE(provider.reload(error));
    EXPECT_FALSE(provider.reload_from("missing_seedkeeper.conf", error));
}

TEST_F(SettingsTest, ReplaceValidates) {
    SettingsProvider provider(Settings{});
    Settings invalid;
    invalid.api_call_budget = 0;
    
    std::string error;
    EXPECT_FALSE(provider.replace(invalid, error));
    
    Settings valid;
    valid.failure_threshold = 2;
    EXPECT_TRUE(provider.replace(valid, error));
    EXPECT_EQ(provider.current()->failure_threshold, 2);
}
