// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Key,value CSV loading, environment overlays and validation rules.
// =============================================================================

#include "configs/config_loader.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using ReinvestTrader::Config::SheetsBackend;
using ReinvestTrader::Config::SystemConfig;

namespace {

const char* const OVERRIDE_VARIABLES[] = {
    "APCA_API_KEY_ID", "APCA_API_SECRET_KEY", "APCA_API_BASE_URL", "GOOGLE_CREDS_JSON", "GOOGLE_CREDS_FILE"
};

SystemConfig make_valid_csv_config() {
    SystemConfig config;
    config.alpaca.api_key = "key";
    config.alpaca.api_secret = "secret";
    config.sheets.backend = SheetsBackend::CSV;
    config.sheets.screener_csv_path = "screener.csv";
    config.sheets.log_csv_path = "log.csv";
    return config;
}

} // anonymous namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        temp_dir = std::filesystem::temp_directory_path() /
                   ("reinvest_trader_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(temp_dir);
        for (const char* variable_name : OVERRIDE_VARIABLES) {
            unsetenv(variable_name);
        }
    }

    void TearDown() override {
        for (const char* variable_name : OVERRIDE_VARIABLES) {
            unsetenv(variable_name);
        }
        std::filesystem::remove_all(temp_dir);
    }

    std::string write_file(const std::string& file_name, const std::string& content) {
        std::filesystem::path file_path = temp_dir / file_name;
        std::ofstream file_stream(file_path);
        file_stream << content;
        return file_path.string();
    }
};

TEST_F(ConfigLoaderTest, LoadsKeysAndSkipsCommentsAndBlankLines) {
    std::string config_path = write_file("runtime_config.csv",
        "# portfolio rules\n"
        "rules.profit_target,0.08\n"
        "\n"
        "rules.sizing_fraction, 0.1 \n"
        "timing.order_spacing_milliseconds,500\n"
        "sheets.backend,csv\n"
        "sheets.log_csv_path,data/log.csv\n"
        "flags.dry_run,true\n"
        "unknown.key,ignored\n");

    SystemConfig config;
    ASSERT_TRUE(load_config_from_csv(config, config_path));

    EXPECT_DOUBLE_EQ(config.rules.profit_target, 0.08);
    EXPECT_DOUBLE_EQ(config.rules.sizing_fraction, 0.1);
    EXPECT_EQ(config.timing.order_spacing_milliseconds, 500);
    EXPECT_EQ(config.sheets.backend, SheetsBackend::CSV);
    EXPECT_EQ(config.sheets.log_csv_path, "data/log.csv");
    EXPECT_TRUE(config.flags.dry_run);
    EXPECT_EQ(config.rules.dividend_symbol, "VIG");
}

TEST_F(ConfigLoaderTest, MissingFileReportsFailure) {
    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, (temp_dir / "absent.csv").string()));
    EXPECT_EQ(load_system_config(config, (temp_dir / "absent.csv").string()), 1);
}

TEST_F(ConfigLoaderTest, MalformedValueNamesKeyAndLine) {
    std::string config_path = write_file("bad.csv", "rules.profit_target,0.05\nrules.sizing_fraction,lots\n");

    SystemConfig config;
    try {
        load_config_from_csv(config, config_path);
        FAIL() << "Expected malformed value to throw";
    } catch (const std::runtime_error& exception_error) {
        std::string message = exception_error.what();
        EXPECT_NE(message.find("rules.sizing_fraction"), std::string::npos);
        EXPECT_NE(message.find(":2"), std::string::npos);
    }
    EXPECT_EQ(load_system_config(config, config_path), 1);
}

TEST_F(ConfigLoaderTest, UnknownBackendIsRejected) {
    std::string config_path = write_file("backend.csv", "sheets.backend,excel\n");
    SystemConfig config;
    EXPECT_THROW(load_config_from_csv(config, config_path), std::runtime_error);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesCredentials) {
    setenv("APCA_API_KEY_ID", "env-key", 1);
    setenv("APCA_API_SECRET_KEY", "env-secret", 1);
    setenv("APCA_API_BASE_URL", "https://paper-api.alpaca.markets", 1);
    setenv("GOOGLE_CREDS_JSON", "{\"client_email\":\"bot@example.iam\"}", 1);

    SystemConfig config;
    config.alpaca.api_key = "file-key";
    apply_environment_overrides(config);

    EXPECT_EQ(config.alpaca.api_key, "env-key");
    EXPECT_EQ(config.alpaca.api_secret, "env-secret");
    EXPECT_EQ(config.alpaca.base_url, "https://paper-api.alpaca.markets");
    EXPECT_EQ(config.sheets.service_account_json, "{\"client_email\":\"bot@example.iam\"}");
}

TEST_F(ConfigLoaderTest, CredentialsFileIsReadWhenInlineJsonAbsent) {
    std::string credentials_path = write_file("creds.json", "{\"client_email\":\"file@example.iam\"}");
    setenv("GOOGLE_CREDS_FILE", credentials_path.c_str(), 1);

    SystemConfig config;
    apply_environment_overrides(config);

    EXPECT_EQ(config.sheets.service_account_json, "{\"client_email\":\"file@example.iam\"}");
}

TEST_F(ConfigLoaderTest, UnsetEnvironmentKeepsFileValues) {
    SystemConfig config;
    config.alpaca.api_key = "file-key";
    config.alpaca.base_url = "https://paper-api.alpaca.markets";

    apply_environment_overrides(config);

    EXPECT_EQ(config.alpaca.api_key, "file-key");
    EXPECT_EQ(config.alpaca.base_url, "https://paper-api.alpaca.markets");
}

TEST(ConfigValidationTest, AcceptsCompleteCsvBackendConfig) {
    std::string error_message;
    EXPECT_TRUE(validate_config(make_valid_csv_config(), error_message)) << error_message;
}

TEST(ConfigValidationTest, RejectsMissingBrokerCredentials) {
    SystemConfig config = make_valid_csv_config();
    config.alpaca.api_secret.clear();
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("credentials"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsOutOfRangeRules) {
    std::string error_message;

    SystemConfig zero_target = make_valid_csv_config();
    zero_target.rules.profit_target = 0.0;
    EXPECT_FALSE(validate_config(zero_target, error_message));

    SystemConfig oversized_fraction = make_valid_csv_config();
    oversized_fraction.rules.sizing_fraction = 1.5;
    EXPECT_FALSE(validate_config(oversized_fraction, error_message));

    SystemConfig negative_spacing = make_valid_csv_config();
    negative_spacing.timing.order_spacing_milliseconds = -1;
    EXPECT_FALSE(validate_config(negative_spacing, error_message));
}

TEST(ConfigValidationTest, GoogleBackendNeedsServiceAccount) {
    SystemConfig config = make_valid_csv_config();
    config.sheets.backend = SheetsBackend::GOOGLE;
    std::string error_message;

    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("service account"), std::string::npos);

    config.sheets.service_account_json = "{}";
    EXPECT_TRUE(validate_config(config, error_message)) << error_message;
}

TEST(ConfigValidationTest, CsvBackendNeedsBothPaths) {
    SystemConfig config = make_valid_csv_config();
    config.sheets.log_csv_path.clear();
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}
