// =============================================================================
// csv_tabular_store_test.cpp
// =============================================================================
// Offline tabular store: quoting, appends and in-place cell updates.
// =============================================================================

#include "api/sheets/csv_tabular_store.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using ReinvestTrader::API::CsvTabularStore;
using ReinvestTrader::API::TableRow;

class CsvTabularStoreTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;
    std::string store_path;

    void SetUp() override {
        temp_dir = std::filesystem::temp_directory_path() /
                   ("reinvest_trader_csv_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(temp_dir);
        store_path = (temp_dir / "log.csv").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    void write_raw(const std::string& content) {
        std::ofstream file_stream(store_path, std::ios::binary);
        file_stream << content;
    }

    std::string read_raw() const {
        std::ifstream file_stream(store_path, std::ios::binary);
        std::stringstream content_stream;
        content_stream << file_stream.rdbuf();
        return content_stream.str();
    }
};

TEST_F(CsvTabularStoreTest, MissingFileReadsAsEmpty) {
    CsvTabularStore store(store_path);
    EXPECT_TRUE(store.get_all_values().empty());
    EXPECT_EQ(store.get_store_name(), "csv:" + store_path);
}

TEST_F(CsvTabularStoreTest, ParsesQuotedFieldsAndKeepsBlankRows) {
    auto rows = CsvTabularStore::parse_csv("a,\"b, c\",\"say \"\"hi\"\"\"\r\n\nx,,z\n");

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], (TableRow{"a", "b, c", "say \"hi\""}));
    EXPECT_TRUE(rows[1].empty());
    EXPECT_EQ(rows[2], (TableRow{"x", "", "z"}));
}

TEST_F(CsvTabularStoreTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(CsvTabularStore::parse_csv("a,\"open\n"), std::runtime_error);
}

TEST_F(CsvTabularStoreTest, FormatsFieldsThatNeedQuoting) {
    EXPECT_EQ(CsvTabularStore::format_csv_row({"plain", "with,comma", "with \"quote\""}),
              "plain,\"with,comma\",\"with \"\"quote\"\"\"");
}

TEST_F(CsvTabularStoreTest, AppendAddsMissingTrailingNewline) {
    write_raw("VIG_FUNDS,0.50");
    CsvTabularStore store(store_path);

    store.append_row({"2024-05-01T10:00:00", "ABC", "buy", "50.00", "", "order-1", "success", ""});

    auto rows = store.get_all_values();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (TableRow{"VIG_FUNDS", "0.50"}));
    EXPECT_EQ(rows[1][1], "ABC");
    EXPECT_EQ(rows[1].size(), 8u);
}

TEST_F(CsvTabularStoreTest, UpdateCellRewritesInPlace) {
    write_raw("timestamp,symbol\nVIG_FUNDS,0.50\n");
    CsvTabularStore store(store_path);

    store.update_cell(2, 2, "3.25");

    EXPECT_EQ(read_raw(), "timestamp,symbol\nVIG_FUNDS,3.25\n");
    EXPECT_FALSE(std::filesystem::exists(store_path + ".tmp"));
}

TEST_F(CsvTabularStoreTest, UpdateCellExtendsTableWhenNeeded) {
    CsvTabularStore store(store_path);

    store.update_cell(2, 3, "x");

    auto rows = store.get_all_values();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_TRUE(rows[0].empty());
    EXPECT_EQ(rows[1], (TableRow{"", "", "x"}));
}

TEST_F(CsvTabularStoreTest, RejectsZeroBasedCoordinates) {
    CsvTabularStore store(store_path);
    EXPECT_THROW(store.update_cell(0, 1, "x"), std::runtime_error);
}
