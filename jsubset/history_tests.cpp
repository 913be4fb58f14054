#include "gtest/gtest.h"
#include "jsubset_history.hpp"
#include "jsubset_config.hpp"
#include "jsubset_schema.hpp"
#include "utilities.hpp"
#include <filesystem>

using namespace jsubset;

class HistoryTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    directory = std::filesystem::temp_directory_path() / ("jsubset_history_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(directory);
  }

  void TearDown() override
  {
    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
  }

  static schema_document foo(const std::string &a_type, bool with_optional_b = false)
  {
    nlohmann::json document = { { "type", "object" }, { "title", "Foo" }, { "required", nlohmann::json::array({ "a" }) } };
    document["properties"]["a"] = { { "type", a_type } };
    if (with_optional_b)
      document["properties"]["b"] = { { "anyOf", nlohmann::json::array({ { { "type", "number" } }, { { "type", "null" } } }) }, { "default", nullptr } };
    return parse_schema_document(document);
  }

  std::filesystem::path directory;
};

TEST(HistoryNames, VersionFilename)
{
  EXPECT_EQ(version_filename(1), "0001.json");
  EXPECT_EQ(version_filename(42), "0042.json");
  EXPECT_EQ(version_filename(12345), "12345.json");
}

TEST_F(HistoryTest, EmptyHistory)
{
  directory_version_history history(directory);
  EXPECT_EQ(history.latest_version(), 0u);
  EXPECT_TRUE(history.versions().empty());

  auto failures = check_history(history);
  ASSERT_TRUE(failures.has_value());
  EXPECT_TRUE(failures->empty());
}

TEST_F(HistoryTest, RecordsOnlyChangedSchemas)
{
  directory_version_history history(directory);

  auto first = record_version(history, foo("string"));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first.value(), 1u);
  EXPECT_TRUE(std::filesystem::exists(directory / "0001.json"));

  auto unchanged = record_version(history, foo("string"));
  ASSERT_TRUE(unchanged.has_value());
  EXPECT_EQ(unchanged.value(), 1u);

  auto changed = record_version(history, foo("string", true));
  ASSERT_TRUE(changed.has_value());
  EXPECT_EQ(changed.value(), 2u);
  EXPECT_EQ(history.versions(), (std::vector<unsigned>{ 1, 2 }));

  auto failures = check_history(history);
  ASSERT_TRUE(failures.has_value());
  EXPECT_TRUE(failures->empty());
}

TEST_F(HistoryTest, ReportsIncompatibleVersions)
{
  directory_version_history history(directory);
  ASSERT_TRUE(record_version(history, foo("string")).has_value());
  ASSERT_TRUE(record_version(history, foo("string", true)).has_value());
  ASSERT_TRUE(record_version(history, foo("integer", true)).has_value());

  auto failures = check_history(history);
  ASSERT_TRUE(failures.has_value());
  ASSERT_EQ(failures->size(), 1u);

  const auto &failure = failures->front();
  EXPECT_EQ(failure.older, 2u);
  EXPECT_EQ(failure.newer, 3u);
  ASSERT_EQ(failure.errors.size(), 1u);
  EXPECT_EQ(failure.errors[0].to_string(), "At .a Types don't match - a: String b: Integer");
  EXPECT_EQ(history.describe(3), (directory / "0003.json").generic_string());
}

TEST_F(HistoryTest, IgnoresUnrelatedFiles)
{
  directory_version_history history(directory);
  ASSERT_TRUE(record_version(history, foo("string")).has_value());
  ASSERT_TRUE(write_file_contents(directory / "notes.json", "{}").has_value());
  ASSERT_TRUE(write_file_contents(directory / "0002.txt", "").has_value());
  std::filesystem::create_directories(directory / "0003.json");

  EXPECT_EQ(history.versions(), (std::vector<unsigned>{ 1 }));
}

TEST_F(HistoryTest, DirectoryThatIsAFileHasNoVersions)
{
  ASSERT_TRUE(write_file_contents(directory, "").has_value());
  directory_version_history history(directory);
  EXPECT_TRUE(history.versions().empty());
  EXPECT_EQ(history.latest_version(), 0u);
}

TEST_F(HistoryTest, UnreadableVersionIsAnError)
{
  directory_version_history history(directory);
  ASSERT_TRUE(record_version(history, foo("string")).has_value());
  ASSERT_TRUE(write_file_contents(directory / "0002.json", "{ not json").has_value());

  EXPECT_THROW((void)check_history(history), nlohmann::json::parse_error);
}

TEST(ConfigTest, Defaults)
{
  auto c = parse_config(YAML::Node{});
  EXPECT_EQ(c.log_file, "jsubset.log");
  EXPECT_EQ(c.log_level, spdlog::level::info);
  EXPECT_EQ(c.output, config::output_format::TEXT);
  EXPECT_EQ(c.history_directory, std::filesystem::path{ "schemas" });
}

TEST(ConfigTest, ReadsEveryKey)
{
  auto c = parse_config(YAML::Load("log_file: check.log\nlog_level: debug\noutput: json\nhistory_directory: db/schemas\n"));
  EXPECT_EQ(c.log_file, "check.log");
  EXPECT_EQ(c.log_level, spdlog::level::debug);
  EXPECT_EQ(c.output, config::output_format::JSON);
  EXPECT_EQ(c.history_directory, std::filesystem::path{ "db/schemas" });
}

TEST(ConfigTest, RejectsUnknownValues)
{
  EXPECT_THROW(parse_config(YAML::Load("log_level: loud")), std::invalid_argument);
  EXPECT_THROW(parse_config(YAML::Load("output: xml")), std::invalid_argument);
  EXPECT_THROW(parse_config(YAML::Load("- a\n- b")), std::invalid_argument);
  EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
}

TEST(ConfigTest, MissingFile)
{
  auto loaded = load_config_file(std::filesystem::temp_directory_path() / "jsubset_no_such_config.yaml");
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), std::make_error_code(std::errc::no_such_file_or_directory));
}
