#include "jsubset_history.hpp"
#include "jsubset_checker.hpp"
#include "jsubset_resolver.hpp"
#include "jsubset_schema.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"
#include <algorithm>
#include <charconv>

namespace jsubset {

unsigned version_history::latest_version() const
{
  const auto all = versions();
  return all.empty() ? 0 : all.back();
}

std::string version_filename(unsigned version)
{
  return fmt::format("{:04d}.json", version);
}

directory_version_history::directory_version_history(fs::path directory) : directory(std::move(directory))
{
}

fs::path directory_version_history::version_path(unsigned version) const
{
  return directory / version_filename(version);
}

std::string directory_version_history::describe(unsigned version) const
{
  return version_path(version).generic_string();
}

std::vector<unsigned> directory_version_history::versions() const
{
  std::vector<unsigned> found;
  std::error_code ec;
  if (!fs::is_directory(directory, ec))
    return found;

  // A failing iteration step ends the scan and is reported below
  for (fs::directory_iterator it(directory, ec), last; !ec && it != last; it.increment(ec)) {
    const auto &entry = *it;
    std::error_code status_error;
    if (!entry.is_regular_file(status_error) || entry.path().extension() != ".json")
      continue;

    // Only purely numeric stems are versions
    const auto stem = entry.path().stem().string();
    unsigned version = 0;
    auto [end, error] = std::from_chars(stem.data(), stem.data() + stem.size(), version);
    if (error != std::errc() || end != stem.data() + stem.size() || version == 0) {
      spdlog::debug("Ignoring '{}' in schema history", entry.path().string());
      continue;
    }
    found.push_back(version);
  }
  if (ec)
    spdlog::warn("Failed to scan '{}': {}", directory.string(), ec.message());

  std::ranges::sort(found);
  return found;
}

std::expected<schema_document, std::error_code> directory_version_history::load_version(unsigned version) const
{
  return load_schema_document(version_path(version));
}

std::expected<void, std::error_code> directory_version_history::store_version(unsigned version, const schema_document &document)
{
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec)
    return std::unexpected(ec);
  return save_schema_document(document, version_path(version));
}

std::expected<unsigned, std::error_code> record_version(version_history &history, const schema_document &document)
{
  const auto latest  = history.latest_version();
  const auto current = resolve(document);

  if (latest > 0) {
    auto previous = history.load_version(latest);
    if (!previous)
      return std::unexpected(previous.error());
    if (resolve(previous.value()) == current) {
      spdlog::debug("Schema '{}' is unchanged since {}", document.title, history.describe(latest));
      return latest;
    }
  }

  auto stored = history.store_version(latest + 1, document);
  if (!stored)
    return std::unexpected(stored.error());

  spdlog::info("Recorded schema '{}' as {}", document.title, history.describe(latest + 1));
  return latest + 1;
}

std::expected<std::vector<history_failure>, std::error_code> check_history(const version_history &history)
{
  std::vector<history_failure> failures;
  const auto all = history.versions();
  if (all.size() < 2)
    return failures;

  auto load_resolved = [&](unsigned version) -> std::expected<value_ptr, std::error_code> {
    auto document = history.load_version(version);
    if (!document)
      return std::unexpected(document.error());
    return make_value(resolve(document.value()));
  };

  auto older = load_resolved(all.front());
  if (!older)
    return std::unexpected(older.error());

  for (size_t i = 1; i < all.size(); ++i) {
    auto newer = load_resolved(all[i]);
    if (!newer)
      return std::unexpected(newer.error());

    spdlog::debug("Checking {} against {}", history.describe(all[i - 1]), history.describe(all[i]));
    auto errors = is_subset(older.value(), newer.value());
    if (!errors.empty())
      failures.push_back({ all[i - 1], all[i], std::move(errors) });
    older = std::move(newer);
  }
  return failures;
}

} // namespace jsubset
