#pragma once

#include <string>
#include <string_view>
#include <expected>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace jsubset {

std::expected<void, std::error_code> write_file_contents(const fs::path &filename, std::string_view contents);

template <class Range>
std::string join(const Range &items, std::string_view separator)
{
  std::string result;
  bool first = true;
  for (const auto &item: items) {
    if (!first)
      result.append(separator);
    result.append(item);
    first = false;
  }
  return result;
}

template <class CharContainer>
static std::expected<CharContainer, std::error_code> get_file_contents(const fs::path &filename)
{
  std::ifstream file(filename, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }

  const auto file_size = file.tellg();
  if (file_size < 0) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  CharContainer contents;
  contents.resize(static_cast<typename CharContainer::size_type>(file_size));

  file.seekg(0);
  if (!file.read(reinterpret_cast<char *>(contents.data()), file_size)) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  return contents;
}

} // namespace jsubset
