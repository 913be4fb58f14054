#include "utilities.hpp"
#include "spdlog/spdlog.h"

namespace jsubset {

std::expected<void, std::error_code> write_file_contents(const fs::path &filename, std::string_view contents)
{
  if (filename.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(filename.parent_path(), ec);
    if (ec) {
      spdlog::error("Failed to create directory '{}': {}", filename.parent_path().string(), ec.message());
      return std::unexpected(ec);
    }
  }

  std::ofstream file(filename, std::ios::binary | std::ios::trunc);
  if (!file)
    return std::unexpected(std::make_error_code(std::errc::permission_denied));

  file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  if (!file)
    return std::unexpected(std::make_error_code(std::errc::io_error));

  return {};
}

} // namespace jsubset
