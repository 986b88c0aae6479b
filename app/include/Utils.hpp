#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

bool is_valid_directory(const std::filesystem::path& path);
bool is_writable_directory(const std::filesystem::path& path);

bool has_suffix(std::string_view value, std::string_view suffix);

/**
 * @brief Render a byte count in the style of `du -h` (e.g. 512B, 4.0K, 12M).
 */
std::string format_size(std::uintmax_t bytes);

std::string format_timestamp(std::time_t value, const char* pattern = "%Y-%m-%d %H:%M");

/**
 * @brief Express @p path relative to @p base without touching the filesystem.
 *
 * Both paths are made absolute against the current directory and normalized
 * first. Returns std::nullopt when the result would be empty, absolute, or
 * would climb above @p base.
 */
std::optional<std::filesystem::path> relative_to_base(const std::filesystem::path& path,
                                                      const std::filesystem::path& base);

} // namespace Utils

#endif
