#include "Utils.hpp"

#include <array>
#include <system_error>
#include <unistd.h>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace Utils {

std::string path_to_utf8(const fs::path& path)
{
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
}


fs::path utf8_to_path(const std::string& value)
{
    return fs::path(std::u8string(value.begin(), value.end()));
}


bool is_valid_directory(const fs::path& path)
{
    std::error_code ec;
    return !path.empty() && fs::is_directory(path, ec);
}


bool is_writable_directory(const fs::path& path)
{
    return is_valid_directory(path) && ::access(path.c_str(), W_OK) == 0;
}


bool has_suffix(std::string_view value, std::string_view suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}


std::string format_size(std::uintmax_t bytes)
{
    static constexpr std::array<const char*, 5> units = {"K", "M", "G", "T", "P"};
    if (bytes < 1024) {
        return fmt::format("{}B", bytes);
    }

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    if (value < 10.0) {
        return fmt::format("{:.1f}{}", value, units[unit]);
    }
    return fmt::format("{:.0f}{}", value, units[unit]);
}


std::string format_timestamp(std::time_t value, const char* pattern)
{
    std::tm local{};
    if (!localtime_r(&value, &local)) {
        return {};
    }
    std::array<char, 64> buffer{};
    const std::size_t written = std::strftime(buffer.data(), buffer.size(), pattern, &local);
    return std::string(buffer.data(), written);
}


std::optional<fs::path> relative_to_base(const fs::path& path, const fs::path& base)
{
    std::error_code ec;
    const fs::path absolute_path = fs::absolute(path, ec).lexically_normal();
    if (ec) {
        return std::nullopt;
    }
    fs::path absolute_base = fs::absolute(base, ec).lexically_normal();
    if (ec) {
        return std::nullopt;
    }
    if (!absolute_base.has_filename() && absolute_base.has_relative_path()) {
        absolute_base = absolute_base.parent_path();
    }

    fs::path relative = absolute_path.lexically_relative(absolute_base);
    if (relative.empty() || relative.is_absolute() || relative == ".") {
        return std::nullopt;
    }
    if (*relative.begin() == "..") {
        return std::nullopt;
    }
    return relative;
}

} // namespace Utils
