#pragma once

#include <filesystem>
#include <functional>
#include <system_error>

namespace TestHooks {

// Replaces std::filesystem::remove for the cleanup sweep; returns whether a file was removed
using FileRemovalProbe = std::function<bool(const std::filesystem::path& path, std::error_code& ec)>;
void set_file_removal_probe(FileRemovalProbe probe);
void reset_file_removal_probe();

bool remove_file(const std::filesystem::path& path, std::error_code& ec);

} // namespace TestHooks
