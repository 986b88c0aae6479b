#include "TestHooks.hpp"

#include <utility>

namespace TestHooks {

namespace {
FileRemovalProbe& file_removal_probe()
{
    static FileRemovalProbe probe;
    return probe;
}
}

void set_file_removal_probe(FileRemovalProbe probe)
{
    file_removal_probe() = std::move(probe);
}

void reset_file_removal_probe()
{
    file_removal_probe() = nullptr;
}

bool remove_file(const std::filesystem::path& path, std::error_code& ec)
{
    if (const auto& probe = file_removal_probe()) {
        return probe(path, ec);
    }
    return std::filesystem::remove(path, ec);
}

} // namespace TestHooks
