#include "Archiver.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <climits>
#include <cstring>
#include <memory>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {
constexpr std::size_t kCopyBufferSize = 64 * 1024;

struct ArchiveWriterDeleter {
    void operator()(struct archive* writer) const { archive_write_free(writer); }
};
using ArchiveWriterPtr = std::unique_ptr<struct archive, ArchiveWriterDeleter>;

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* entry) const { archive_entry_free(entry); }
};
using ArchiveEntryPtr = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_{-1};
};

// Removes the staging file on every exit path unless it was committed
class StagingFile {
public:
    explicit StagingFile(fs::path path) : path_(std::move(path)) {}
    ~StagingFile() {
        if (!committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }
    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    const fs::path& path() const { return path_; }

    void commit(const fs::path& destination) {
        std::error_code ec;
        fs::rename(path_, destination, ec);
        if (ec) {
            THROW_APP_ERROR(Code::ARCHIVE_COMMIT_FAILED,
                            fmt::format("{}: {}", Utils::path_to_utf8(destination), ec.message()));
        }
        committed_ = true;
    }

private:
    fs::path path_;
    bool committed_{false};
};

std::string archive_error(struct archive* writer)
{
    const char* message = archive_error_string(writer);
    return message ? message : "unknown libarchive error";
}

fs::path parent_directory_of(const fs::path& destination)
{
    const fs::path parent = destination.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}
}

Archiver::Archiver(FileScanner& scanner)
    : scanner(scanner)
{
}


ArchiveJob Archiver::prepare(const fs::path& root,
                             const fs::path& destination,
                             const std::optional<std::string>& extension) const
{
    ArchiveJob job;
    job.base_dir = root;
    job.destination = destination;
    job.entries = scanner.build(root, extension);

    // A previous archive written into the tree must not be stored in the new one
    const auto is_destination = [&destination](const FileEntry& entry) {
        std::error_code ec;
        return fs::equivalent(entry.path, destination, ec);
    };
    job.entries.erase(std::remove_if(job.entries.begin(), job.entries.end(), is_destination),
                      job.entries.end());
    return job;
}


ArchiveSummary Archiver::backup(const fs::path& root,
                                const fs::path& destination,
                                const std::optional<std::string>& extension) const
{
    return archive(prepare(root, destination, extension));
}


ArchiveSummary Archiver::archive(const ArchiveJob& job) const
{
    auto logger = Logger::get_logger("core_logger");
    validate(job);

    // Every name is checked before the first byte is written
    std::vector<fs::path> names;
    names.reserve(job.entries.size());
    for (const auto& entry : job.entries) {
        names.push_back(entry_name(entry.path, job.base_dir));
    }

    ArchiveSummary summary;
    summary.destination = job.destination;
    StagingFile staging(staging_path_for(job.destination));
    const std::string staging_label = Utils::path_to_utf8(staging.path());

    {
        ArchiveWriterPtr writer(archive_write_new());
        if (!writer) {
            THROW_APP_ERROR(Code::ARCHIVE_INIT_FAILED, "archive_write_new");
        }
        if (archive_write_add_filter_gzip(writer.get()) < ARCHIVE_WARN
            || archive_write_set_format_pax_restricted(writer.get()) < ARCHIVE_WARN) {
            THROW_APP_ERROR(Code::ARCHIVE_INIT_FAILED, archive_error(writer.get()));
        }
        if (archive_write_open_filename(writer.get(), staging.path().c_str()) != ARCHIVE_OK) {
            THROW_APP_ERROR(Code::ARCHIVE_OPEN_FAILED,
                            fmt::format("{}: {}", staging_label, archive_error(writer.get())));
        }

        if (logger) {
            logger->debug("Streaming {} file(s) into '{}'", job.entries.size(), staging_label);
        }
        for (std::size_t i = 0; i < job.entries.size(); ++i) {
            write_entry(writer.get(), job.entries[i], names[i], summary);
        }

        if (archive_write_close(writer.get()) != ARCHIVE_OK) {
            THROW_APP_ERROR(Code::ARCHIVE_FINALIZE_FAILED,
                            fmt::format("{}: {}", staging_label, archive_error(writer.get())));
        }
    }

    staging.commit(job.destination);
    if (logger) {
        logger->debug("Archive '{}' committed with {} file(s), {} skipped",
                      Utils::path_to_utf8(job.destination), summary.stored, summary.skipped.size());
    }
    return summary;
}


fs::path Archiver::entry_name(const fs::path& path, const fs::path& base_dir)
{
    auto relative = Utils::relative_to_base(path, base_dir);
    if (!relative) {
        THROW_APP_ERROR(Code::PATH_ESCAPES_ROOT,
                        fmt::format("{} (root {})", Utils::path_to_utf8(path),
                                    Utils::path_to_utf8(base_dir)));
    }
    return *relative;
}


fs::path Archiver::staging_path_for(const fs::path& destination)
{
    static std::atomic<unsigned> counter{0};
    const std::string suffix = fmt::format(".partial-{}-{}",
                                           static_cast<long>(::getpid()),
                                           counter.fetch_add(1, std::memory_order_relaxed));

    // Shorten the borrowed name so the staging name stays within NAME_MAX,
    // cutting on a UTF-8 boundary
    std::string stem = destination.filename().native();
    const std::size_t room = NAME_MAX - 1 - suffix.size();
    if (stem.size() > room) {
        std::size_t cut = room;
        while (cut > 0 && (static_cast<unsigned char>(stem[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        stem.resize(cut);
    }
    return parent_directory_of(destination) / fs::path("." + stem + suffix);
}


void Archiver::validate(const ArchiveJob& job) const
{
    if (!Utils::is_valid_directory(job.base_dir)) {
        THROW_APP_ERROR(Code::DIRECTORY_INVALID, Utils::path_to_utf8(job.base_dir));
    }
    const std::string destination_label = Utils::path_to_utf8(job.destination);
    if (job.destination.empty() || !job.destination.has_filename()
        || Utils::is_valid_directory(job.destination)) {
        THROW_APP_ERROR_MSG(Code::VALIDATION_INVALID_ARGUMENT,
                            "Archive destination must be a file path", destination_label);
    }
    const fs::path parent = parent_directory_of(job.destination);
    if (!Utils::is_writable_directory(parent)) {
        THROW_APP_ERROR(Code::DIRECTORY_NOT_WRITABLE, Utils::path_to_utf8(parent));
    }
}


void Archiver::write_entry(struct archive* writer,
                           const FileEntry& entry,
                           const fs::path& name,
                           ArchiveSummary& summary) const
{
    auto logger = Logger::get_logger("core_logger");
    const std::string label = Utils::path_to_utf8(entry.path);

    FileDescriptor input(::open(entry.path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW));
    struct stat info{};
    if (!input || ::fstat(input.get(), &info) != 0 || !S_ISREG(info.st_mode)) {
        const std::string reason = std::strerror(errno);
        summary.skipped.push_back(fmt::format("{}: {}", label, reason));
        if (logger) {
            logger->warn("Skipping '{}': {}", label, reason);
        }
        return;
    }

    ArchiveEntryPtr header(archive_entry_new());
    archive_entry_set_pathname_utf8(header.get(), Utils::path_to_utf8(name).c_str());
    archive_entry_set_filetype(header.get(), AE_IFREG);
    archive_entry_set_perm(header.get(), info.st_mode & 07777);
    archive_entry_set_size(header.get(), info.st_size);
    archive_entry_set_mtime(header.get(), info.st_mtime, 0);
    if (archive_write_header(writer, header.get()) < ARCHIVE_WARN) {
        THROW_APP_ERROR(Code::ARCHIVE_WRITE_FAILED,
                        fmt::format("{}: {}", label, archive_error(writer)));
    }

    const auto expected = static_cast<std::uintmax_t>(info.st_size);
    std::uintmax_t copied = 0;
    std::vector<char> buffer(kCopyBufferSize);
    while (true) {
        const ssize_t count = ::read(input.get(), buffer.data(), buffer.size());
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW_APP_ERROR(Code::ARCHIVE_WRITE_FAILED,
                            fmt::format("{}: {}", label, std::strerror(errno)));
        }
        if (count == 0) {
            break;
        }
        if (copied + static_cast<std::uintmax_t>(count) > expected) {
            THROW_APP_ERROR(Code::ARCHIVE_ENTRY_CHANGED, label);
        }
        if (archive_write_data(writer, buffer.data(), static_cast<std::size_t>(count)) != count) {
            THROW_APP_ERROR(Code::ARCHIVE_WRITE_FAILED,
                            fmt::format("{}: {}", label, archive_error(writer)));
        }
        copied += static_cast<std::uintmax_t>(count);
    }
    if (copied != expected) {
        THROW_APP_ERROR(Code::ARCHIVE_ENTRY_CHANGED, label);
    }
    if (archive_write_finish_entry(writer) < ARCHIVE_WARN) {
        THROW_APP_ERROR(Code::ARCHIVE_WRITE_FAILED,
                        fmt::format("{}: {}", label, archive_error(writer)));
    }

    ++summary.stored;
    summary.stored_bytes += copied;
    if (logger) {
        logger->trace("Stored '{}' as '{}'", label, Utils::path_to_utf8(name));
    }
}
