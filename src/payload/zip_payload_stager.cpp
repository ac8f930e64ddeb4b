#include "payload/zip_payload_stager.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <memory>
#include <span>
#include <unistd.h>
#include <utility>
#include <vector>

namespace otadump {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const { (void)archive_read_free(a); }
};
using ArchivePtr = std::unique_ptr<archive, ArchiveReadDeleter>;

Result WriteAllToFd(int fd, std::span<const std::uint8_t> data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(errno, "write failed while staging payload");
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

std::string ArchiveError(archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown libarchive error";
}

} // namespace

bool LooksLikeZip(const IReadAt& in) {
    if (in.Size() < 4) return false;
    std::array<std::uint8_t, 4> magic{};
    if (!in.ReadAt(0, magic).ok) return false;
    return magic[0] == 'P' && magic[1] == 'K' && magic[2] == 3 && magic[3] == 4;
}

Result StagePayloadFromZip(const std::string& zip_path,
                           const std::string& staging_dir,
                           TempFile& out) {
    ArchivePtr a(archive_read_new());
    if (!a)
        return Result::Fail(ErrorKind::Io, "archive_read_new failed");
    archive_read_support_format_zip(a.get());

    if (archive_read_open_filename(a.get(), zip_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Io,
                            "Could not open archive " + zip_path + ": " + ArchiveError(a.get()));
    }

    archive_entry* entry = nullptr;
    while (true) {
        const int rc = archive_read_next_header(a.get(), &entry);
        if (rc == ARCHIVE_EOF) break;
        if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::CorruptData,
                                "Bad zip archive " + zip_path + ": " + ArchiveError(a.get()));
        }

        const char* raw = archive_entry_pathname(entry);
        if (!raw || NormalizeArchivePath(raw) != kPayloadEntryName) continue;

        TempFile tmp;
        auto r = TempFile::Create(staging_dir, "otadump-payload-", tmp);
        if (!r.ok) return r;

        LogInfo("Staging %s from %s to %s", kPayloadEntryName, zip_path.c_str(), tmp.Path().c_str());

        std::vector<std::uint8_t> buf(1024 * 1024);
        std::uint64_t total = 0;
        while (true) {
            const la_ssize_t n = archive_read_data(a.get(), buf.data(), buf.size());
            if (n < 0) {
                return Result::Fail(ErrorKind::CorruptData,
                                    "Failed to read " + std::string(kPayloadEntryName) +
                                        " from " + zip_path + ": " + ArchiveError(a.get()));
            }
            if (n == 0) break;
            r = WriteAllToFd(tmp.GetFd(),
                             std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
            if (!r.ok) return r;
            total += static_cast<std::uint64_t>(n);
        }
        tmp.Close();
        LogDebug("Staged %llu bytes", (unsigned long long)total);

        out = std::move(tmp);
        return Result::Ok();
    }

    return Result::Fail(ErrorKind::MissingField,
                        std::string(kPayloadEntryName) + " not found in " + zip_path);
}

} // namespace otadump
