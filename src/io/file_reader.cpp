#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace otadump {

Result PositionalFileReader::Open(std::string path, PositionalFileReader& out) {
    out.path_ = std::move(path);

    auto r = Fd::Open(out.path_, O_RDONLY, 0, out.fd_);
    if (!r.ok) {
        return r;
    }

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) != 0) {
        const int e = errno;
        return Result::Fail(e, "fstat failed: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        return Result::Fail(EISDIR, "Not a regular file: " + out.path_);
    }
    if (S_ISBLK(st.st_mode)) {
        const off_t end = ::lseek(out.fd_.Get(), 0, SEEK_END);
        out.size_ = end > 0 ? static_cast<std::uint64_t>(end) : 0;
    } else {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    }

    return Result::Ok();
}

Result PositionalFileReader::ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const {
    if (offset > size_ || out.size() > size_ - offset) {
        return Result::Fail(ErrorKind::TruncatedBlob,
                            "Read of " + std::to_string(out.size()) + " bytes at offset " +
                                std::to_string(offset) + " overruns " + path_ + " (size " +
                                std::to_string(size_) + ")");
    }

    size_t done = 0;
    while (done < out.size()) {
        const ssize_t n = ::pread(fd_.Get(),
                                  out.data() + done,
                                  out.size() - done,
                                  static_cast<off_t>(offset + done));
        if (n > 0) {
            done += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            return Result::Fail(ErrorKind::TruncatedBlob,
                                "Unexpected end of file in " + path_ + " at offset " +
                                    std::to_string(offset + done));
        }
        if (errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::Fail(e, "Read failed: " + path_ + " (" + std::strerror(e) + ")");
    }

    return Result::Ok();
}

} // namespace otadump
