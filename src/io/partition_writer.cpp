// partition_writer.cpp - Positioned writer for reconstructed partition images.

#include "io/partition_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace otadump {

Result PartitionWriter::Create(std::string path, std::uint64_t size, PartitionWriter& out) {
    out.path_ = std::move(path);
    out.size_ = size;

    auto r = Fd::Open(out.path_, O_RDWR | O_CREAT | O_TRUNC, 0644, out.fd_);
    if (!r.ok) {
        return r;
    }

    int rc;
    do {
        rc = ::ftruncate(out.fd_.Get(), static_cast<off_t>(size));
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        const int e = errno;
        return Result::Fail(e, "Failed to size " + out.path_ + " to " + std::to_string(size) +
                                   " bytes (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

Result PartitionWriter::WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) {
    if (offset > size_ || in.size() > size_ - offset) {
        return Result::Fail(ErrorKind::SizeMismatch,
                            "Write of " + std::to_string(in.size()) + " bytes at offset " +
                                std::to_string(offset) + " exceeds partition size " +
                                std::to_string(size_));
    }

    size_t rem = in.size();
    const std::uint8_t* p = in.data();
    std::uint64_t pos = offset;

    while (rem > 0) {
        ssize_t n = ::pwrite(fd_.Get(), p, rem, static_cast<off_t>(pos));
        if (n > 0) {
            p += static_cast<size_t>(n);
            pos += static_cast<std::uint64_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = (n == 0) ? EIO : errno;
        return Result::Fail(e, "Write failed: " + path_ + " (" + std::string(std::strerror(e)) + ")");
    }

    return Result::Ok();
}

Result PartitionWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

} // namespace otadump
