#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace otadump {

// pread(2)-backed reader. Safe to share between threads once opened.
class PositionalFileReader final : public IReadAt {
public:
    static Result Open(std::string path, PositionalFileReader &out);

    Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const override;
    std::uint64_t Size() const override { return size_; }

    const std::string& Path() const { return path_; }
    bool IsOpen() const { return fd_.Valid(); }

private:
    std::string path_;
    Fd fd_;
    std::uint64_t size_ = 0;
};

} // namespace otadump
