#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <sys/types.h>

namespace otadump {

// Random-access reader. Implementations must not keep a shared cursor so
// that concurrent ReadAt() calls never interfere.
class IReadAt {
public:
    virtual ~IReadAt() = default;

    // Fills |out| completely from |offset| or fails.
    virtual Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const = 0;
    virtual std::uint64_t Size() const = 0;
};

class IWriteAt {
public:
    virtual ~IWriteAt() = default;
    virtual Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

} // namespace otadump
