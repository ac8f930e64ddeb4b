#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace otadump {

// Output image for one partition. Owned by a single worker.
class PartitionWriter final : public IWriteAt {
  public:
    // Creates (or truncates) |path| and sizes it to |size| bytes so that later
    // positioned writes never extend the file.
    static Result Create(std::string path, std::uint64_t size, PartitionWriter& out);

    Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    std::uint64_t Size() const { return size_; }
    const std::string& Path() const { return path_; }
    int Get() const { return fd_.Get(); }

  private:
    std::string path_;
    Fd fd_;
    std::uint64_t size_ = 0;
};

} // namespace otadump
