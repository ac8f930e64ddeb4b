#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/types.h>

namespace otadump {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added; errors carry errno and the path.
    static Result Open(const std::string& path, int flags, mode_t mode, Fd& out);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    void Close();

  private:
    int fd_{-1};
};

} // namespace otadump
