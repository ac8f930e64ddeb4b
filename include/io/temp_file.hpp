#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace otadump {

// mkstemp(3) file that is unlinked when the object goes away.
class TempFile {
public:
    // |dir| empty means $TMPDIR, falling back to /tmp.
    static Result Create(const std::string& dir, const std::string& prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    bool Valid() const { return !path_.empty(); }
    // Closes the descriptor but keeps the file until destruction.
    void Close();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

} // namespace otadump
