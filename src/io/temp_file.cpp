#include "io/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace otadump {

Result TempFile::Create(const std::string& dir, const std::string& prefix, TempFile& out) {
    std::string base = dir;
    if (base.empty()) {
        const char* env = std::getenv("TMPDIR");
        base = (env && *env) ? env : "/tmp";
    }
    std::string pattern = base + "/" + prefix + "XXXXXX";
    std::vector<char> tmpl(pattern.begin(), pattern.end());
    tmpl.push_back('\0');

    const int fd = ::mkostemp(tmpl.data(), O_CLOEXEC);
    if (fd < 0)
        return Result::Fail(errno, "mkstemp failed in " + base);

    TempFile tmp;
    tmp.fd_.Reset(fd);
    tmp.path_ = tmpl.data();
    out = std::move(tmp);
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace otadump
