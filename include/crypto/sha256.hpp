#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace otadump {

inline constexpr std::size_t kSha256Size = 32;
using Sha256Digest = std::array<std::uint8_t, kSha256Size>;

std::string HexEncode(std::span<const std::uint8_t> bytes);

// Returns false only if the OpenSSL digest context could not be driven.
bool Sha256(std::span<const std::uint8_t> data, Sha256Digest& out);
std::string Sha256Hex(std::span<const std::uint8_t> data);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    bool Final(Sha256Digest& out);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace otadump
