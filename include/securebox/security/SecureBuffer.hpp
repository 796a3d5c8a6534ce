#ifndef INCLUDE_SECUREBOX_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_SECUREBOX_SECURITY_SECUREBUFFER_HPP

#include "securebox/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace securebox::security
{
// Key material and decrypted payloads. Wiped when the storage is released.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::byte> bytes)
{
    SecureBuffer out{};
    out.resize(bytes.size());
    if (!bytes.empty())
    {
        std::memcpy(out.data(), bytes.data(), bytes.size());
    }
    return out;
}

inline void secureClear(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
    b.clear();
}

inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
    SecureBuffer temp{};
    b.swap(temp);
}

} // namespace securebox::security

#endif // INCLUDE_SECUREBOX_SECURITY_SECUREBUFFER_HPP
