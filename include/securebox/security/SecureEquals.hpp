#ifndef INCLUDE_SECUREBOX_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_SECUREBOX_SECURITY_SECUREEQUALS_HPP

#include "securebox/security/SecureBuffer.hpp"
#include "securebox/security/SecureString.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace securebox::security
{
// Constant-time for equal lengths. Lengths are not secret.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= std::to_integer<unsigned char>(a[i] ^ b[i]);
    }
    return (diff == 0);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

// MACs and tags: the size is part of the type, so only the content is compared.
template <std::size_t N>
[[nodiscard]] bool secureEquals(const std::array<std::uint8_t, N>& a, const std::array<std::uint8_t, N>& b) noexcept
{
    return secureEquals(std::as_bytes(std::span<const std::uint8_t, N>{ a }),
                        std::as_bytes(std::span<const std::uint8_t, N>{ b }));
}

[[nodiscard]] inline bool secureEquals(const SecureString& a, const SecureString& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace securebox::security

#endif // INCLUDE_SECUREBOX_SECURITY_SECUREEQUALS_HPP
