#ifndef INCLUDE_SECUREBOX_SECURITY_SECURESTRING_HPP
#define INCLUDE_SECUREBOX_SECURITY_SECURESTRING_HPP

#include "securebox/security/SecureBuffer.hpp"
#include "securebox/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

namespace securebox::security
{
// Master passwords and container text. Not null-terminated.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // Parentheses select the range constructor.
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline SecureString secureStringFrom(std::span<const std::byte> bytes)
{
    SecureString out{};
    out.resize(bytes.size());
    if (!bytes.empty())
    {
        std::memcpy(out.data(), bytes.data(), bytes.size());
    }
    return out;
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

inline void secureClear(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    s.clear();
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    SecureString temp{};
    s.swap(temp);
}

} // namespace securebox::security

#endif // INCLUDE_SECUREBOX_SECURITY_SECURESTRING_HPP
