#ifndef INCLUDE_SECUREBOX_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_SECUREBOX_SECURITY_SCOPEWIPE_HPP

#include "securebox/security/MemoryWiper.hpp"
#include "securebox/security/SecureBuffer.hpp"
#include "securebox/security/SecureString.hpp"
#include <cstdint>
#include <span>

namespace securebox::security
{
// Wipes a borrowed byte range when the guard leaves scope, unless released first.
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.release();
    }

    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            secureWipe(m_bytes);
            m_bytes = other.m_bytes;
            other.release();
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    void release() noexcept
    {
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::byte> b) noexcept
{
    return ScopeWipe{ b };
}

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

} // namespace securebox::security

#endif // INCLUDE_SECUREBOX_SECURITY_SCOPEWIPE_HPP
