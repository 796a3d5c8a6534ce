#include "securebox/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace securebox::security
{
void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(__linux__)
    ::explicit_bzero(bytes.data(), bytes.size());
#endif
}

void secureWipeString(std::string& s) noexcept
{
    // Bytes between size() and capacity() may still hold an older, longer value.
    std::span<char> whole{ s.data(), s.capacity() };
    secureWipe(std::as_writable_bytes(whole));
    s.clear();
}

void secureWipeStrings(std::vector<std::string>& words) noexcept
{
    for (auto& word : words)
    {
        secureWipeString(word);
    }
    words.clear();
}
} // namespace securebox::security
