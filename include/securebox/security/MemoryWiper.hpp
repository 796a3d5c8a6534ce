#ifndef INCLUDE_SECUREBOX_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_SECUREBOX_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace securebox::security
{
// Zeroes memory in a way the optimizer is not allowed to elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipeObject(T& object) noexcept
{
    secureWipe(std::as_writable_bytes(std::span<T, 1>{ &object, 1 }));
}

// For plain std::string that briefly held a secret (command lines, file contents).
// Zeroes the whole capacity and leaves the string empty.
void secureWipeString(std::string& s) noexcept;

void secureWipeStrings(std::vector<std::string>& words) noexcept;
} // namespace securebox::security
#endif // INCLUDE_SECUREBOX_SECURITY_MEMORYWIPER_HPP
