#ifndef INCLUDE_SECUREBOX_SECURITY_SECURERANDOM_HPP
#define INCLUDE_SECUREBOX_SECURITY_SECURERANDOM_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace securebox::security
{

// Fills `out` from the OS CSPRNG. Returns false if the OS source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

template <std::size_t N> [[nodiscard]] std::optional<std::array<std::uint8_t, N>> secureRandomArray() noexcept
{
    std::array<std::uint8_t, N> out{};
    if (!secureRandomFill(std::span<std::uint8_t>{ out }))
    {
        return std::nullopt;
    }
    return out;
}

} // namespace securebox::security

#endif // INCLUDE_SECUREBOX_SECURITY_SECURERANDOM_HPP
