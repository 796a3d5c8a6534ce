#ifndef INCLUDE_SECUREBOX_CORE_INTEGRITYREPORT_HPP
#define INCLUDE_SECUREBOX_CORE_INTEGRITYREPORT_HPP

#include "securebox/core/Container.hpp"
#include <cstdint>
#include <vector>

namespace securebox::core
{

enum class ContainerStatus : std::uint8_t
{
    Verified,
    IntegrityFailed,
    CorruptFormat,
};

struct ContainerCheck final
{
    ContainerId id{};
    ContainerStatus status{ ContainerStatus::Verified };
};

// Per-record result of a whole-vault verification, in file order.
struct IntegrityReport final
{
    bool keyCheckValid{ false };
    bool sealValid{ false };
    std::vector<ContainerCheck> containers;

    [[nodiscard]] bool passed() const noexcept;

    [[nodiscard]] std::vector<ContainerId> failedIds() const;
};

} // namespace securebox::core

#endif // INCLUDE_SECUREBOX_CORE_INTEGRITYREPORT_HPP
