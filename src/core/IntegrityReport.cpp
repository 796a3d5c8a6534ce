#include "securebox/core/IntegrityReport.hpp"
#include <algorithm>

namespace securebox::core
{

[[nodiscard]] bool IntegrityReport::passed() const noexcept
{
    return keyCheckValid && sealValid &&
           std::all_of(containers.begin(), containers.end(),
                       [](const ContainerCheck& c) { return c.status == ContainerStatus::Verified; });
}

[[nodiscard]] std::vector<ContainerId> IntegrityReport::failedIds() const
{
    std::vector<ContainerId> out{};
    for (const auto& c : containers)
    {
        if (c.status != ContainerStatus::Verified)
        {
            out.push_back(c.id);
        }
    }
    return out;
}

} // namespace securebox::core
