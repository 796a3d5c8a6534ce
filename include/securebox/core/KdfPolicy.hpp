#ifndef INCLUDE_SECUREBOX_CORE_KDFPOLICY_HPP
#define INCLUDE_SECUREBOX_CORE_KDFPOLICY_HPP

#include "securebox/crypto/KdfMetadata.hpp"
#include <optional>

namespace securebox::core
{

// Cost parameters chosen by the caller. The salt is always fresh and never part of the policy.
struct KdfParams final
{
    securebox::crypto::KdfAlgorithm algorithm{ securebox::crypto::KdfAlgorithm::Argon2id };
    securebox::crypto::Argon2idParams argon2id{};
    securebox::crypto::Pbkdf2Params pbkdf2{};
};

[[nodiscard]] securebox::crypto::Argon2idParams defaultArgon2idParams() noexcept;

[[nodiscard]] securebox::crypto::Pbkdf2Params defaultPbkdf2Params() noexcept;

[[nodiscard]] KdfParams defaultKdfParams() noexcept;

// Cost parameters of an existing vault, used when rotating keys under the same policy.
[[nodiscard]] KdfParams kdfParamsOf(const securebox::crypto::KdfMetadata& meta) noexcept;

// Returns std::nullopt when the OS random source fails.
[[nodiscard]] std::optional<securebox::crypto::KdfMetadata> makeKdfMetadata(const KdfParams& params) noexcept;

} // namespace securebox::core

#endif // INCLUDE_SECUREBOX_CORE_KDFPOLICY_HPP
