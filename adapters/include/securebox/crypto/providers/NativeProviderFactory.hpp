#ifndef INCLUDE_SECUREBOX_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_SECUREBOX_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "securebox/crypto/ICryptoProvider.hpp"
#include <memory>

namespace securebox::crypto::providers
{

// monocypher: IETF ChaCha20-Poly1305, keyed BLAKE2b for subkeys and the seal MAC, Argon2id only.
[[nodiscard]] std::unique_ptr<securebox::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace securebox::crypto::providers

#endif // INCLUDE_SECUREBOX_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
