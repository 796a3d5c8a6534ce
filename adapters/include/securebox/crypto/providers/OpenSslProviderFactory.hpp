#ifndef INCLUDE_SECUREBOX_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_SECUREBOX_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "securebox/crypto/ICryptoProvider.hpp"
#include <memory>

namespace securebox::crypto::providers
{

// OpenSSL 3: same algorithms as the native provider, so either one opens the other's vaults.
// Adds PBKDF2-HMAC-SHA256; Argon2id only where the library ships it (3.2 and later).
[[nodiscard]] std::unique_ptr<securebox::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace securebox::crypto::providers

#endif // INCLUDE_SECUREBOX_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
