#ifndef INCLUDE_SECUREBOX_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_SECUREBOX_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace securebox::storage
{

class VaultNotFound final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class VaultAlreadyExists final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The file exists but does not parse into a vault snapshot (wrong schema, type or field length).
class CorruptVaultFile final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The new file is already in place; only flushing its directory entry failed.
class UnsyncedWrite final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace securebox::storage

#endif // INCLUDE_SECUREBOX_STORAGE_STORAGEERRORS_HPP
