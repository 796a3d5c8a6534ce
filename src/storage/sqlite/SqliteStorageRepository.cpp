#include "securebox/storage/sqlite/SqliteStorageRepositoryFactory.hpp"

#include "securebox/crypto/ICryptoProvider.hpp"
#include "securebox/storage/IStorageRepository.hpp"
#include "securebox/storage/StorageErrors.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sqlite3.h>

#if !defined(_WIN32)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace securebox::storage::sqlite
{
namespace
{

constexpr std::string_view g_kTempSuffix{ ".tmp" };

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

// Errors that mean "this is not a vault database" rather than "the disk failed".
[[nodiscard]] bool isFormatError(int rc) noexcept
{
    const int primary{ rc & 0xFF };
    return primary == SQLITE_NOTADB || primary == SQLITE_CORRUPT || primary == SQLITE_ERROR ||
           primary == SQLITE_MISMATCH;
}

[[noreturn]] void throwLoadError(sqlite3* db, int rc, const char* what)
{
    if (isFormatError(rc))
    {
        throw CorruptVaultFile(sqliteErr(db, what));
    }
    throw std::runtime_error(sqliteErr(db, what));
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw std::runtime_error(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, int flags)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw std::runtime_error(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    return db;
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (rc != SQLITE_OK || !stmt)
    {
        throwLoadError(db, rc, "storage: sqlite3_prepare_v2 failed");
    }
    return stmt;
}

void bindInt(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t v)
{
    if (sqlite3_bind_int64(stmt, index, v) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "storage: bind integer failed"));
    }
}

// An empty blob is bound as a zero-length blob, never as NULL.
void bindBlob(sqlite3* db, sqlite3_stmt* stmt, int index, std::span<const std::uint8_t> bytes)
{
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument("storage: blob too large");
    }
    const int rc = bytes.empty()
                       ? sqlite3_bind_zeroblob(stmt, index, 0)
                       : sqlite3_bind_blob(stmt, index, bytes.data(), static_cast<int>(bytes.size()), SQLITE_STATIC);
    if (rc != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "storage: bind blob failed"));
    }
}

void stepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE)
    {
        throw std::runtime_error(sqliteErr(db, what));
    }
}

[[nodiscard]] std::int64_t columnInt(sqlite3_stmt* stmt, int col, const char* what)
{
    if (sqlite3_column_type(stmt, col) != SQLITE_INTEGER)
    {
        throw CorruptVaultFile(what);
    }
    return sqlite3_column_int64(stmt, col);
}

[[nodiscard]] std::uint32_t columnU32(sqlite3_stmt* stmt, int col, const char* what)
{
    const std::int64_t v{ columnInt(stmt, col, what) };
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
    {
        throw CorruptVaultFile(what);
    }
    return static_cast<std::uint32_t>(v);
}

[[nodiscard]] std::span<const std::uint8_t> columnBlob(sqlite3_stmt* stmt, int col, const char* what)
{
    if (sqlite3_column_type(stmt, col) != SQLITE_BLOB)
    {
        throw CorruptVaultFile(what);
    }
    const void* ptr = sqlite3_column_blob(stmt, col);
    const int bytes = sqlite3_column_bytes(stmt, col);
    if (bytes < 0 || (bytes > 0 && ptr == nullptr))
    {
        throw CorruptVaultFile(what);
    }
    if (bytes == 0)
    {
        return {};
    }
    return std::span<const std::uint8_t>{ static_cast<const std::uint8_t*>(ptr), static_cast<std::size_t>(bytes) };
}

// Fixed-length fields are rejected on any size mismatch, never padded or truncated.
template <std::size_t N>
void columnFixed(sqlite3_stmt* stmt, int col, std::array<std::uint8_t, N>& out, const char* what)
{
    const auto bytes{ columnBlob(stmt, col, what) };
    if (bytes.size() != N)
    {
        throw CorruptVaultFile(what);
    }
    std::copy(bytes.begin(), bytes.end(), out.begin());
}

void createSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE vault_key ("
             " id INTEGER PRIMARY KEY CHECK(id = 1),"
             " format_version INTEGER NOT NULL,"
             " policy_version INTEGER NOT NULL,"
             " algorithm INTEGER NOT NULL,"
             " argon2_version INTEGER NOT NULL,"
             " derived_key_bytes INTEGER NOT NULL,"
             " argon2_iterations INTEGER NOT NULL,"
             " argon2_memory_kib INTEGER NOT NULL,"
             " argon2_parallelism INTEGER NOT NULL,"
             " pbkdf2_iterations INTEGER NOT NULL,"
             " salt BLOB NOT NULL,"
             " iv BLOB NOT NULL,"
             " check_tag BLOB NOT NULL,"
             " check_cipher BLOB NOT NULL,"
             " next_container_id INTEGER NOT NULL,"
             " seal BLOB NOT NULL"
             ");"
             "CREATE TABLE containers ("
             " id INTEGER PRIMARY KEY,"
             " position INTEGER NOT NULL UNIQUE,"
             " cipher BLOB NOT NULL,"
             " mac BLOB NOT NULL,"
             " salt BLOB NOT NULL,"
             " iv BLOB NOT NULL"
             ");");
}

void insertKey(sqlite3* db, const VaultSnapshot& snapshot)
{
    auto stmt = prepare(db, "INSERT INTO vault_key(id, format_version, policy_version, algorithm, argon2_version,"
                            " derived_key_bytes, argon2_iterations, argon2_memory_kib, argon2_parallelism,"
                            " pbkdf2_iterations, salt, iv, check_tag, check_cipher, next_container_id, seal)"
                            " VALUES (1, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    const auto& kdf{ snapshot.key.kdf };
    const auto& check{ snapshot.key.keyCheck };

    bindInt(db, stmt.get(), 1, snapshot.formatVersion);
    bindInt(db, stmt.get(), 2, kdf.policyVersion);
    bindInt(db, stmt.get(), 3, static_cast<std::uint32_t>(kdf.algorithm));
    bindInt(db, stmt.get(), 4, kdf.argon2Version);
    bindInt(db, stmt.get(), 5, kdf.derivedKeyBytes);
    bindInt(db, stmt.get(), 6, kdf.argon2id.iterations);
    bindInt(db, stmt.get(), 7, kdf.argon2id.memoryKiB);
    bindInt(db, stmt.get(), 8, kdf.argon2id.parallelism);
    bindInt(db, stmt.get(), 9, kdf.pbkdf2.iterations);
    bindBlob(db, stmt.get(), 10, kdf.salt);
    bindBlob(db, stmt.get(), 11, check.nonce);
    bindBlob(db, stmt.get(), 12, check.tag);
    bindBlob(db, stmt.get(), 13, check.cipherText);
    bindInt(db, stmt.get(), 14, snapshot.nextContainerId);
    bindBlob(db, stmt.get(), 15, snapshot.seal);
    stepDone(db, stmt.get(), "storage: insert vault_key failed");
}

void insertContainers(sqlite3* db, const VaultSnapshot& snapshot)
{
    auto stmt = prepare(db, "INSERT INTO containers(id, position, cipher, mac, salt, iv) VALUES (?, ?, ?, ?, ?, ?);");

    std::int64_t position{ 0 };
    for (const auto& record : snapshot.containers)
    {
        if (sqlite3_reset(stmt.get()) != SQLITE_OK)
        {
            throw std::runtime_error(sqliteErr(db, "storage: reset failed"));
        }
        bindInt(db, stmt.get(), 1, record.id);
        bindInt(db, stmt.get(), 2, position++);
        bindBlob(db, stmt.get(), 3, record.box.cipherText);
        bindBlob(db, stmt.get(), 4, record.box.tag);
        bindBlob(db, stmt.get(), 5, record.salt);
        bindBlob(db, stmt.get(), 6, record.box.nonce);
        stepDone(db, stmt.get(), "storage: insert container failed");
    }
}

[[nodiscard]] KeyRecord loadKey(sqlite3* db, VaultSnapshot& snapshot)
{
    auto stmt = prepare(db, "SELECT format_version, policy_version, algorithm, argon2_version, derived_key_bytes,"
                            " argon2_iterations, argon2_memory_kib, argon2_parallelism, pbkdf2_iterations,"
                            " salt, iv, check_tag, check_cipher, next_container_id, seal"
                            " FROM vault_key WHERE id = 1;");

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
    {
        throw CorruptVaultFile("storage: missing vault_key row");
    }
    if (rc != SQLITE_ROW)
    {
        throwLoadError(db, rc, "storage: select vault_key failed");
    }

    snapshot.formatVersion = columnU32(stmt.get(), 0, "storage: invalid format_version");
    if (snapshot.formatVersion != g_vaultFormatVersion)
    {
        throw CorruptVaultFile("storage: unsupported format_version");
    }

    KeyRecord key{};
    key.kdf.policyVersion = columnU32(stmt.get(), 1, "storage: invalid policy_version");
    key.kdf.algorithm =
        static_cast<securebox::crypto::KdfAlgorithm>(columnU32(stmt.get(), 2, "storage: invalid algorithm"));
    key.kdf.argon2Version = columnU32(stmt.get(), 3, "storage: invalid argon2_version");
    key.kdf.derivedKeyBytes = columnU32(stmt.get(), 4, "storage: invalid derived_key_bytes");
    key.kdf.argon2id.iterations = columnU32(stmt.get(), 5, "storage: invalid argon2_iterations");
    key.kdf.argon2id.memoryKiB = columnU32(stmt.get(), 6, "storage: invalid argon2_memory_kib");
    key.kdf.argon2id.parallelism = columnU32(stmt.get(), 7, "storage: invalid argon2_parallelism");
    key.kdf.pbkdf2.iterations = columnU32(stmt.get(), 8, "storage: invalid pbkdf2_iterations");
    columnFixed(stmt.get(), 9, key.kdf.salt, "storage: invalid salt");
    columnFixed(stmt.get(), 10, key.keyCheck.nonce, "storage: invalid iv");
    columnFixed(stmt.get(), 11, key.keyCheck.tag, "storage: invalid check_tag");
    const auto checkCipher{ columnBlob(stmt.get(), 12, "storage: invalid check_cipher") };
    key.keyCheck.cipherText.assign(checkCipher.begin(), checkCipher.end());
    snapshot.nextContainerId = columnInt(stmt.get(), 13, "storage: invalid next_container_id");
    columnFixed(stmt.get(), 14, snapshot.seal, "storage: invalid seal");
    return key;
}

[[nodiscard]] std::vector<EncryptedContainer> loadContainers(sqlite3* db)
{
    auto stmt = prepare(db, "SELECT id, cipher, mac, salt, iv FROM containers ORDER BY position;");

    std::vector<EncryptedContainer> out{};
    for (;;)
    {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE)
        {
            return out;
        }
        if (rc != SQLITE_ROW)
        {
            throwLoadError(db, rc, "storage: select containers failed");
        }

        EncryptedContainer record{};
        record.id = columnInt(stmt.get(), 0, "storage: invalid container id");
        const auto cipher{ columnBlob(stmt.get(), 1, "storage: invalid cipher") };
        record.box.cipherText.assign(cipher.begin(), cipher.end());
        columnFixed(stmt.get(), 2, record.box.tag, "storage: invalid mac");
        columnFixed(stmt.get(), 3, record.salt, "storage: invalid container salt");
        columnFixed(stmt.get(), 4, record.box.nonce, "storage: invalid container iv");
        out.push_back(std::move(record));
    }
}

[[nodiscard]] std::filesystem::path tempPathFor(const std::filesystem::path& vaultPath)
{
    auto tmp{ vaultPath };
    tmp += std::string{ g_kTempSuffix };
    return tmp;
}

void syncParentDirectory(const std::filesystem::path& vaultPath)
{
#if !defined(_WIN32)
    auto dir{ vaultPath.parent_path() };
    if (dir.empty())
    {
        dir = ".";
    }
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
    {
        throw std::runtime_error("storage: failed to open vault directory for fsync");
    }
    const int rc = ::fsync(fd);
    (void)::close(fd);
    if (rc != 0)
    {
        throw std::runtime_error("storage: fsync of vault directory failed");
    }
#else
    (void)vaultPath;
#endif
}

void removeQuietly(const std::filesystem::path& path) noexcept
{
    std::error_code ec{};
    std::filesystem::remove(path, ec);
}

// Builds the whole database beside the target, then renames it into place.
void writeSnapshotAtomically(const std::filesystem::path& vaultPath, const VaultSnapshot& snapshot)
{
    const auto tmpPath{ tempPathFor(vaultPath) };
    removeQuietly(tmpPath);

    try
    {
        {
            auto db = openDb(tmpPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
            exec(db.get(), "PRAGMA journal_mode=DELETE;");
            exec(db.get(), "PRAGMA synchronous=FULL;");
            exec(db.get(), "BEGIN IMMEDIATE;");
            createSchema(db.get());
            insertKey(db.get(), snapshot);
            insertContainers(db.get(), snapshot);
            exec(db.get(), "COMMIT;");
        }

        std::filesystem::permissions(tmpPath, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace);
        std::filesystem::rename(tmpPath, vaultPath);
    }
    catch (const std::exception&)
    {
        removeQuietly(tmpPath);
        throw;
    }

    try
    {
        syncParentDirectory(vaultPath);
    }
    catch (const std::runtime_error& e)
    {
        throw securebox::storage::UnsyncedWrite(e.what());
    }
}

class SqliteStorageRepository final : public securebox::storage::IStorageRepository
{
public:
    [[nodiscard]] bool vaultExists(const std::filesystem::path& vaultPath) const override
    {
        std::error_code ec{};
        return std::filesystem::exists(vaultPath, ec) && !ec;
    }

    void createVault(const std::filesystem::path& vaultPath, const VaultSnapshot& snapshot) override
    {
        if (vaultExists(vaultPath))
        {
            throw VaultAlreadyExists("storage: vault already exists");
        }

        if (const auto parent{ vaultPath.parent_path() }; !parent.empty())
        {
            std::error_code ec{};
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw std::runtime_error("storage: failed to create vault directory");
            }
        }

        writeSnapshotAtomically(vaultPath, snapshot);
    }

    [[nodiscard]] VaultSnapshot loadVault(const std::filesystem::path& vaultPath) const override
    {
        std::error_code ec{};
        if (!std::filesystem::exists(vaultPath, ec))
        {
            throw VaultNotFound("storage: vault not found");
        }
        if (!std::filesystem::is_regular_file(vaultPath, ec))
        {
            throw CorruptVaultFile("storage: vault path is not a regular file");
        }

        auto db = openDb(vaultPath, SQLITE_OPEN_READONLY);

        VaultSnapshot snapshot{};
        snapshot.key = loadKey(db.get(), snapshot);
        snapshot.containers = loadContainers(db.get());
        return snapshot;
    }

    void replaceVault(const std::filesystem::path& vaultPath, const VaultSnapshot& snapshot) override
    {
        if (!vaultExists(vaultPath))
        {
            throw VaultNotFound("storage: vault not found");
        }
        writeSnapshotAtomically(vaultPath, snapshot);
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<securebox::storage::IStorageRepository> makeSqliteStorageRepository()
{
    return std::make_unique<SqliteStorageRepository>();
}

} // namespace securebox::storage::sqlite
