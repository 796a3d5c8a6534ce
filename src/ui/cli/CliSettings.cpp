#include "CliSettings.hpp"

#include <QSettings>
#include <QString>
#include <QVariant>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

namespace securebox::ui::cli
{

namespace
{

constexpr const char* g_kAppDir{ "securebox" };

[[nodiscard]] std::filesystem::path xdgDir(const char* variable, const char* homeFallback)
{
    if (const char* v = std::getenv(variable); v != nullptr && *v != '\0')
    {
        return std::filesystem::path{ v };
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0')
    {
        return std::filesystem::path{ home } / homeFallback;
    }
    return std::filesystem::current_path();
}

[[nodiscard]] QString toQString(const std::filesystem::path& p)
{
    return QString::fromStdString(p.string());
}

[[nodiscard]] std::filesystem::path toPath(const QVariant& v)
{
    return std::filesystem::path{ v.toString().toStdString() };
}

void setDefault(QSettings& settings, const char* key, const QVariant& value)
{
    if (!settings.contains(QString::fromUtf8(key)))
    {
        settings.setValue(QString::fromUtf8(key), value);
    }
}

[[nodiscard]] std::uint32_t readU32(const QSettings& settings, const char* key)
{
    bool ok{ false };
    const qulonglong v{ settings.value(QString::fromUtf8(key)).toULongLong(&ok) };
    if (!ok || v > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument(std::string{ "config: invalid value for " } + key);
    }
    return static_cast<std::uint32_t>(v);
}

[[nodiscard]] securebox::core::KdfParams readKdf(const QSettings& settings)
{
    securebox::core::KdfParams params{ securebox::core::defaultKdfParams() };

    const std::string algorithm{ settings.value("kdf/algorithm").toString().toLower().toStdString() };
    if (algorithm == "argon2id")
    {
        params.algorithm = securebox::crypto::KdfAlgorithm::Argon2id;
        params.argon2id.iterations = readU32(settings, "kdf/iterations");
        params.argon2id.memoryKiB = readU32(settings, "kdf/memoryKiB");
        params.argon2id.parallelism = readU32(settings, "kdf/parallelism");
    }
    else if (algorithm == "pbkdf2")
    {
        params.algorithm = securebox::crypto::KdfAlgorithm::Pbkdf2HmacSha256;
        // The Argon2id default iteration count is far too low for PBKDF2.
        if (settings.contains("kdf/pbkdf2Iterations"))
        {
            params.pbkdf2.iterations = readU32(settings, "kdf/pbkdf2Iterations");
        }
    }
    else
    {
        throw std::invalid_argument("config: kdf/algorithm must be argon2id or pbkdf2");
    }
    return params;
}

} // namespace

std::filesystem::path defaultConfigFile()
{
    return xdgDir("XDG_CONFIG_HOME", ".config") / g_kAppDir / "securebox.conf";
}

std::filesystem::path defaultVaultPath()
{
    return xdgDir("XDG_DATA_HOME", ".local/share") / g_kAppDir / "securebox.db";
}

CliSettings loadCliSettings(const std::filesystem::path& configFile)
{
    if (const auto dir{ configFile.parent_path() }; !dir.empty())
    {
        std::error_code ec{};
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            throw std::runtime_error("config: cannot create " + dir.string());
        }
    }

    QSettings settings{ toQString(configFile), QSettings::IniFormat };

    const auto argon2{ securebox::core::defaultArgon2idParams() };
    setDefault(settings, "vault/path", toQString(defaultVaultPath()));
    setDefault(settings, "vault/autoUpload", false);
    setDefault(settings, "backup/directory", QString{});
    setDefault(settings, "kdf/algorithm", QStringLiteral("argon2id"));
    setDefault(settings, "kdf/iterations", argon2.iterations);
    setDefault(settings, "kdf/memoryKiB", argon2.memoryKiB);
    setDefault(settings, "kdf/parallelism", argon2.parallelism);
    setDefault(settings, "log/auditFile", QString{});
    settings.sync();
    if (settings.status() == QSettings::FormatError)
    {
        throw std::invalid_argument("config: cannot parse " + configFile.string());
    }

    CliSettings out{};
    out.configFile = configFile;
    out.vaultPath = toPath(settings.value("vault/path"));
    out.autoUpload = settings.value("vault/autoUpload").toBool();
    out.backupDirectory = toPath(settings.value("backup/directory"));
    out.auditFile = toPath(settings.value("log/auditFile"));
    out.kdf = readKdf(settings);
    return out;
}

} // namespace securebox::ui::cli
