#ifndef SECUREBOX_UI_CLI_CLISETTINGS_HPP
#define SECUREBOX_UI_CLI_CLISETTINGS_HPP

#include "securebox/core/KdfPolicy.hpp"
#include <filesystem>

namespace securebox::ui::cli
{

// Front-end configuration. An empty path means "not configured".
struct CliSettings final
{
    std::filesystem::path configFile;
    std::filesystem::path vaultPath;
    // Upload a backup whenever the open vault is closed.
    bool autoUpload{ false };
    std::filesystem::path backupDirectory;
    std::filesystem::path auditFile;
    securebox::core::KdfParams kdf{ securebox::core::defaultKdfParams() };
};

// $XDG_CONFIG_HOME/securebox/securebox.conf, falling back to ~/.config.
[[nodiscard]] std::filesystem::path defaultConfigFile();

// $XDG_DATA_HOME/securebox/securebox.db, falling back to ~/.local/share.
[[nodiscard]] std::filesystem::path defaultVaultPath();

// Reads the INI file, writing defaults for missing keys. Throws std::invalid_argument on bad values.
[[nodiscard]] CliSettings loadCliSettings(const std::filesystem::path& configFile);

} // namespace securebox::ui::cli

#endif // SECUREBOX_UI_CLI_CLISETTINGS_HPP
