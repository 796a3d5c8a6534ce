#ifndef SECUREBOX_UI_CLI_CONSOLEUTILS_HPP
#define SECUREBOX_UI_CLI_CONSOLEUTILS_HPP

#include "securebox/security/SecureString.hpp"
#include <filesystem>
#include <string>

namespace securebox::ui::cli
{

// Best effort: keeps secrets out of swap and core dumps.
void lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo disabled.
[[nodiscard]] securebox::security::SecureString readPassword(const std::string& prompt);

// Whole file contents; a single trailing newline is dropped. Throws std::runtime_error if unreadable.
[[nodiscard]] securebox::security::SecureString readSecretFile(const std::filesystem::path& path);

} // namespace securebox::ui::cli

#endif // SECUREBOX_UI_CLI_CONSOLEUTILS_HPP
