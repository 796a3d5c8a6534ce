#include "ConsoleUtils.hpp"

#include "securebox/security/MemoryWiper.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__) || defined(__APPLE__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace securebox::ui::cli
{

namespace
{

// Returns false when stdin is not a terminal; the caller then reads with echo on.
bool setConsoleEcho(bool enable) noexcept
{
#if defined(_WIN32)
    HANDLE hStdin = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    if (GetConsoleMode(hStdin, &mode) == 0)
    {
        return false;
    }
    if (!enable)
        mode &= ~ENABLE_ECHO_INPUT;
    else
        mode |= ENABLE_ECHO_INPUT;
    return SetConsoleMode(hStdin, mode) != 0;
#else
    struct termios tty
    {
    };
    if (tcgetattr(STDIN_FILENO, &tty) != 0)
    {
        return false;
    }
    if (!enable)
    {
        tty.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    }
    else
    {
        tty.c_lflag |= ECHO;
    }
    return tcsetattr(STDIN_FILENO, TCSANOW, &tty) == 0;
#endif
}

} // namespace

void lockProcessMemory() noexcept
{
#if !defined(_WIN32)
    (void)mlockall(MCL_CURRENT | MCL_FUTURE);
    struct rlimit lim
    {
        0, 0
    };
    (void)setrlimit(RLIMIT_CORE, &lim);
#endif
}

securebox::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    const bool echoDisabled{ setConsoleEcho(false) };

    std::string line;
    std::getline(std::cin, line);

    if (echoDisabled)
    {
        (void)setConsoleEcho(true);
        std::cout << "\n";
    }

    auto sec = securebox::security::secureStringFrom(line);
    securebox::security::secureWipeString(line);
    return sec;
}

securebox::security::SecureString readSecretFile(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw std::runtime_error("cannot read " + path.string());
    }

    std::string contents{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    if (in.bad())
    {
        securebox::security::secureWipeString(contents);
        throw std::runtime_error("cannot read " + path.string());
    }
    if (!contents.empty() && contents.back() == '\n')
    {
        contents.pop_back();
    }

    auto sec = securebox::security::secureStringFrom(contents);
    securebox::security::secureWipeString(contents);
    return sec;
}

} // namespace securebox::ui::cli
