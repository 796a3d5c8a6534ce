#include "securebox/log/AuditLog.hpp"
#include <array>
#include <cstdio>
#include <ctime>
#include <exception>
#include <fstream>
#include <stdexcept>
#include <string>

namespace securebox::log
{
namespace
{

[[nodiscard]] std::string sanitize(std::string_view s)
{
    std::string out{ s };
    for (char& c : out)
    {
        if (c == '\n' || c == '\r')
        {
            c = ' ';
        }
    }
    return out;
}

[[nodiscard]] std::string utcTimestamp()
{
    const std::time_t now{ std::time(nullptr) };
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif

    std::array<char, 32> buf{};
    if (std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0U)
    {
        return "0000-00-00T00:00:00Z";
    }
    return std::string{ buf.data() };
}

class FileAuditSink final : public IAuditSink
{
public:
    explicit FileAuditSink(const std::filesystem::path& path) : m_file{ path, std::ios::out | std::ios::app }
    {
        if (!m_file)
        {
            throw std::runtime_error("cannot open audit log: " + path.string());
        }
        std::error_code ec{};
        std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            throw std::runtime_error("cannot restrict audit log permissions: " + ec.message());
        }
    }

    void record(AuditLevel level, std::string_view event, std::string_view outcome,
                std::string_view detail) noexcept override
    {
        m_stream.record(level, event, outcome, detail);
    }

private:
    std::ofstream m_file;
    StreamAuditSink m_stream{ m_file };
};

} // namespace

[[nodiscard]] std::string_view toString(AuditLevel level) noexcept
{
    switch (level)
    {
    case AuditLevel::Info:
        return "INFO";
    case AuditLevel::Warn:
        return "WARN";
    case AuditLevel::Error:
        return "ERROR";
    case AuditLevel::Alert:
        return "ALERT";
    }
    return "UNKNOWN";
}

[[nodiscard]] IAuditSink& nullAuditSink() noexcept
{
    static NullAuditSink sink{};
    return sink;
}

void StreamAuditSink::record(AuditLevel level, std::string_view event, std::string_view outcome,
                             std::string_view detail) noexcept
{
    try
    {
        std::string line{ utcTimestamp() };
        line += " | ";
        line += toString(level);
        line += " | event=";
        line += sanitize(event);
        line += " | outcome=";
        line += sanitize(outcome);
        line += " | ";
        line += sanitize(detail);
        line += '\n';

        *m_out << line;
        m_out->flush();
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "[audit-fail] %s: %s\n", toString(level).data(), e.what());
    }
}

[[nodiscard]] std::unique_ptr<IAuditSink> makeFileAuditSink(const std::filesystem::path& path)
{
    return std::make_unique<FileAuditSink>(path);
}

} // namespace securebox::log
