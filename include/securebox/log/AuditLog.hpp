#ifndef INCLUDE_SECUREBOX_LOG_AUDITLOG_HPP
#define INCLUDE_SECUREBOX_LOG_AUDITLOG_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string_view>

namespace securebox::log
{

enum class AuditLevel : std::uint8_t
{
    Info,
    Warn,
    Error,
    Alert,
};

[[nodiscard]] std::string_view toString(AuditLevel level) noexcept;

// Receives security-relevant events. Callers pass ids and outcomes only, never secret material.
class IAuditSink
{
public:
    IAuditSink() = default;
    IAuditSink(const IAuditSink&) = delete;
    IAuditSink& operator=(const IAuditSink&) = delete;
    IAuditSink(IAuditSink&&) = delete;
    IAuditSink& operator=(IAuditSink&&) = delete;
    virtual ~IAuditSink() = default;

    virtual void record(AuditLevel level, std::string_view event, std::string_view outcome,
                        std::string_view detail) noexcept = 0;
};

class NullAuditSink final : public IAuditSink
{
public:
    void record(AuditLevel /*level*/, std::string_view /*event*/, std::string_view /*outcome*/,
                std::string_view /*detail*/) noexcept override
    {
    }
};

// Process-wide sink that drops everything.
[[nodiscard]] IAuditSink& nullAuditSink() noexcept;

// One line per event: `<UTC timestamp> | <LEVEL> | event=<event> | outcome=<outcome> | <detail>`.
// CR/LF inside fields are replaced by spaces so one event is always one line.
class StreamAuditSink final : public IAuditSink
{
public:
    explicit StreamAuditSink(std::ostream& out) noexcept : m_out{ &out }
    {
    }

    void record(AuditLevel level, std::string_view event, std::string_view outcome,
                std::string_view detail) noexcept override;

private:
    std::ostream* m_out;
};

// Appends to `path` (created owner-read/write only). Throws std::runtime_error if the file cannot be opened.
[[nodiscard]] std::unique_ptr<IAuditSink> makeFileAuditSink(const std::filesystem::path& path);

} // namespace securebox::log

#endif // INCLUDE_SECUREBOX_LOG_AUDITLOG_HPP
