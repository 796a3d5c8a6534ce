#ifndef SECUREBOX_SRC_CORE_LITTLEENDIAN_HPP
#define SECUREBOX_SRC_CORE_LITTLEENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace securebox::core::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::size_t g_kU64Bytes{ sizeof(std::uint64_t) };

constexpr std::uint64_t g_kByteMaskU64{ 0xFFU };
constexpr std::uint64_t g_kBitsPerByte{ 8U };

// Appends little-endian integers and raw bytes to any byte-sized sequence container
// (std::vector<std::byte>, SecureBuffer).
template <class Buffer> class ByteWriter final
{
public:
    explicit ByteWriter(Buffer& out) noexcept : m_out{ &out }
    {
    }

    void u32(std::uint32_t v)
    {
        putLE(v, g_kU32Bytes);
    }

    void i64(std::int64_t v)
    {
        putLE(static_cast<std::uint64_t>(v), g_kU64Bytes);
    }

    void bytes(std::span<const std::byte> in)
    {
        for (const std::byte b : in)
        {
            m_out->push_back(static_cast<typename Buffer::value_type>(std::to_integer<std::uint8_t>(b)));
        }
    }

    void bytes(std::span<const std::uint8_t> in)
    {
        bytes(std::as_bytes(in));
    }

private:
    void putLE(std::uint64_t v, std::size_t width)
    {
        for (std::size_t i{}; i < width; ++i)
        {
            const std::uint64_t shiftBits{ static_cast<std::uint64_t>(i) * g_kBitsPerByte };
            m_out->push_back(static_cast<typename Buffer::value_type>((v >> shiftBits) & g_kByteMaskU64));
        }
    }

    Buffer* m_out;
};

// Bounds-checked cursor. Every read returns std::nullopt (or false) once the input is exhausted.
class ByteReader final
{
public:
    explicit ByteReader(std::span<const std::byte> in) noexcept : m_in{ in }
    {
    }

    [[nodiscard]] std::optional<std::uint32_t> u32() noexcept
    {
        const auto v{ getLE(g_kU32Bytes) };
        if (!v)
        {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(*v);
    }

    [[nodiscard]] std::optional<std::span<const std::byte>> take(std::size_t n) noexcept
    {
        if (n > remaining())
        {
            return std::nullopt;
        }
        const auto out{ m_in.subspan(m_offset, n) };
        m_offset += n;
        return out;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_in.size() - m_offset;
    }

    [[nodiscard]] bool atEnd() const noexcept
    {
        return remaining() == 0U;
    }

private:
    [[nodiscard]] std::optional<std::uint64_t> getLE(std::size_t width) noexcept
    {
        const auto raw{ take(width) };
        if (!raw)
        {
            return std::nullopt;
        }
        std::uint64_t v{ 0U };
        for (std::size_t i{}; i < width; ++i)
        {
            const std::uint64_t shiftBits{ static_cast<std::uint64_t>(i) * g_kBitsPerByte };
            v |= (static_cast<std::uint64_t>(std::to_integer<std::uint8_t>((*raw)[i])) << shiftBits);
        }
        return v;
    }

    std::span<const std::byte> m_in;
    std::size_t m_offset{};
};

} // namespace securebox::core::detail

#endif // SECUREBOX_SRC_CORE_LITTLEENDIAN_HPP
