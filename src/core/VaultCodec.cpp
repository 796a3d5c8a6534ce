#include "securebox/core/VaultCodec.hpp"

#include "LittleEndian.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace securebox::core
{
namespace
{

using Prefix = std::array<std::byte, g_codecPrefixBytes>;

[[nodiscard]] constexpr Prefix makePrefix(const char (&text)[g_codecPrefixBytes + 1U]) noexcept
{
    Prefix out{};
    for (std::size_t i{}; i < out.size(); ++i)
    {
        out[i] = static_cast<std::byte>(text[i]);
    }
    return out;
}

constexpr Prefix g_kKeyCheckAadPrefix{ makePrefix("SBOXKEY1") };
constexpr Prefix g_kContainerAadPrefix{ makePrefix("SBOXCID1") };
constexpr Prefix g_kSealPrefix{ makePrefix("SBOXSEAL") };
constexpr std::array<std::byte, 4> g_kPayloadMagic{ std::byte{ 'S' }, std::byte{ 'B' }, std::byte{ 'X' },
                                                     std::byte{ 'C' } };

// Writes into a fixed-size array through a growing view.
class ArraySink final
{
public:
    using value_type = std::byte;

    explicit ArraySink(std::span<std::byte> out) noexcept : m_out{ out }
    {
    }

    void push_back(std::byte b) noexcept
    {
        if (m_size < m_out.size())
        {
            m_out[m_size] = b;
        }
        ++m_size;
    }

private:
    std::span<std::byte> m_out;
    std::size_t m_size{};
};

[[nodiscard]] std::uint32_t checkedU32(std::size_t n, const char* what)
{
    if (n > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max()))
    {
        throw std::length_error(what);
    }
    return static_cast<std::uint32_t>(n);
}

} // namespace

[[nodiscard]] std::array<std::byte, g_keyCheckAadBytes>
encodeKeyCheckAad(const securebox::crypto::KdfMetadata& meta) noexcept
{
    std::array<std::byte, g_keyCheckAadBytes> out{};
    ArraySink sink{ out };
    detail::ByteWriter<ArraySink> w{ sink };

    w.bytes(g_kKeyCheckAadPrefix);
    w.u32(meta.policyVersion);
    w.u32(static_cast<std::uint32_t>(meta.algorithm));
    w.u32(meta.argon2Version);
    w.u32(meta.derivedKeyBytes);
    w.u32(meta.argon2id.iterations);
    w.u32(meta.argon2id.memoryKiB);
    w.u32(meta.argon2id.parallelism);
    w.u32(meta.pbkdf2.iterations);
    w.bytes(std::span<const std::uint8_t>{ meta.salt });
    return out;
}

[[nodiscard]] std::array<std::byte, g_containerAadBytes> encodeContainerAad(std::int64_t id) noexcept
{
    std::array<std::byte, g_containerAadBytes> out{};
    ArraySink sink{ out };
    detail::ByteWriter<ArraySink> w{ sink };

    w.bytes(g_kContainerAadPrefix);
    w.i64(id);
    return out;
}

[[nodiscard]] securebox::security::SecureBuffer encodeContainerPayload(std::string_view name,
                                                                       const securebox::security::SecureString& data)
{
    const std::uint32_t nameLen{ checkedU32(name.size(), "encodeContainerPayload: name too long") };
    const std::uint32_t dataLen{ checkedU32(data.size(), "encodeContainerPayload: data too long") };

    securebox::security::SecureBuffer out{};
    out.reserve(g_kPayloadMagic.size() + (3U * detail::g_kU32Bytes) + name.size() + data.size());

    detail::ByteWriter<securebox::security::SecureBuffer> w{ out };
    w.bytes(g_kPayloadMagic);
    w.u32(g_containerPayloadVersion);
    w.u32(nameLen);
    w.bytes(std::as_bytes(std::span<const char>{ name.data(), name.size() }));
    w.u32(dataLen);
    w.bytes(securebox::security::asBytes(data));
    return out;
}

[[nodiscard]] std::optional<ContainerPayload> decodeContainerPayload(std::span<const std::byte> bytes)
{
    detail::ByteReader r{ bytes };

    const auto magic{ r.take(g_kPayloadMagic.size()) };
    if (!magic || !std::equal(magic->begin(), magic->end(), g_kPayloadMagic.begin()))
    {
        return std::nullopt;
    }
    if (const auto version{ r.u32() }; !version || *version != g_containerPayloadVersion)
    {
        return std::nullopt;
    }

    const auto nameLen{ r.u32() };
    if (!nameLen)
    {
        return std::nullopt;
    }
    const auto nameBytes{ r.take(*nameLen) };
    if (!nameBytes)
    {
        return std::nullopt;
    }

    const auto dataLen{ r.u32() };
    if (!dataLen)
    {
        return std::nullopt;
    }
    const auto dataBytes{ r.take(*dataLen) };
    if (!dataBytes || !r.atEnd())
    {
        return std::nullopt;
    }

    ContainerPayload out{};
    out.name.assign(reinterpret_cast<const char*>(nameBytes->data()), nameBytes->size());
    out.data = securebox::security::secureStringFrom(*dataBytes);
    return out;
}

[[nodiscard]] std::vector<std::byte> encodeSealManifest(const securebox::storage::VaultSnapshot& snapshot)
{
    constexpr std::size_t kRecordBytes{ sizeof(std::int64_t) + securebox::crypto::g_kdfSaltBytes +
                                        securebox::crypto::g_aeadNonceBytes + securebox::crypto::g_aeadTagBytes };

    std::vector<std::byte> out{};
    out.reserve(g_kSealPrefix.size() + 64U + (snapshot.containers.size() * kRecordBytes));

    detail::ByteWriter<std::vector<std::byte>> w{ out };
    w.bytes(g_kSealPrefix);
    w.u32(snapshot.formatVersion);
    w.bytes(std::span<const std::uint8_t>{ snapshot.key.keyCheck.nonce });
    w.bytes(std::span<const std::uint8_t>{ snapshot.key.kdf.salt });
    w.i64(snapshot.nextContainerId);
    w.u32(checkedU32(snapshot.containers.size(), "encodeSealManifest: too many records"));
    for (const auto& record : snapshot.containers)
    {
        w.i64(record.id);
        w.bytes(std::span<const std::uint8_t>{ record.salt });
        w.bytes(std::span<const std::uint8_t>{ record.box.nonce });
        w.bytes(std::span<const std::uint8_t>{ record.box.tag });
    }
    return out;
}

} // namespace securebox::core
