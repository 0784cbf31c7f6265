#pragma once

/** \file section_file.hpp
 *  \brief Checksummed, sectioned binary artifact files.
 *
 * Layout (little-endian):
 *   magic "QUIVERIX" | u16 major | u16 minor | u32 kind | u32 section_count
 *   section_count x { u32 type | u64 uncompressed | u64 stored | u32 codec |
 *                     u64 fnv1a(uncompressed) | stored bytes }
 *   "CHKS" | u64 fnv1a(all preceding bytes)
 *
 * Sections are zstd-compressed when a level > 0 is requested and compression
 * actually shrinks the payload. Writes go to "<path>.tmp" and are renamed
 * over the destination once durable, so readers see the old or the new file,
 * never a torn one.
 */

#include <array>
#include <cstdint>
#include <cstring>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "quiver/error.hpp"

namespace quiver::io {

inline constexpr std::array<char, 8> kMagic{'Q', 'U', 'I', 'V', 'E', 'R', 'I', 'X'};
inline constexpr std::uint16_t kVersionMajor = 1;
inline constexpr std::uint16_t kVersionMinor = 0;

enum class ArtifactKind : std::uint32_t { Vector = 1, Scalar = 2 };

enum class SectionCodec : std::uint32_t { None = 0, Zstd = 1 };

/** \brief Section type ids; stable once written. */
namespace section_id {
inline constexpr std::uint32_t kIndexMetadata = 1;
inline constexpr std::uint32_t kIvfParams = 10;
inline constexpr std::uint32_t kIvfCentroids = 11;
inline constexpr std::uint32_t kPqCodebooks = 12;
inline constexpr std::uint32_t kIvfOffsets = 13;
inline constexpr std::uint32_t kIvfRowIds = 14;
inline constexpr std::uint32_t kIvfCodes = 15;
inline constexpr std::uint32_t kBTreeParams = 20;
inline constexpr std::uint32_t kBTreeHeaders = 21;
inline constexpr std::uint32_t kBTreeEntries = 22;
} // namespace section_id

/** \brief FNV-1a 64-bit hash. */
inline auto fnv1a64(const void* data, std::size_t n,
                    std::uint64_t h = 1469598103934665603ull) noexcept -> std::uint64_t {
    constexpr std::uint64_t kPrime = 1099511628211ull;
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
        h ^= p[i];
        h *= kPrime;
    }
    return h;
}

/** \brief Append-only little-endian encoder for section payloads. */
class ByteWriter {
public:
    template <typename T>
    void put(const T& value) {
        static_assert(std::is_trivially_copyable_v<T>);
        const auto* p = reinterpret_cast<const std::uint8_t*>(&value);
        buf_.insert(buf_.end(), p, p + sizeof(T));
    }

    template <typename T>
    void put_array(std::span<const T> values) {
        static_assert(std::is_trivially_copyable_v<T>);
        const auto* p = reinterpret_cast<const std::uint8_t*>(values.data());
        buf_.insert(buf_.end(), p, p + values.size_bytes());
    }

    void put_string(const std::string& s) {
        put(static_cast<std::uint32_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

    auto size() const noexcept -> std::size_t { return buf_.size(); }
    auto take() && -> std::vector<std::uint8_t> { return std::move(buf_); }

private:
    std::vector<std::uint8_t> buf_;
};

/** \brief Bounds-checked decoder; running past the end is data_integrity. */
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    template <typename T>
    auto get() -> std::expected<T, core::error> {
        static_assert(std::is_trivially_copyable_v<T>);
        if (remaining() < sizeof(T)) return truncated();
        T value;
        std::memcpy(&value, data_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);
        return value;
    }

    template <typename T>
    auto get_array(std::size_t count) -> std::expected<std::vector<T>, core::error> {
        static_assert(std::is_trivially_copyable_v<T>);
        if (count > remaining() / sizeof(T)) return truncated();
        std::vector<T> out(count);
        if (count > 0) std::memcpy(out.data(), data_.data() + pos_, count * sizeof(T));
        pos_ += count * sizeof(T);
        return out;
    }

    auto get_string() -> std::expected<std::string, core::error> {
        auto len = get<std::uint32_t>();
        if (!len) return std::unexpected(len.error());
        if (remaining() < *len) return truncated();
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), *len);
        pos_ += *len;
        return s;
    }

    auto remaining() const noexcept -> std::size_t { return data_.size() - pos_; }
    auto exhausted() const noexcept -> bool { return pos_ == data_.size(); }

private:
    static auto truncated() -> std::unexpected<core::error> {
        return core::make_error(core::error_code::data_integrity, "Section payload truncated", "io.section_file");
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_{0};
};

/** \brief Collects sections in memory and writes them atomically. */
class SectionWriter {
public:
    /** \param zstd_level 0 disables compression; 1..19 selects the zstd level. */
    SectionWriter(ArtifactKind kind, int zstd_level) noexcept : kind_(kind), zstd_level_(zstd_level) {}

    auto add(std::uint32_t type, std::vector<std::uint8_t> payload) -> std::expected<void, core::error>;

    /** \brief Serialize all sections to a single buffer (header through trailer). */
    auto serialize() const -> std::vector<std::uint8_t>;

    /** \brief Write to path via tmp file + fsync + rename. */
    auto write_atomic(const std::filesystem::path& path) const -> std::expected<void, core::error>;

private:
    struct Section {
        std::uint32_t type;
        std::uint64_t uncompressed;
        SectionCodec codec;
        std::uint64_t hash;
        std::vector<std::uint8_t> stored;
    };

    ArtifactKind kind_;
    int zstd_level_;
    std::vector<Section> sections_;
};

/** \brief Validated, decompressed view of an artifact file. */
class SectionReader {
public:
    /** \brief Read and verify a file.
     *
     * Errors: io_failed (cannot open/read), data_integrity (bad magic,
     * unsupported version, checksum mismatch, malformed section table,
     * decompression failure).
     */
    static auto open(const std::filesystem::path& path) -> std::expected<SectionReader, core::error>;

    static auto parse(std::span<const std::uint8_t> bytes) -> std::expected<SectionReader, core::error>;

    auto kind() const noexcept -> ArtifactKind { return kind_; }
    auto version_minor() const noexcept -> std::uint16_t { return minor_; }
    auto has_section(std::uint32_t type) const noexcept -> bool;

    /** \brief Uncompressed payload of a section; missing sections are data_integrity. */
    auto section(std::uint32_t type) const -> std::expected<std::span<const std::uint8_t>, core::error>;

private:
    struct Section {
        std::uint32_t type;
        std::vector<std::uint8_t> payload;
    };

    ArtifactKind kind_{ArtifactKind::Vector};
    std::uint16_t minor_{0};
    std::vector<Section> sections_;
};

} // namespace quiver::io
