#include "quiver/io/section_file.hpp"

#include <fstream>
#include <iterator>
#include <string_view>

#include <zstd.h>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace quiver::io {

namespace {

constexpr std::string_view kTrailerTag{"CHKS", 4};
constexpr std::size_t kHeaderBytes = 8 + 2 + 2 + 4 + 4;
constexpr std::size_t kTrailerBytes = 4 + 8;

template <typename T>
void append_pod(std::vector<std::uint8_t>& out, const T& v) {
    const auto* p = reinterpret_cast<const std::uint8_t*>(&v);
    out.insert(out.end(), p, p + sizeof(T));
}

auto integrity_error(std::string message) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::data_integrity, std::move(message), "io.section_file");
}

#if defined(__linux__) || defined(__APPLE__)
void fsync_path(const std::filesystem::path& p) {
    int fd = ::open(p.string().c_str(), O_RDONLY);
    if (fd >= 0) {
        (void)::fsync(fd);
        (void)::close(fd);
    }
}
#endif

} // anonymous namespace

auto SectionWriter::add(std::uint32_t type, std::vector<std::uint8_t> payload)
    -> std::expected<void, core::error> {
    for (const auto& s : sections_) {
        if (s.type == type) {
            return core::make_error(core::error_code::internal,
                "Duplicate section type " + std::to_string(type), "io.section_file");
        }
    }

    Section sec{type, payload.size(), SectionCodec::None, fnv1a64(payload.data(), payload.size()), {}};

    if (zstd_level_ > 0 && !payload.empty()) {
        std::vector<std::uint8_t> out(ZSTD_compressBound(payload.size()));
        const std::size_t got = ZSTD_compress(out.data(), out.size(), payload.data(), payload.size(), zstd_level_);
        if (ZSTD_isError(got)) {
            return core::make_error(core::error_code::internal,
                std::string("zstd compression failed: ") + ZSTD_getErrorName(got), "io.section_file");
        }
        if (got < payload.size()) {
            out.resize(got);
            sec.codec = SectionCodec::Zstd;
            sec.stored = std::move(out);
        }
    }
    if (sec.codec == SectionCodec::None) {
        sec.stored = std::move(payload);
    }

    sections_.push_back(std::move(sec));
    return {};
}

auto SectionWriter::serialize() const -> std::vector<std::uint8_t> {
    std::vector<std::uint8_t> out;
    std::size_t total = kHeaderBytes + kTrailerBytes;
    for (const auto& s : sections_) total += 4 + 8 + 8 + 4 + 8 + s.stored.size();
    out.reserve(total);

    out.insert(out.end(), kMagic.begin(), kMagic.end());
    append_pod(out, kVersionMajor);
    append_pod(out, kVersionMinor);
    append_pod(out, static_cast<std::uint32_t>(kind_));
    append_pod(out, static_cast<std::uint32_t>(sections_.size()));

    for (const auto& s : sections_) {
        append_pod(out, s.type);
        append_pod(out, s.uncompressed);
        append_pod(out, static_cast<std::uint64_t>(s.stored.size()));
        append_pod(out, static_cast<std::uint32_t>(s.codec));
        append_pod(out, s.hash);
        out.insert(out.end(), s.stored.begin(), s.stored.end());
    }

    const std::uint64_t checksum = fnv1a64(out.data(), out.size());
    out.insert(out.end(), kTrailerTag.begin(), kTrailerTag.end());
    append_pod(out, checksum);
    return out;
}

auto SectionWriter::write_atomic(const std::filesystem::path& path) const
    -> std::expected<void, core::error> {
    using core::error_code;
    const auto bytes = serialize();
    auto tmp = path;
    tmp += ".tmp";

    // 1) Write tmp
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            return core::make_error(error_code::io_failed, "Cannot open " + tmp.string() + " for writing",
                                    "io.section_file");
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code rec;
            (void)std::filesystem::remove(tmp, rec);
            return core::make_error(error_code::io_failed, "Write failed for " + tmp.string(), "io.section_file");
        }
    }

    // 2) Ensure tmp contents durable
#if defined(__linux__) || defined(__APPLE__)
    fsync_path(tmp);
#endif

    // 3) Atomic replace
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code rec;
        (void)std::filesystem::remove(tmp, rec);
        return core::make_error(error_code::io_failed, "Rename to " + path.string() + " failed: " + ec.message(),
                                "io.section_file");
    }
#if defined(__linux__) || defined(__APPLE__)
    if (path.has_parent_path()) fsync_path(path.parent_path());
#endif
    return {};
}

auto SectionReader::open(const std::filesystem::path& path) -> std::expected<SectionReader, core::error> {
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) {
        return core::make_error(core::error_code::io_failed, "Cannot open " + path.string(), "io.section_file");
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return core::make_error(core::error_code::io_failed, "Read failed for " + path.string(), "io.section_file");
    }
    return parse(bytes);
}

auto SectionReader::parse(std::span<const std::uint8_t> bytes) -> std::expected<SectionReader, core::error> {
    if (bytes.size() < kHeaderBytes + kTrailerBytes) {
        return integrity_error("File too small for an artifact");
    }
    if (std::memcmp(bytes.data(), kMagic.data(), kMagic.size()) != 0) {
        return integrity_error("Bad magic");
    }

    // Trailer checksum covers everything before the tag.
    const std::size_t body = bytes.size() - kTrailerBytes;
    if (std::memcmp(bytes.data() + body, kTrailerTag.data(), kTrailerTag.size()) != 0) {
        return integrity_error("Missing checksum trailer");
    }
    std::uint64_t stored_checksum = 0;
    std::memcpy(&stored_checksum, bytes.data() + body + kTrailerTag.size(), sizeof(stored_checksum));
    if (fnv1a64(bytes.data(), body) != stored_checksum) {
        return integrity_error("File checksum mismatch");
    }

    ByteReader r(bytes.subspan(kMagic.size(), body - kMagic.size()));
    auto major = r.get<std::uint16_t>();
    auto minor = r.get<std::uint16_t>();
    auto kind = r.get<std::uint32_t>();
    auto count = r.get<std::uint32_t>();
    if (!major || !minor || !kind || !count) return integrity_error("Truncated header");
    if (*major != kVersionMajor) {
        return integrity_error("Unsupported artifact version " + std::to_string(*major));
    }
    if (*kind != static_cast<std::uint32_t>(ArtifactKind::Vector) &&
        *kind != static_cast<std::uint32_t>(ArtifactKind::Scalar)) {
        return integrity_error("Unknown artifact kind " + std::to_string(*kind));
    }

    SectionReader reader;
    reader.kind_ = static_cast<ArtifactKind>(*kind);
    reader.minor_ = *minor;
    reader.sections_.reserve(*count);

    for (std::uint32_t i = 0; i < *count; ++i) {
        auto type = r.get<std::uint32_t>();
        auto unc = r.get<std::uint64_t>();
        auto stored = r.get<std::uint64_t>();
        auto codec = r.get<std::uint32_t>();
        auto hash = r.get<std::uint64_t>();
        if (!type || !unc || !stored || !codec || !hash) return integrity_error("Truncated section header");
        if (*stored > r.remaining()) return integrity_error("Section extends past end of file");
        auto payload = r.get_array<std::uint8_t>(static_cast<std::size_t>(*stored));
        if (!payload) return std::unexpected(payload.error());

        Section sec{*type, {}};
        if (*codec == static_cast<std::uint32_t>(SectionCodec::None)) {
            if (*unc != *stored) return integrity_error("Uncompressed section size mismatch");
            sec.payload = std::move(*payload);
        } else if (*codec == static_cast<std::uint32_t>(SectionCodec::Zstd)) {
            const unsigned long long frame = ZSTD_getFrameContentSize(payload->data(), payload->size());
            if (frame == ZSTD_CONTENTSIZE_ERROR || frame == ZSTD_CONTENTSIZE_UNKNOWN || frame != *unc) {
                return integrity_error("Compressed section size mismatch");
            }
            sec.payload.resize(static_cast<std::size_t>(*unc));
            const std::size_t got = ZSTD_decompress(sec.payload.data(), sec.payload.size(),
                                                    payload->data(), payload->size());
            if (ZSTD_isError(got) || got != sec.payload.size()) {
                return integrity_error("Section decompression failed");
            }
        } else {
            return integrity_error("Unknown section codec " + std::to_string(*codec));
        }

        if (fnv1a64(sec.payload.data(), sec.payload.size()) != *hash) {
            return integrity_error("Section checksum mismatch (type " + std::to_string(*type) + ")");
        }
        reader.sections_.push_back(std::move(sec));
    }

    if (!r.exhausted()) return integrity_error("Trailing bytes after section table");
    return reader;
}

auto SectionReader::has_section(std::uint32_t type) const noexcept -> bool {
    for (const auto& s : sections_) {
        if (s.type == type) return true;
    }
    return false;
}

auto SectionReader::section(std::uint32_t type) const
    -> std::expected<std::span<const std::uint8_t>, core::error> {
    for (const auto& s : sections_) {
        if (s.type == type) return std::span<const std::uint8_t>(s.payload);
    }
    return integrity_error("Missing section type " + std::to_string(type));
}

} // namespace quiver::io
