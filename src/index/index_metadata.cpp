#include "quiver/index/index_metadata.hpp"
#include "quiver/io/section_file.hpp"

#include <cstdio>
#include <random>

namespace quiver::index {

namespace {

constexpr std::uint8_t kNoDistance = 0xFF;

} // anonymous namespace

auto generate_uuid() -> std::string {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    const std::uint64_t hi = gen();
    const std::uint64_t lo = gen();
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(hi), static_cast<unsigned long long>(lo));
    return std::string(buf, 32);
}

auto encode_metadata(const IndexMetadata& meta) -> std::vector<std::uint8_t> {
    io::ByteWriter w;
    w.put_string(meta.name);
    w.put_string(meta.column);
    w.put(static_cast<std::uint8_t>(meta.kind));
    w.put_string(meta.uuid);
    w.put(meta.distance_type ? static_cast<std::uint8_t>(*meta.distance_type) : kNoDistance);
    w.put(static_cast<std::uint8_t>(meta.replace ? 1 : 0));
    w.put(meta.build_timestamp);
    w.put(meta.version);
    w.put(meta.num_indexed_rows);
    w.put(meta.data_version);
    return std::move(w).take();
}

auto decode_metadata(std::span<const std::uint8_t> bytes) -> std::expected<IndexMetadata, core::error> {
    io::ByteReader r(bytes);
    auto name = r.get_string();
    auto column = r.get_string();
    auto kind = r.get<std::uint8_t>();
    auto uuid = r.get_string();
    auto distance = r.get<std::uint8_t>();
    auto replace = r.get<std::uint8_t>();
    auto timestamp = r.get<std::int64_t>();
    auto version = r.get<std::uint64_t>();
    auto rows = r.get<std::uint64_t>();
    auto data_version = r.get<std::uint64_t>();
    if (!name || !column || !kind || !uuid || !distance || !replace || !timestamp || !version ||
        !rows || !data_version || !r.exhausted()) {
        return core::make_error(core::error_code::data_integrity, "Malformed index metadata section",
                                "index_metadata");
    }
    if (*kind > static_cast<std::uint8_t>(IndexKind::Scalar)) {
        return core::make_error(core::error_code::data_integrity,
            "Unknown index kind " + std::to_string(*kind), "index_metadata");
    }

    IndexMetadata meta;
    meta.name = std::move(*name);
    meta.column = std::move(*column);
    meta.kind = static_cast<IndexKind>(*kind);
    meta.uuid = std::move(*uuid);
    if (*distance != kNoDistance) {
        meta.distance_type = kernels::distance_type_from_u8(*distance);
        if (!meta.distance_type) {
            return core::make_error(core::error_code::data_integrity,
                "Unknown distance type " + std::to_string(*distance), "index_metadata");
        }
    }
    meta.replace = *replace != 0;
    meta.build_timestamp = *timestamp;
    meta.version = *version;
    meta.num_indexed_rows = *rows;
    meta.data_version = *data_version;
    return meta;
}

} // namespace quiver::index
