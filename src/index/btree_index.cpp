/** \file btree_index.cpp
 *  \brief Block-structured sorted scalar index.
 */

#include "quiver/index/btree_index.hpp"
#include "quiver/core/platform_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace quiver::index {

namespace {

constexpr std::uint8_t kEmptyType = 0xFF;

auto entry_less(const BTreeEntry& a, const BTreeEntry& b) -> bool {
    return a.value < b.value || (a.value == b.value && a.row_id < b.row_id);
}

auto above_lower(const ScalarValue& v, const std::optional<Bound>& lower) -> bool {
    if (!lower) return true;
    return lower->inclusive ? !(v < lower->value) : lower->value < v;
}

auto below_upper(const ScalarValue& v, const std::optional<Bound>& upper) -> bool {
    if (!upper) return true;
    return upper->inclusive ? !(upper->value < v) : v < upper->value;
}

auto empty_range(const Range& r) -> bool {
    if (!r.lower || !r.upper) return false;
    if (r.upper->value < r.lower->value) return true;
    return r.upper->value == r.lower->value && !(r.lower->inclusive && r.upper->inclusive);
}

auto is_nan(const ScalarValue& v) -> bool {
    const auto* d = std::get_if<double>(&v);
    return d != nullptr && std::isnan(*d);
}

void put_value(io::ByteWriter& w, const ScalarValue& v) {
    std::visit([&w](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bool>) {
            w.put(static_cast<std::uint8_t>(x ? 1 : 0));
        } else if constexpr (std::is_same_v<T, std::string>) {
            w.put_string(x);
        } else {
            w.put(x);
        }
    }, v);
}

auto get_value(io::ByteReader& r, ScalarType t) -> std::expected<ScalarValue, core::error> {
    switch (t) {
        case ScalarType::Bool: {
            auto b = r.get<std::uint8_t>();
            if (!b) return std::unexpected(b.error());
            return ScalarValue{*b != 0};
        }
        case ScalarType::Int64: {
            auto i = r.get<std::int64_t>();
            if (!i) return std::unexpected(i.error());
            return ScalarValue{*i};
        }
        case ScalarType::Float64: {
            auto d = r.get<double>();
            if (!d) return std::unexpected(d.error());
            return ScalarValue{*d};
        }
        case ScalarType::String: {
            auto s = r.get_string();
            if (!s) return std::unexpected(s.error());
            return ScalarValue{std::move(*s)};
        }
    }
    return core::make_error(core::error_code::data_integrity, "Unknown scalar type", "btree.load");
}

auto integrity_error(std::string message) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::data_integrity, std::move(message), "btree.load");
}

auto make_headers(const std::vector<BTreeEntry>& entries, std::uint32_t block_size)
    -> std::vector<BlockHeader> {
    std::vector<BlockHeader> headers;
    headers.reserve((entries.size() + block_size - 1) / block_size);
    for (std::size_t off = 0; off < entries.size(); off += block_size) {
        const std::size_t count = std::min<std::size_t>(block_size, entries.size() - off);
        headers.push_back(BlockHeader{entries[off].value, entries[off + count - 1].value,
                                      off, static_cast<std::uint32_t>(count)});
    }
    return headers;
}

} // anonymous namespace

auto predicate_matches(const ScalarPredicate& predicate, const ScalarValue& value) -> bool {
    return std::visit([&value](const auto& p) -> bool {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, Equals>) {
            return same_type(p.value, value) && p.value == value;
        } else if constexpr (std::is_same_v<T, Range>) {
            if (p.lower && !same_type(p.lower->value, value)) return false;
            if (p.upper && !same_type(p.upper->value, value)) return false;
            return above_lower(value, p.lower) && below_upper(value, p.upper);
        } else {
            for (const auto& v : p.values) {
                if (same_type(v, value) && v == value) return true;
            }
            return false;
        }
    }, predicate);
}

auto predicate_has_type(const ScalarPredicate& predicate, ScalarType t) -> bool {
    return std::visit([t](const auto& p) -> bool {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, Equals>) {
            return scalar_type(p.value) == t;
        } else if constexpr (std::is_same_v<T, Range>) {
            return (!p.lower || scalar_type(p.lower->value) == t) &&
                   (!p.upper || scalar_type(p.upper->value) == t);
        } else {
            return std::all_of(p.values.begin(), p.values.end(),
                               [t](const ScalarValue& v) { return scalar_type(v) == t; });
        }
    }, predicate);
}

auto predicate_has_nan(const ScalarPredicate& predicate) -> bool {
    return std::visit([](const auto& p) -> bool {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, Equals>) {
            return is_nan(p.value);
        } else if constexpr (std::is_same_v<T, Range>) {
            return (p.lower && is_nan(p.lower->value)) || (p.upper && is_nan(p.upper->value));
        } else {
            return std::any_of(p.values.begin(), p.values.end(), is_nan);
        }
    }, predicate);
}

class BTreeIndex::Impl {
public:
    /** \brief Scan blocks overlapping [lower, upper] into out. */
    void scan_range(const Range& r, ScalarSearchResult& out) const {
        if (empty_range(r)) return;

        const auto first = std::partition_point(headers_.begin(), headers_.end(),
            [&r](const BlockHeader& h) { return !above_lower(h.max, r.lower); });

        for (auto it = first; it != headers_.end() && below_upper(it->min, r.upper); ++it) {
            const auto block_begin = entries_.begin() + static_cast<std::ptrdiff_t>(it->offset);
            const auto block_end = block_begin + it->count;
            auto e = std::partition_point(block_begin, block_end,
                [&r](const BTreeEntry& x) { return !above_lower(x.value, r.lower); });
            for (; e != block_end && below_upper(e->value, r.upper); ++e) {
                out.row_ids.add(e->row_id);
            }
            out.blocks_read.push_back(static_cast<std::uint32_t>(it - headers_.begin()));
        }
    }

    std::string column_;
    std::uint32_t block_size_{kDefaultBlockSize};
    std::optional<ScalarType> type_;
    std::vector<BTreeEntry> entries_;
    std::vector<BlockHeader> headers_;
    roaring::Roaring64Map indexed_;
};

BTreeIndex::BTreeIndex() : impl_(std::make_unique<Impl>()) {}
BTreeIndex::~BTreeIndex() = default;

auto BTreeIndex::build(std::string column, std::span<const std::uint64_t> row_ids,
                       std::span<const ScalarValue> values, const BTreeBuildParams& params)
    -> std::expected<std::shared_ptr<const BTreeIndex>, core::error> {
    using core::error_code;

    const std::uint32_t block_size = params.block_size.value_or(kDefaultBlockSize);
    if (block_size == 0) {
        return core::make_error(error_code::invalid_parameter, "block_size must be > 0", "btree.build");
    }
    if (row_ids.size() != values.size()) {
        return core::make_error(error_code::invalid_parameter,
            "row_ids and values differ in length", "btree.build");
    }

    std::shared_ptr<BTreeIndex> index(new BTreeIndex());
    auto& impl = *index->impl_;
    impl.column_ = std::move(column);
    impl.block_size_ = block_size;

    if (!values.empty()) {
        const ScalarType t = scalar_type(values.front());
        for (const auto& v : values) {
            if (scalar_type(v) != t) {
                return core::make_error(error_code::invalid_parameter,
                    "Column '" + impl.column_ + "' mixes " + std::string(to_string(t)) + " and " +
                    std::string(to_string(scalar_type(v))) + " values", "btree.build");
            }
            if (is_nan(v)) {
                return core::make_error(error_code::invalid_parameter,
                    "Column '" + impl.column_ + "' contains NaN", "btree.build");
            }
        }
        impl.type_ = t;
    }

    impl.entries_.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        impl.entries_.push_back(BTreeEntry{values[i], row_ids[i]});
    }
    std::sort(impl.entries_.begin(), impl.entries_.end(), entry_less);
    impl.headers_ = make_headers(impl.entries_, block_size);
    impl.indexed_.addMany(row_ids.size(), row_ids.data());

    if (params.verbose || core::verbose_from_env()) {
        std::cerr << "[BTREE][build] column=" << impl.column_ << " rows=" << impl.entries_.size()
                  << " blocks=" << impl.headers_.size() << " block_size=" << block_size << std::endl;
    }
    return std::shared_ptr<const BTreeIndex>(std::move(index));
}

auto BTreeIndex::search(const ScalarPredicate& predicate) const
    -> std::expected<ScalarSearchResult, core::error> {
    if (impl_->type_ && !predicate_has_type(predicate, *impl_->type_)) {
        return core::make_error(core::error_code::invalid_parameter,
            "Predicate value type does not match " + std::string(to_string(*impl_->type_)) +
            " column '" + impl_->column_ + "'", "btree.search");
    }
    if (predicate_has_nan(predicate)) {
        return core::make_error(core::error_code::invalid_parameter,
            "NaN predicate value on column '" + impl_->column_ + "'", "btree.search");
    }

    ScalarSearchResult out;
    if (impl_->entries_.empty()) return out;

    std::visit([this, &out](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, Equals>) {
            impl_->scan_range(Range{Bound{p.value, true}, Bound{p.value, true}}, out);
        } else if constexpr (std::is_same_v<T, Range>) {
            impl_->scan_range(p, out);
        } else {
            std::vector<ScalarValue> keys(p.values);
            std::sort(keys.begin(), keys.end());
            keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
            for (const auto& v : keys) {
                impl_->scan_range(Range{Bound{v, true}, Bound{v, true}}, out);
            }
            std::sort(out.blocks_read.begin(), out.blocks_read.end());
            out.blocks_read.erase(std::unique(out.blocks_read.begin(), out.blocks_read.end()),
                                  out.blocks_read.end());
        }
    }, predicate);
    return out;
}

auto BTreeIndex::column() const noexcept -> const std::string& { return impl_->column_; }
auto BTreeIndex::value_type() const noexcept -> std::optional<ScalarType> { return impl_->type_; }
auto BTreeIndex::size() const noexcept -> std::size_t { return impl_->entries_.size(); }
auto BTreeIndex::block_size() const noexcept -> std::uint32_t { return impl_->block_size_; }
auto BTreeIndex::num_blocks() const noexcept -> std::size_t { return impl_->headers_.size(); }
auto BTreeIndex::headers() const noexcept -> std::span<const BlockHeader> { return impl_->headers_; }
auto BTreeIndex::entries() const noexcept -> std::span<const BTreeEntry> { return impl_->entries_; }
auto BTreeIndex::indexed_rows() const noexcept -> const roaring::Roaring64Map& { return impl_->indexed_; }

auto BTreeIndex::memory_bytes() const noexcept -> std::size_t {
    std::size_t bytes = impl_->entries_.size() * sizeof(BTreeEntry) +
                        impl_->headers_.size() * sizeof(BlockHeader);
    if (impl_->type_ == ScalarType::String) {
        for (const auto& e : impl_->entries_) bytes += std::get<std::string>(e.value).capacity();
    }
    return bytes;
}

auto BTreeIndex::write_sections(io::SectionWriter& writer) const -> std::expected<void, core::error> {
    io::ByteWriter params;
    params.put(impl_->block_size_);
    params.put(impl_->type_ ? static_cast<std::uint8_t>(*impl_->type_) : kEmptyType);
    params.put(static_cast<std::uint64_t>(impl_->entries_.size()));
    params.put(static_cast<std::uint64_t>(impl_->headers_.size()));
    params.put_string(impl_->column_);

    io::ByteWriter headers;
    for (const auto& h : impl_->headers_) {
        headers.put(h.offset);
        headers.put(h.count);
        put_value(headers, h.min);
        put_value(headers, h.max);
    }

    io::ByteWriter entries;
    for (const auto& e : impl_->entries_) entries.put(e.row_id);
    for (const auto& e : impl_->entries_) put_value(entries, e.value);

    if (auto r = writer.add(io::section_id::kBTreeParams, std::move(params).take()); !r) return r;
    if (auto r = writer.add(io::section_id::kBTreeHeaders, std::move(headers).take()); !r) return r;
    return writer.add(io::section_id::kBTreeEntries, std::move(entries).take());
}

auto BTreeIndex::read_sections(const io::SectionReader& reader)
    -> std::expected<std::shared_ptr<const BTreeIndex>, core::error> {
    auto params_bytes = reader.section(io::section_id::kBTreeParams);
    if (!params_bytes) return std::unexpected(params_bytes.error());
    io::ByteReader pr(*params_bytes);
    auto block_size = pr.get<std::uint32_t>();
    auto type_u8 = pr.get<std::uint8_t>();
    auto count = pr.get<std::uint64_t>();
    auto nblocks = pr.get<std::uint64_t>();
    auto column = pr.get_string();
    if (!block_size || !type_u8 || !count || !nblocks || !column) {
        return integrity_error("Truncated BTree params section");
    }
    if (*block_size == 0) return integrity_error("BTree block_size is zero");
    if (*type_u8 != kEmptyType && *type_u8 > static_cast<std::uint8_t>(ScalarType::String)) {
        return integrity_error("Unknown scalar type " + std::to_string(*type_u8));
    }
    if ((*count == 0) != (*type_u8 == kEmptyType)) {
        return integrity_error("BTree value type inconsistent with entry count");
    }

    std::shared_ptr<BTreeIndex> index(new BTreeIndex());
    auto& impl = *index->impl_;
    impl.column_ = std::move(*column);
    impl.block_size_ = *block_size;

    auto entry_bytes = reader.section(io::section_id::kBTreeEntries);
    if (!entry_bytes) return std::unexpected(entry_bytes.error());
    io::ByteReader er(*entry_bytes);
    auto row_ids = er.get_array<std::uint64_t>(static_cast<std::size_t>(*count));
    if (!row_ids) return std::unexpected(row_ids.error());

    if (*count > 0) {
        const auto t = static_cast<ScalarType>(*type_u8);
        impl.type_ = t;
        impl.entries_.reserve(row_ids->size());
        for (auto id : *row_ids) {
            auto v = get_value(er, t);
            if (!v) return std::unexpected(v.error());
            impl.entries_.push_back(BTreeEntry{std::move(*v), id});
        }
    }
    if (!er.exhausted()) return integrity_error("Trailing bytes in BTree entries section");
    for (std::size_t i = 1; i < impl.entries_.size(); ++i) {
        if (!entry_less(impl.entries_[i - 1], impl.entries_[i])) {
            return integrity_error("BTree entries are not strictly sorted");
        }
    }

    auto header_bytes = reader.section(io::section_id::kBTreeHeaders);
    if (!header_bytes) return std::unexpected(header_bytes.error());
    io::ByteReader hr(*header_bytes);
    std::vector<BlockHeader> stored;
    stored.reserve(static_cast<std::size_t>(*nblocks));
    for (std::uint64_t b = 0; b < *nblocks; ++b) {
        auto offset = hr.get<std::uint64_t>();
        auto n = hr.get<std::uint32_t>();
        if (!offset || !n || !impl.type_) return integrity_error("Malformed BTree header array");
        auto lo = get_value(hr, *impl.type_);
        auto hi = get_value(hr, *impl.type_);
        if (!lo || !hi) return integrity_error("Malformed BTree header array");
        stored.push_back(BlockHeader{std::move(*lo), std::move(*hi), *offset, *n});
    }
    if (!hr.exhausted()) return integrity_error("Trailing bytes in BTree header section");

    impl.headers_ = make_headers(impl.entries_, impl.block_size_);
    if (impl.headers_.size() != stored.size()) return integrity_error("BTree header count mismatch");
    for (std::size_t b = 0; b < stored.size(); ++b) {
        const auto& a = impl.headers_[b];
        const auto& s = stored[b];
        if (a.offset != s.offset || a.count != s.count || a.min != s.min || a.max != s.max) {
            return integrity_error("BTree header " + std::to_string(b) + " does not match its block");
        }
    }

    impl.indexed_.addMany(row_ids->size(), row_ids->data());
    if (impl.indexed_.cardinality() != row_ids->size()) {
        return integrity_error("Duplicate row ids in BTree artifact");
    }
    return std::shared_ptr<const BTreeIndex>(std::move(index));
}

auto BTreeIndex::save(const std::filesystem::path& path, int zstd_level) const
    -> std::expected<void, core::error> {
    io::SectionWriter writer(io::ArtifactKind::Scalar, zstd_level);
    if (auto r = write_sections(writer); !r) return r;
    return writer.write_atomic(path);
}

auto BTreeIndex::load(const std::filesystem::path& path)
    -> std::expected<std::shared_ptr<const BTreeIndex>, core::error> {
    auto reader = io::SectionReader::open(path);
    if (!reader) return std::unexpected(reader.error());
    if (reader->kind() != io::ArtifactKind::Scalar) {
        return integrity_error("Artifact " + path.string() + " is not a scalar index");
    }
    return read_sections(*reader);
}

} // namespace quiver::index
