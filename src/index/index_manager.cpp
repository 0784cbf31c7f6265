/** \file index_manager.cpp
 *  \brief Index registry, build orchestration, publication and persistence.
 */

#include "quiver/index/index_manager.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include "quiver/core/platform_utils.hpp"
#include "quiver/io/section_file.hpp"

namespace quiver::index {

namespace {

constexpr const char* kArtifactExtension = ".qidx";

auto now_unix_seconds() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

auto find_column(const std::vector<storage::ColumnInfo>& schema, const std::string& name)
    -> const storage::ColumnInfo* {
    auto it = std::find_if(schema.begin(), schema.end(),
                           [&](const storage::ColumnInfo& c) { return c.name == name; });
    return it == schema.end() ? nullptr : &*it;
}

auto resolve_vector_column(const storage::DataSource& source, const std::optional<std::string>& requested)
    -> std::expected<std::string, core::error> {
    using core::error_code;
    const auto schema = source.schema();
    if (requested) {
        const auto* info = find_column(schema, *requested);
        if (info == nullptr) {
            return core::make_error(error_code::column_resolution,
                "Unknown column '" + *requested + "'", "index_manager");
        }
        if (!storage::is_vector_column(info->type)) {
            return core::make_error(error_code::invalid_parameter,
                "Column '" + *requested + "' is not a vector column", "index_manager");
        }
        return *requested;
    }
    std::vector<std::string> candidates;
    for (const auto& c : schema) {
        if (storage::is_vector_column(c.type)) candidates.push_back(c.name);
    }
    if (candidates.size() != 1) {
        return core::make_error(error_code::column_resolution,
            "Expected exactly one vector column, found " + std::to_string(candidates.size()) +
            "; specify the column", "index_manager");
    }
    return candidates.front();
}

auto resolve_scalar_column(const storage::DataSource& source, const std::optional<std::string>& requested)
    -> std::expected<storage::ColumnInfo, core::error> {
    using core::error_code;
    if (!requested) {
        return core::make_error(error_code::column_resolution,
            "Scalar indices require an explicit column", "index_manager");
    }
    const auto schema = source.schema();
    const auto* info = find_column(schema, *requested);
    if (info == nullptr) {
        return core::make_error(error_code::column_resolution,
            "Unknown column '" + *requested + "'", "index_manager");
    }
    if (storage::is_vector_column(info->type)) {
        return core::make_error(error_code::invalid_parameter,
            "Column '" + *requested + "' is a vector column; scalar indices need a scalar column",
            "index_manager");
    }
    return *info;
}

auto validate_name(const std::string& name) -> std::expected<void, core::error> {
    if (name.empty() || name == "." || name == ".." ||
        name.find_first_of("/\\") != std::string::npos) {
        return core::make_error(core::error_code::invalid_parameter,
            "Invalid index name '" + name + "'", "index_manager");
    }
    return {};
}

auto indexed_rows_of(const IndexVariant& index) -> const roaring::Roaring64Map& {
    return std::visit([](const auto& p) -> const roaring::Roaring64Map& { return p->indexed_rows(); }, index);
}

} // anonymous namespace

auto BuildTask::ready() const -> bool {
    return result_.valid() &&
           result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

auto BuildTask::wait() const -> BuildResult {
    if (!result_.valid()) {
        return core::make_error(core::error_code::invalid_parameter, "Empty build task", "index_manager");
    }
    return result_.get();
}

class IndexManager::Impl {
public:
    struct Published {
        IndexMetadata metadata;
        IndexVariant index;
    };

    struct Entry {
        IndexState state{IndexState::Absent};
        IndexState state_before_build{IndexState::Absent};
        std::optional<Published> published;
        std::uint64_t last_version{0};
        std::shared_ptr<core::CancellationToken> token;
    };

    /** \brief Outcome of column resolution plus registry reservation. */
    struct PendingBuild {
        std::string name;
        std::string column;
        IndexParams params;
        bool replace{true};
        std::uint64_t version{0};
        std::shared_ptr<core::CancellationToken> token;
    };

    Impl(std::shared_ptr<storage::DataSource> source, ManagerOptions options)
        : source_(std::move(source)), options_(std::move(options)) {}

    ~Impl() { shutdown(); }

    auto verbose() const -> bool { return options_.verbose || core::verbose_from_env(); }

    auto load_directory() -> std::expected<void, core::error> {
        using core::error_code;
        if (!options_.storage_dir) return {};
        const auto& dir = *options_.storage_dir;

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return core::make_error(error_code::io_failed,
                "Cannot create " + dir.string() + ": " + ec.message(), "index_manager");
        }

        std::vector<std::filesystem::path> artifacts;
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_regular_file(type_ec) && it->path().extension() == kArtifactExtension) {
                artifacts.push_back(it->path());
            }
        }
        if (ec) {
            return core::make_error(error_code::io_failed,
                "Cannot list " + dir.string() + ": " + ec.message(), "index_manager");
        }
        std::sort(artifacts.begin(), artifacts.end());

        std::unique_lock lock(mutex_);
        for (const auto& path : artifacts) {
            auto loaded = load_artifact(path);
            if (!loaded) return std::unexpected(loaded.error());
            const std::string name = loaded->metadata.name;
            if (entries_.contains(name)) {
                return core::make_error(error_code::data_integrity,
                    "Duplicate index name '" + name + "' in " + path.string(), "index_manager");
            }
            Entry& e = entries_[name];
            e.state = IndexState::Ready;
            e.last_version = loaded->metadata.version;
            e.published = std::move(*loaded);
            if (verbose()) {
                std::cerr << "[MANAGER] loaded " << name << " v" << e.last_version
                          << " from " << path.string() << std::endl;
            }
        }
        return {};
    }

    static auto load_artifact(const std::filesystem::path& path) -> std::expected<Published, core::error> {
        auto reader = io::SectionReader::open(path);
        if (!reader) return std::unexpected(reader.error());
        auto meta_bytes = reader->section(io::section_id::kIndexMetadata);
        if (!meta_bytes) return std::unexpected(meta_bytes.error());
        auto meta = decode_metadata(*meta_bytes);
        if (!meta) return std::unexpected(meta.error());

        Published out;
        if (meta->kind == IndexKind::Vector) {
            if (reader->kind() != io::ArtifactKind::Vector) {
                return core::make_error(core::error_code::data_integrity,
                    "Artifact kind disagrees with metadata in " + path.string(), "index_manager");
            }
            auto index = IvfPqIndex::read_sections(*reader);
            if (!index) return std::unexpected(index.error());
            meta->params = (*index)->build_params();
            out.index = std::move(*index);
        } else {
            if (reader->kind() != io::ArtifactKind::Scalar) {
                return core::make_error(core::error_code::data_integrity,
                    "Artifact kind disagrees with metadata in " + path.string(), "index_manager");
            }
            auto index = BTreeIndex::read_sections(*reader);
            if (!index) return std::unexpected(index.error());
            BTreeBuildParams params;
            params.block_size = (*index)->block_size();
            meta->params = params;
            out.index = std::move(*index);
        }
        out.metadata = std::move(*meta);
        return out;
    }

    auto artifact_path(const std::string& name) const -> std::filesystem::path {
        return *options_.storage_dir / (name + kArtifactExtension);
    }

    /** \brief Resolve the column and reserve the name as Building. */
    auto begin_build(const CreateIndexRequest& request) -> std::expected<PendingBuild, core::error> {
        using core::error_code;

        PendingBuild pending;
        pending.params = request.params;
        pending.replace = request.replace;

        if (kind_of(request.params) == IndexKind::Vector) {
            auto column = resolve_vector_column(*source_, request.column);
            if (!column) return std::unexpected(column.error());
            pending.column = std::move(*column);
            auto& p = std::get<IvfPqBuildParams>(pending.params);
            if (p.num_threads == 0) p.num_threads = options_.num_threads;
            p.verbose = p.verbose || options_.verbose;
        } else {
            auto info = resolve_scalar_column(*source_, request.column);
            if (!info) return std::unexpected(info.error());
            pending.column = info->name;
            auto& p = std::get<BTreeBuildParams>(pending.params);
            if (!p.block_size) p.block_size = options_.btree_block_size;
            p.verbose = p.verbose || options_.verbose;
        }

        pending.name = request.name.value_or(pending.column + "_idx");
        if (auto ok = validate_name(pending.name); !ok) return std::unexpected(ok.error());

        std::unique_lock lock(mutex_);
        Entry& e = entries_[pending.name];
        if (e.state == IndexState::Building) {
            return core::make_error(error_code::build_in_progress,
                "Index '" + pending.name + "' is already being built", "index_manager");
        }
        if (e.published && !request.replace) {
            return core::make_error(error_code::index_exists,
                "Index '" + pending.name + "' exists and replace is false", "index_manager");
        }
        e.state_before_build = e.state;
        e.state = IndexState::Building;
        e.token = std::make_shared<core::CancellationToken>();
        pending.token = e.token;
        pending.version = e.last_version + 1;
        return pending;
    }

    /** \brief Restore the pre-build state after a failed or cancelled build. */
    void abort_build(const PendingBuild& pending) {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(pending.name);
        if (it == entries_.end()) return;
        it->second.state = it->second.state_before_build;
        it->second.token.reset();
        if (it->second.state == IndexState::Absent && !it->second.published && it->second.last_version == 0) {
            entries_.erase(it);
        }
    }

    /** \brief Train, persist and publish. Runs without the registry lock until publication. */
    auto run_build(const PendingBuild& pending) -> BuildResult {
        auto result = train_and_persist(pending);
        if (!result) {
            abort_build(pending);
            if (result.error().code == core::error_code::cancelled) {
                std::cerr << "[MANAGER][warn] build of '" << pending.name << "' cancelled" << std::endl;
            } else if (verbose()) {
                std::cerr << "[MANAGER] build of '" << pending.name << "' failed: "
                          << result.error().message << std::endl;
            }
            return std::unexpected(result.error());
        }

        auto& [report, index] = *result;
        {
            std::unique_lock lock(mutex_);
            Entry& e = entries_[pending.name];
            e.published = Published{report.metadata, std::move(index)};
            e.state = IndexState::Ready;
            e.last_version = pending.version;
            e.token.reset();
        }
        if (verbose()) {
            std::cerr << "[MANAGER] published " << pending.name << " v" << pending.version
                      << " column=" << pending.column << " rows=" << report.metadata.num_indexed_rows
                      << " time=" << report.build_time_sec << "s" << std::endl;
        }
        return std::move(report);
    }

    auto train_and_persist(const PendingBuild& pending)
        -> std::expected<std::pair<BuildReport, IndexVariant>, core::error> {
        const auto t0 = std::chrono::steady_clock::now();
        const std::uint64_t data_version = source_->data_version();

        BuildReport report;
        IndexVariant index;
        auto& meta = report.metadata;
        meta.name = pending.name;
        meta.column = pending.column;
        meta.kind = kind_of(pending.params);
        meta.params = pending.params;
        meta.replace = pending.replace;
        meta.version = pending.version;
        meta.data_version = data_version;

        if (meta.kind == IndexKind::Vector) {
            const auto& params = std::get<IvfPqBuildParams>(pending.params);
            auto column = source_->read_vector_column(pending.column);
            if (!column) return std::unexpected(column.error());
            auto built = IvfPqIndex::build(pending.column, column->row_ids, column->data,
                                           column->dim, params, pending.token.get());
            if (!built) return std::unexpected(built.error());
            meta.distance_type = params.metric;
            meta.num_indexed_rows = built->index->size();
            report.warnings = std::move(built->warnings);
            report.vector_stats = built->stats;
            index = std::move(built->index);
        } else {
            const auto& params = std::get<BTreeBuildParams>(pending.params);
            auto column = source_->read_scalar_column(pending.column);
            if (!column) return std::unexpected(column.error());
            if (core::is_cancelled(pending.token.get())) {
                return std::unexpected(core::cancelled_error("index_manager"));
            }
            auto built = BTreeIndex::build(pending.column, column->row_ids, column->values, params);
            if (!built) return std::unexpected(built.error());
            meta.num_indexed_rows = (*built)->size();
            index = std::move(*built);
        }

        if (core::is_cancelled(pending.token.get())) {
            return std::unexpected(core::cancelled_error("index_manager"));
        }

        meta.uuid = generate_uuid();
        meta.build_timestamp = now_unix_seconds();

        if (options_.storage_dir) {
            const auto kind = meta.kind == IndexKind::Vector ? io::ArtifactKind::Vector : io::ArtifactKind::Scalar;
            io::SectionWriter writer(kind, options_.zstd_level);
            if (auto r = writer.add(io::section_id::kIndexMetadata, encode_metadata(meta)); !r) {
                return std::unexpected(r.error());
            }
            auto sections = std::visit([&](const auto& p) { return p->write_sections(writer); }, index);
            if (!sections) return std::unexpected(sections.error());
            if (auto r = writer.write_atomic(artifact_path(meta.name)); !r) {
                return std::unexpected(r.error());
            }
        }

        report.build_time_sec = std::chrono::duration<float>(std::chrono::steady_clock::now() - t0).count();
        for (const auto& w : report.warnings) {
            std::cerr << "[MANAGER][warn] " << meta.name << ": " << w << std::endl;
        }
        return std::pair{std::move(report), std::move(index)};
    }

    void track(std::shared_ptr<core::CancellationToken> token, std::shared_future<BuildResult> future) {
        std::lock_guard lock(tasks_mutex_);
        std::erase_if(tasks_, [](const auto& t) {
            return t.second.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
        tasks_.emplace_back(std::move(token), std::move(future));
    }

    void shutdown() {
        std::vector<std::pair<std::shared_ptr<core::CancellationToken>, std::shared_future<BuildResult>>> tasks;
        {
            std::lock_guard lock(tasks_mutex_);
            tasks.swap(tasks_);
        }
        for (auto& [token, future] : tasks) token->cancel();
        for (auto& [token, future] : tasks) future.wait();
    }

    auto vector_index_for(const std::string& column) const -> std::shared_ptr<const IvfPqIndex> {
        std::shared_lock lock(mutex_);
        for (const auto& [name, e] : entries_) {
            if (!e.published || e.published->metadata.column != column) continue;
            if (const auto* p = std::get_if<std::shared_ptr<const IvfPqIndex>>(&e.published->index)) return *p;
        }
        return nullptr;
    }

    auto scalar_index_for(const std::string& column) const -> std::shared_ptr<const BTreeIndex> {
        std::shared_lock lock(mutex_);
        for (const auto& [name, e] : entries_) {
            if (!e.published || e.published->metadata.column != column) continue;
            if (const auto* p = std::get_if<std::shared_ptr<const BTreeIndex>>(&e.published->index)) return *p;
        }
        return nullptr;
    }

    std::shared_ptr<storage::DataSource> source_;
    ManagerOptions options_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> entries_;

    std::mutex tasks_mutex_;
    std::vector<std::pair<std::shared_ptr<core::CancellationToken>, std::shared_future<BuildResult>>> tasks_;
};

IndexManager::IndexManager(std::shared_ptr<storage::DataSource> source, ManagerOptions options)
    : impl_(std::make_unique<Impl>(std::move(source), std::move(options))) {}

IndexManager::~IndexManager() = default;

auto IndexManager::open(std::shared_ptr<storage::DataSource> source, ManagerOptions options)
    -> std::expected<std::unique_ptr<IndexManager>, core::error> {
    if (!source) {
        return core::make_error(core::error_code::invalid_parameter, "Null data source", "index_manager");
    }
    auto manager = std::make_unique<IndexManager>(std::move(source), std::move(options));
    if (auto r = manager->impl_->load_directory(); !r) return std::unexpected(r.error());
    return manager;
}

auto IndexManager::create_index(const CreateIndexRequest& request) -> BuildResult {
    auto pending = impl_->begin_build(request);
    if (!pending) return std::unexpected(pending.error());
    return impl_->run_build(*pending);
}

auto IndexManager::create_index_async(const CreateIndexRequest& request)
    -> std::expected<BuildTask, core::error> {
    auto pending = impl_->begin_build(request);
    if (!pending) return std::unexpected(pending.error());

    Impl* impl = impl_.get();
    auto token = pending->token;
    std::string name = pending->name;
    std::shared_future<BuildResult> future =
        std::async(std::launch::async, [impl, p = std::move(*pending)]() { return impl->run_build(p); }).share();
    impl_->track(token, future);
    return BuildTask(std::move(name), std::move(token), std::move(future));
}

auto IndexManager::search(const search::VectorQuery& query) const
    -> std::expected<std::vector<SearchHit>, core::error> {
    auto column = resolve_vector_column(*impl_->source_, query.column);
    if (!column) return std::unexpected(column.error());

    const auto index = impl_->vector_index_for(*column);
    const Impl* impl = impl_.get();
    search::QueryExecutor executor(*impl_->source_,
        [impl](const std::string& c) { return impl->scalar_index_for(c); },
        impl_->options_.default_nprobes);
    return executor.execute(query, *column, index);
}

auto IndexManager::search_scalar(const std::string& column, const ScalarPredicate& predicate) const
    -> std::expected<roaring::Roaring64Map, core::error> {
    auto info = resolve_scalar_column(*impl_->source_, column);
    if (!info) return std::unexpected(info.error());
    const ScalarType type = storage::scalar_type_of(info->type);
    if (!predicate_has_type(predicate, type)) {
        return core::make_error(core::error_code::invalid_parameter,
            "Predicate type does not match " + std::string(to_string(type)) + " column '" + column + "'",
            "index_manager");
    }
    if (predicate_has_nan(predicate)) {
        return core::make_error(core::error_code::invalid_parameter,
            "NaN predicate value on column '" + column + "'", "index_manager");
    }

    if (auto index = impl_->scalar_index_for(column)) {
        auto result = index->search(predicate);
        if (!result) return std::unexpected(result.error());
        return std::move(result->row_ids);
    }

    auto values = impl_->source_->read_scalar_column(column);
    if (!values) return std::unexpected(values.error());
    roaring::Roaring64Map out;
    for (std::size_t i = 0; i < values->row_ids.size(); ++i) {
        if (predicate_matches(predicate, values->values[i])) out.add(values->row_ids[i]);
    }
    return out;
}

auto IndexManager::drop_index(const std::string& name) -> std::expected<void, core::error> {
    using core::error_code;
    std::unique_lock lock(impl_->mutex_);
    auto it = impl_->entries_.find(name);
    if (it == impl_->entries_.end() || !it->second.published) {
        if (it != impl_->entries_.end() && it->second.state == IndexState::Building) {
            return core::make_error(error_code::build_in_progress,
                "Index '" + name + "' is being built", "index_manager");
        }
        return core::make_error(error_code::index_not_found, "Index '" + name + "' not found", "index_manager");
    }
    Impl::Entry& e = it->second;
    if (e.state == IndexState::Building) {
        return core::make_error(error_code::build_in_progress,
            "Index '" + name + "' is being built", "index_manager");
    }

    if (impl_->options_.storage_dir) {
        std::error_code ec;
        std::filesystem::remove(impl_->artifact_path(name), ec);
        if (ec) {
            return core::make_error(error_code::io_failed,
                "Cannot remove artifact for '" + name + "': " + ec.message(), "index_manager");
        }
    }
    e.published.reset();
    e.state = IndexState::Dropped;
    if (impl_->verbose()) {
        std::cerr << "[MANAGER] dropped " << name << std::endl;
    }
    return {};
}

auto IndexManager::list_indices() const -> std::vector<IndexMetadata> {
    const std::uint64_t current = impl_->source_->data_version();
    std::vector<IndexMetadata> out;
    std::shared_lock lock(impl_->mutex_);
    for (const auto& [name, e] : impl_->entries_) {
        if (!e.published) continue;
        out.push_back(e.published->metadata);
        out.back().stale = out.back().data_version != current;
    }
    return out;
}

auto IndexManager::index_state(const std::string& name) const -> IndexState {
    std::shared_lock lock(impl_->mutex_);
    auto it = impl_->entries_.find(name);
    return it == impl_->entries_.end() ? IndexState::Absent : it->second.state;
}

auto IndexManager::index_stats(const std::string& name) const -> std::expected<IndexStatistics, core::error> {
    std::optional<Impl::Published> snapshot;
    IndexState state = IndexState::Absent;
    {
        std::shared_lock lock(impl_->mutex_);
        auto it = impl_->entries_.find(name);
        if (it != impl_->entries_.end()) {
            snapshot = it->second.published;
            state = it->second.state;
        }
    }
    if (!snapshot) {
        return core::make_error(core::error_code::index_not_found, "Index '" + name + "' not found", "index_manager");
    }

    IndexStatistics stats;
    stats.name = name;
    stats.kind = snapshot->metadata.kind;
    stats.state = state;
    stats.version = snapshot->metadata.version;
    stats.num_indexed_rows = snapshot->metadata.num_indexed_rows;
    stats.stale = snapshot->metadata.data_version != impl_->source_->data_version();

    const auto ids = impl_->source_->row_ids();
    roaring::Roaring64Map live;
    live.addMany(ids.size(), ids.data());
    live -= indexed_rows_of(snapshot->index);
    stats.num_unindexed_rows = live.cardinality();

    if (const auto* v = std::get_if<std::shared_ptr<const IvfPqIndex>>(&snapshot->index)) {
        stats.num_partitions = (*v)->num_partitions();
        stats.memory_bytes = (*v)->memory_bytes();
    } else {
        const auto& b = std::get<std::shared_ptr<const BTreeIndex>>(snapshot->index);
        stats.num_blocks = b->num_blocks();
        stats.memory_bytes = b->memory_bytes();
    }
    return stats;
}

auto IndexManager::options() const noexcept -> const ManagerOptions& { return impl_->options_; }

} // namespace quiver::index
