#pragma once

/** \file index_manager.hpp
 *  \brief Per-table index registry: builds, publishes, persists and queries
 *         vector (IVF-PQ) and scalar (BTree) indices.
 *
 * Each index name follows Absent -> Building -> Ready (-> Building -> Ready on
 * rebuild) -> Dropped; a dropped name may be built again. Builds train without
 * holding the registry lock and publish with a pointer swap, so queries keep
 * using the last Ready version until the new one is in place.
 *
 * Thread-safety: all public methods are safe to call concurrently.
 *
 * Example:
 * \code
 * auto table = storage::InMemoryTable::create(schema).value();
 * index::IndexManager manager(table, ManagerOptions::from_env());
 * index::CreateIndexRequest req;
 * req.params = index::IvfPqBuildParams{};
 * auto report = manager.create_index(req);
 * search::VectorQuery q;
 * q.vector = embedding;
 * auto hits = manager.search(q);
 * \endcode
 */

#include <cstdint>
#include <expected>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <roaring/roaring64map.hh>

#include "quiver/config.hpp"
#include "quiver/core/cancellation.hpp"
#include "quiver/error.hpp"
#include "quiver/index/btree_index.hpp"
#include "quiver/index/index_metadata.hpp"
#include "quiver/index/search_types.hpp"
#include "quiver/search/query_executor.hpp"
#include "quiver/storage/data_source.hpp"

namespace quiver::index {

struct CreateIndexRequest {
    std::optional<std::string> column;  /**< Vector: default the only vector column; scalar: required */
    std::optional<std::string> name;    /**< Default "<column>_idx" */
    IndexParams params;                 /**< Selects the index kind */
    bool replace{true};                 /**< false fails with index_exists on a Ready name */
};

using BuildResult = std::expected<BuildReport, core::error>;

/** \brief Handle to a background build. Copies share the same build. */
class BuildTask {
public:
    BuildTask() = default;

    auto name() const noexcept -> const std::string& { return name_; }

    /** \brief Request cancellation; the build stops at its next poll point. */
    void cancel() const noexcept {
        if (token_) token_->cancel();
    }

    /** \brief True once the result is available. */
    auto ready() const -> bool;

    /** \brief Block until the build finishes. */
    auto wait() const -> BuildResult;

private:
    friend class IndexManager;
    BuildTask(std::string name, std::shared_ptr<core::CancellationToken> token,
              std::shared_future<BuildResult> result)
        : name_(std::move(name)), token_(std::move(token)), result_(std::move(result)) {}

    std::string name_;
    std::shared_ptr<core::CancellationToken> token_;
    std::shared_future<BuildResult> result_;
};

class IndexManager {
public:
    /** \brief Empty registry over a data source; persists to options.storage_dir when set. */
    IndexManager(std::shared_ptr<storage::DataSource> source, ManagerOptions options = {});

    /** \brief Construct and load every "*.qidx" artifact in options.storage_dir as Ready.
     *
     * Errors: io_failed (directory not creatable or unreadable), data_integrity
     * (corrupt artifact or duplicate index name).
     */
    static auto open(std::shared_ptr<storage::DataSource> source, ManagerOptions options)
        -> std::expected<std::unique_ptr<IndexManager>, core::error>;

    /** \brief Cancels and joins in-flight builds. */
    ~IndexManager();

    IndexManager(const IndexManager&) = delete;
    IndexManager& operator=(const IndexManager&) = delete;

    /** \brief Build synchronously and publish.
     *
     * Errors: column_resolution, invalid_parameter, insufficient_data,
     * index_exists, build_in_progress, io_failed, cancelled. Nothing is
     * published on failure and the name returns to its previous state.
     */
    auto create_index(const CreateIndexRequest& request) -> BuildResult;

    /** \brief Start a background build.
     *
     * Column resolution and the build_in_progress / index_exists checks run
     * before returning; training errors are reported through the task.
     */
    auto create_index_async(const CreateIndexRequest& request) -> std::expected<BuildTask, core::error>;

    /** \brief Nearest-neighbour query; uses the vector index on the column when one is Ready. */
    auto search(const search::VectorQuery& query) const
        -> std::expected<std::vector<SearchHit>, core::error>;

    /** \brief Row ids whose value matches; uses the BTree index on the column, else a full scan. */
    auto search_scalar(const std::string& column, const ScalarPredicate& predicate) const
        -> std::expected<roaring::Roaring64Map, core::error>;

    /** \brief Remove a Ready index and its artifact.
     *
     * Errors: index_not_found, build_in_progress, io_failed.
     */
    auto drop_index(const std::string& name) -> std::expected<void, core::error>;

    /** \brief Metadata of every published index, sorted by name, with staleness filled in. */
    auto list_indices() const -> std::vector<IndexMetadata>;

    auto index_state(const std::string& name) const -> IndexState;

    /** \brief Coverage and shape of a published index. Errors: index_not_found. */
    auto index_stats(const std::string& name) const -> std::expected<IndexStatistics, core::error>;

    auto options() const noexcept -> const ManagerOptions&;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::index
