#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <limits>
#include <mutex>
#include <thread>

#include "quiver/index/index_manager.hpp"
#include "../support/test_data.hpp"

using namespace quiver;
using namespace quiver::index;
using quiver::core::error_code;

namespace {

constexpr std::size_t kRows = 800;
constexpr std::size_t kDim = 16;

auto small_ivfpq() -> IvfPqBuildParams {
    IvfPqBuildParams p;
    p.num_partitions = 8;
    p.num_sub_vectors = 4;
    p.num_bits = 4;
    p.max_iterations = 10;
    return p;
}

auto vector_request() -> CreateIndexRequest {
    CreateIndexRequest req;
    req.params = small_ivfpq();
    return req;
}

auto scalar_request(const std::string& column) -> CreateIndexRequest {
    CreateIndexRequest req;
    req.column = column;
    BTreeBuildParams p;
    p.block_size = 64;
    req.params = p;
    return req;
}

auto row_vector(const storage::DataSource& source, std::uint64_t id) -> std::vector<float> {
    const std::uint64_t ids[] = {id};
    return source.fetch_vectors("embedding", ids).value();
}

auto to_vector(const roaring::Roaring64Map& m) -> std::vector<std::uint64_t> {
    std::vector<std::uint64_t> out;
    for (auto v : m) out.push_back(v);
    return out;
}

// Forwards to a table; column reads block while the gate is closed.
class GatedSource final : public storage::DataSource {
public:
    explicit GatedSource(std::shared_ptr<storage::InMemoryTable> inner) : inner_(std::move(inner)) {}

    void close_gate() {
        std::lock_guard lock(mu_);
        open_ = false;
        waiting_ = 0;
    }
    void open_gate() {
        {
            std::lock_guard lock(mu_);
            open_ = true;
        }
        cv_.notify_all();
    }
    void wait_until_blocked() {
        std::unique_lock lock(mu_);
        cv_.wait(lock, [this] { return waiting_ > 0; });
    }

    auto schema() const -> std::vector<storage::ColumnInfo> override { return inner_->schema(); }
    auto read_vector_column(const std::string& name) const
        -> std::expected<storage::VectorColumn, core::error> override {
        pass_gate();
        return inner_->read_vector_column(name);
    }
    auto read_scalar_column(const std::string& name) const
        -> std::expected<storage::ScalarColumn, core::error> override {
        pass_gate();
        return inner_->read_scalar_column(name);
    }
    auto fetch_vectors(const std::string& name, std::span<const std::uint64_t> ids) const
        -> std::expected<std::vector<float>, core::error> override {
        return inner_->fetch_vectors(name, ids);
    }
    auto fetch_scalars(const std::string& name, std::span<const std::uint64_t> ids) const
        -> std::expected<std::vector<ScalarValue>, core::error> override {
        return inner_->fetch_scalars(name, ids);
    }
    auto row_ids() const -> std::vector<std::uint64_t> override { return inner_->row_ids(); }
    auto row_count() const -> std::uint64_t override { return inner_->row_count(); }
    auto data_version() const -> std::uint64_t override { return inner_->data_version(); }

private:
    void pass_gate() const {
        std::unique_lock lock(mu_);
        if (open_) return;
        ++waiting_;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    std::shared_ptr<storage::InMemoryTable> inner_;
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    bool open_{true};
    mutable int waiting_{0};
};

// Vector column reads come back with the last float missing.
class TruncatedColumnSource final : public storage::DataSource {
public:
    explicit TruncatedColumnSource(std::shared_ptr<storage::InMemoryTable> inner) : inner_(std::move(inner)) {}

    auto schema() const -> std::vector<storage::ColumnInfo> override { return inner_->schema(); }
    auto read_vector_column(const std::string& name) const
        -> std::expected<storage::VectorColumn, core::error> override {
        auto col = inner_->read_vector_column(name);
        if (col && !col->data.empty()) col->data.pop_back();
        return col;
    }
    auto read_scalar_column(const std::string& name) const
        -> std::expected<storage::ScalarColumn, core::error> override {
        return inner_->read_scalar_column(name);
    }
    auto fetch_vectors(const std::string& name, std::span<const std::uint64_t> ids) const
        -> std::expected<std::vector<float>, core::error> override {
        return inner_->fetch_vectors(name, ids);
    }
    auto fetch_scalars(const std::string& name, std::span<const std::uint64_t> ids) const
        -> std::expected<std::vector<ScalarValue>, core::error> override {
        return inner_->fetch_scalars(name, ids);
    }
    auto row_ids() const -> std::vector<std::uint64_t> override { return inner_->row_ids(); }
    auto row_count() const -> std::uint64_t override { return inner_->row_count(); }
    auto data_version() const -> std::uint64_t override { return inner_->data_version(); }

private:
    std::shared_ptr<storage::InMemoryTable> inner_;
};

} // anonymous namespace

TEST_CASE("vector index lifecycle", "[manager]") {
    auto table = test::make_table(kRows, kDim, 11);
    IndexManager manager(table);

    REQUIRE(manager.index_state("embedding_idx") == IndexState::Absent);
    auto report = manager.create_index(vector_request());
    REQUIRE(report.has_value());
    REQUIRE(report->metadata.name == "embedding_idx");
    REQUIRE(report->metadata.column == "embedding");
    REQUIRE(report->metadata.kind == IndexKind::Vector);
    REQUIRE(report->metadata.version == 1);
    REQUIRE(report->metadata.num_indexed_rows == kRows);
    REQUIRE(report->metadata.uuid.size() == 32);
    REQUIRE(report->vector_stats.has_value());
    REQUIRE(report->vector_stats->num_partitions == 8);
    REQUIRE(manager.index_state("embedding_idx") == IndexState::Ready);

    search::VectorQuery q;
    q.vector = row_vector(*table, 3);
    q.k = 5;
    q.refine_factor = 10;
    auto hits = manager.search(q);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 5);
    REQUIRE(hits->front().row_id == 3);

    auto stats = manager.index_stats("embedding_idx");
    REQUIRE(stats.has_value());
    REQUIRE(stats->num_partitions == std::optional<std::uint32_t>(8));
    REQUIRE(stats->num_indexed_rows == kRows);
    REQUIRE(stats->num_unindexed_rows == 0);
    REQUIRE_FALSE(stats->stale);
    REQUIRE(stats->memory_bytes > 0);

    SECTION("replace=false keeps the published index") {
        auto req = vector_request();
        req.replace = false;
        auto again = manager.create_index(req);
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == error_code::index_exists);
        REQUIRE(manager.index_state("embedding_idx") == IndexState::Ready);
    }

    SECTION("replace bumps the version and uuid") {
        auto again = manager.create_index(vector_request());
        REQUIRE(again.has_value());
        REQUIRE(again->metadata.version == 2);
        REQUIRE(again->metadata.uuid != report->metadata.uuid);
        REQUIRE(manager.list_indices().size() == 1);
    }

    SECTION("drop then rebuild") {
        REQUIRE(manager.drop_index("embedding_idx").has_value());
        REQUIRE(manager.index_state("embedding_idx") == IndexState::Dropped);
        REQUIRE(manager.list_indices().empty());
        REQUIRE(manager.index_stats("embedding_idx").error().code == error_code::index_not_found);
        REQUIRE(manager.drop_index("embedding_idx").error().code == error_code::index_not_found);

        auto flat = manager.search(q);
        REQUIRE(flat.has_value());
        REQUIRE(flat->front().row_id == 3);

        auto rebuilt = manager.create_index(vector_request());
        REQUIRE(rebuilt.has_value());
        REQUIRE(rebuilt->metadata.version == 2);
    }

    SECTION("appended rows are reported as unindexed") {
        std::vector<storage::Row> rows(5);
        for (std::size_t i = 0; i < rows.size(); ++i) {
            rows[i].row_id = 10'000 + i;
            rows[i].vectors["embedding"] = std::vector<float>(kDim, 0.5f);
            rows[i].scalars["category"] = std::int64_t{1};
            rows[i].scalars["tag"] = std::string("odd");
        }
        REQUIRE(table->append(rows).has_value());

        auto listed = manager.list_indices();
        REQUIRE(listed.size() == 1);
        REQUIRE(listed.front().stale);

        auto after = manager.index_stats("embedding_idx");
        REQUIRE(after.has_value());
        REQUIRE(after->stale);
        REQUIRE(after->num_unindexed_rows == 5);
    }

    SECTION("removed rows are skipped by indexed search") {
        const std::uint64_t gone[] = {3};
        REQUIRE(table->remove(gone) == 1);

        auto refined = manager.search(q);
        REQUIRE(refined.has_value());
        REQUIRE(refined->size() == 5);
        for (const auto& h : *refined) REQUIRE(h.row_id != 3);

        search::VectorQuery plain = q;
        plain.refine_factor = 1;
        auto approx = manager.search(plain);
        REQUIRE(approx.has_value());
        REQUIRE(approx->size() == 5);
        for (const auto& h : *approx) REQUIRE(h.row_id != 3);

        search::VectorQuery post = q;
        post.refine_factor = 2;
        post.filter = filter_expr{term{"tag", std::string("odd")}};
        post.prefilter = false;
        auto filtered = manager.search(post);
        REQUIRE(filtered.has_value());
        for (const auto& h : *filtered) {
            REQUIRE(h.row_id != 3);
            REQUIRE(h.row_id % 2 == 1);
        }

        auto stats = manager.index_stats("embedding_idx");
        REQUIRE(stats.has_value());
        REQUIRE(stats->stale);
        REQUIRE(stats->num_indexed_rows == kRows);
    }
}

TEST_CASE("column resolution", "[manager]") {
    SECTION("unknown and mistyped columns") {
        auto table = test::make_table(100, kDim, 12);
        IndexManager manager(table);

        auto req = vector_request();
        req.column = "missing";
        REQUIRE(manager.create_index(req).error().code == error_code::column_resolution);

        req.column = "category";
        REQUIRE(manager.create_index(req).error().code == error_code::invalid_parameter);

        auto scalar = scalar_request("embedding");
        REQUIRE(manager.create_index(scalar).error().code == error_code::invalid_parameter);

        scalar.column.reset();
        REQUIRE(manager.create_index(scalar).error().code == error_code::column_resolution);
        REQUIRE(manager.index_state("embedding_idx") == IndexState::Absent);
    }

    SECTION("ambiguous vector column") {
        using storage::ColumnType;
        auto table = storage::InMemoryTable::create({
            {"a", ColumnType::Float32Vector, 4},
            {"b", ColumnType::Float32Vector, 4},
        }).value();
        IndexManager manager(table);

        auto req = vector_request();
        REQUIRE(manager.create_index(req).error().code == error_code::column_resolution);

        search::VectorQuery q;
        q.vector = std::vector<float>(4, 0.0f);
        REQUIRE(manager.search(q).error().code == error_code::column_resolution);
    }

    SECTION("index names must be file-safe") {
        auto table = test::make_table(100, kDim, 13);
        IndexManager manager(table);
        auto req = scalar_request("category");
        for (const char* bad : {"", "..", "a/b", "a\\b"}) {
            req.name = bad;
            REQUIRE(manager.create_index(req).error().code == error_code::invalid_parameter);
        }
    }
}

TEST_CASE("scalar search with and without a BTree", "[manager]") {
    auto table = test::make_table(kRows, kDim, 14);
    IndexManager manager(table);

    const ScalarPredicate eq = Equals{std::int64_t{7}};
    const ScalarPredicate rng = Range{Bound{std::int64_t{2}, true}, Bound{std::int64_t{4}, false}};

    auto scan_eq = manager.search_scalar("category", eq);
    auto scan_rng = manager.search_scalar("category", rng);
    REQUIRE(scan_eq.has_value());
    REQUIRE(scan_rng.has_value());
    REQUIRE(scan_eq->cardinality() == kRows / 10);
    REQUIRE(scan_rng->cardinality() == 2 * kRows / 10);

    auto report = manager.create_index(scalar_request("category"));
    REQUIRE(report.has_value());
    REQUIRE(report->metadata.name == "category_idx");
    REQUIRE(report->metadata.kind == IndexKind::Scalar);
    REQUIRE_FALSE(report->metadata.distance_type.has_value());

    REQUIRE(to_vector(manager.search_scalar("category", eq).value()) == to_vector(*scan_eq));
    REQUIRE(to_vector(manager.search_scalar("category", rng).value()) == to_vector(*scan_rng));

    auto stats = manager.index_stats("category_idx");
    REQUIRE(stats.has_value());
    REQUIRE(stats->num_blocks == std::optional<std::size_t>((kRows + 63) / 64));

    auto mismatch = manager.search_scalar("category", Equals{std::string("7")});
    REQUIRE(mismatch.error().code == error_code::invalid_parameter);
    REQUIRE(manager.search_scalar("nope", eq).error().code == error_code::column_resolution);

    SECTION("prefiltered vector search uses the scalar index") {
        search::VectorQuery q;
        q.vector = row_vector(*table, 17);
        q.k = 5;
        q.filter = filter_expr{term{"category", std::int64_t{7}}};
        auto hits = manager.search(q);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 5);
        REQUIRE(hits->front().row_id == 17);
        for (const auto& h : *hits) REQUIRE(h.row_id % 10 == 7);
    }
}

TEST_CASE("short vector column fails the build", "[manager]") {
    auto table = test::make_table(kRows, kDim, 19);
    IndexManager manager(std::make_shared<TruncatedColumnSource>(table));

    auto report = manager.create_index(vector_request());
    REQUIRE_FALSE(report.has_value());
    REQUIRE(report.error().code == error_code::dimension_mismatch);
    REQUIRE(manager.index_state("embedding_idx") == IndexState::Absent);
    REQUIRE(manager.list_indices().empty());
}

TEST_CASE("NaN predicates are rejected with and without a BTree", "[manager]") {
    using storage::ColumnType;
    auto table = storage::InMemoryTable::create({
        {"embedding", ColumnType::Float32Vector, 4},
        {"score", ColumnType::Float64, 0},
    }).value();
    std::vector<storage::Row> rows(40);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        rows[i].row_id = i;
        rows[i].vectors["embedding"] = std::vector<float>(4, static_cast<float>(i));
        rows[i].scalars["score"] = 0.5 * static_cast<double>(i);
    }
    REQUIRE(table->append(rows).has_value());
    IndexManager manager(table);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<ScalarPredicate> preds{
        Equals{nan},
        Range{std::nullopt, Bound{nan, true}},
        InSet{{nan, 1.0}},
    };

    search::VectorQuery q;
    q.vector = std::vector<float>(4, 3.0f);
    q.k = 3;
    q.filter = filter_expr{term{"score", nan}};

    auto check = [&] {
        for (const auto& p : preds) {
            auto r = manager.search_scalar("score", p);
            REQUIRE_FALSE(r.has_value());
            REQUIRE(r.error().code == error_code::invalid_parameter);
        }
        for (bool prefilter : {true, false}) {
            q.prefilter = prefilter;
            REQUIRE(manager.search(q).error().code == error_code::invalid_parameter);
        }
        REQUIRE(manager.search_scalar("score", Range{Bound{1.0, true}, Bound{2.0, true}})->cardinality() == 3);
    };

    check();
    REQUIRE(manager.create_index(scalar_request("score")).has_value());
    check();
}

TEST_CASE("indices persist across managers", "[manager][persistence]") {
    test::TempDir dir("quiver_manager");
    auto table = test::make_table(kRows, kDim, 15);
    ManagerOptions options;
    options.storage_dir = dir.path();

    search::VectorQuery q;
    q.vector = row_vector(*table, 42);
    q.k = 8;

    std::vector<SearchHit> before;
    std::string uuid;
    {
        auto manager = IndexManager::open(table, options);
        REQUIRE(manager.has_value());
        auto v = (*manager)->create_index(vector_request());
        REQUIRE(v.has_value());
        uuid = v->metadata.uuid;
        REQUIRE((*manager)->create_index(scalar_request("tag")).has_value());
        REQUIRE(std::filesystem::exists(dir.path() / "embedding_idx.qidx"));
        REQUIRE(std::filesystem::exists(dir.path() / "tag_idx.qidx"));
        before = (*manager)->search(q).value();
    }

    auto reopened = IndexManager::open(table, options);
    REQUIRE(reopened.has_value());
    auto& manager = **reopened;
    REQUIRE(manager.index_state("embedding_idx") == IndexState::Ready);
    REQUIRE(manager.index_state("tag_idx") == IndexState::Ready);

    auto listed = manager.list_indices();
    REQUIRE(listed.size() == 2);
    REQUIRE(listed[0].name == "embedding_idx");
    REQUIRE(listed[0].uuid == uuid);
    REQUIRE(listed[0].distance_type == std::optional(kernels::DistanceType::L2));
    REQUIRE(std::get<IvfPqBuildParams>(listed[0].params).num_partitions == std::optional<std::uint32_t>(8));
    REQUIRE(listed[1].name == "tag_idx");
    REQUIRE(std::get<BTreeBuildParams>(listed[1].params).block_size == std::optional<std::uint32_t>(64));

    REQUIRE(manager.search(q).value() == before);
    REQUIRE(manager.search_scalar("tag", Equals{std::string("even")})->cardinality() == kRows / 2);

    SECTION("version continues after reload") {
        auto again = manager.create_index(vector_request());
        REQUIRE(again.has_value());
        REQUIRE(again->metadata.version == 2);
    }

    SECTION("drop removes the artifact") {
        REQUIRE(manager.drop_index("tag_idx").has_value());
        REQUIRE_FALSE(std::filesystem::exists(dir.path() / "tag_idx.qidx"));

        auto later = IndexManager::open(table, options);
        REQUIRE(later.has_value());
        REQUIRE((*later)->index_state("tag_idx") == IndexState::Absent);
        auto rebuilt = (*later)->create_index(scalar_request("tag"));
        REQUIRE(rebuilt.has_value());
        REQUIRE(rebuilt->metadata.version == 1);
    }

    SECTION("corrupt artifact fails to open") {
        const auto path = dir.path() / "tag_idx.qidx";
        std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
        f.seekg(40);
        char c = 0;
        f.read(&c, 1);
        c = static_cast<char>(c ^ 0x5A);
        f.seekp(40);
        f.write(&c, 1);
        f.close();

        auto broken = IndexManager::open(table, options);
        REQUIRE_FALSE(broken.has_value());
        REQUIRE(broken.error().code == error_code::data_integrity);
    }
}

TEST_CASE("concurrent build of the same name is rejected", "[manager][async]") {
    auto table = test::make_table(kRows, kDim, 16);
    auto source = std::make_shared<GatedSource>(table);
    IndexManager manager(source);

    source->close_gate();
    auto task = manager.create_index_async(vector_request());
    REQUIRE(task.has_value());
    REQUIRE(task->name() == "embedding_idx");
    source->wait_until_blocked();

    REQUIRE(manager.index_state("embedding_idx") == IndexState::Building);
    auto second = manager.create_index(vector_request());
    REQUIRE_FALSE(second.has_value());
    REQUIRE(second.error().code == error_code::build_in_progress);
    REQUIRE(manager.drop_index("embedding_idx").error().code == error_code::build_in_progress);
    REQUIRE_FALSE(task->ready());

    source->open_gate();
    auto result = task->wait();
    REQUIRE(result.has_value());
    REQUIRE(result->metadata.version == 1);
    REQUIRE(task->ready());
    REQUIRE(manager.index_state("embedding_idx") == IndexState::Ready);

    search::VectorQuery q;
    q.vector = row_vector(*table, 9);
    q.k = 3;
    REQUIRE(manager.search(q)->size() == 3);
}

TEST_CASE("cancelled rebuild keeps the previous index", "[manager][async]") {
    auto table = test::make_table(kRows, kDim, 17);
    auto source = std::make_shared<GatedSource>(table);
    IndexManager manager(source);

    auto first = manager.create_index(vector_request());
    REQUIRE(first.has_value());

    source->close_gate();
    auto task = manager.create_index_async(vector_request());
    REQUIRE(task.has_value());
    source->wait_until_blocked();

    REQUIRE(manager.index_state("embedding_idx") == IndexState::Building);
    search::VectorQuery q;
    q.vector = row_vector(*table, 9);
    q.k = 3;
    q.refine_factor = 10;
    auto during = manager.search(q);
    REQUIRE(during.has_value());
    REQUIRE(during->size() == 3);
    REQUIRE(during->front().row_id == 9);
    auto building_stats = manager.index_stats("embedding_idx");
    REQUIRE(building_stats.has_value());
    REQUIRE(building_stats->state == IndexState::Building);
    REQUIRE(building_stats->version == 1);
    REQUIRE(manager.list_indices().front().uuid == first->metadata.uuid);

    task->cancel();
    source->open_gate();

    auto result = task->wait();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == error_code::cancelled);

    REQUIRE(manager.index_state("embedding_idx") == IndexState::Ready);
    auto stats = manager.index_stats("embedding_idx");
    REQUIRE(stats.has_value());
    REQUIRE(stats->version == 1);
    REQUIRE(manager.list_indices().front().uuid == first->metadata.uuid);

    SECTION("cancelled first build leaves the name absent") {
        source->close_gate();
        auto fresh = manager.create_index_async(scalar_request("category"));
        REQUIRE(fresh.has_value());
        source->wait_until_blocked();
        fresh->cancel();
        source->open_gate();
        REQUIRE(fresh->wait().error().code == error_code::cancelled);
        REQUIRE(manager.index_state("category_idx") == IndexState::Absent);
    }
}

TEST_CASE("manager shutdown cancels in-flight builds", "[manager][async]") {
    auto table = test::make_table(kRows, kDim, 18);
    auto source = std::make_shared<GatedSource>(table);
    std::optional<BuildTask> task;
    std::thread opener;
    {
        IndexManager manager(source);
        source->close_gate();
        auto started = manager.create_index_async(vector_request());
        REQUIRE(started.has_value());
        task = *started;
        source->wait_until_blocked();
        opener = std::thread([source] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            source->open_gate();
        });
    }
    opener.join();
    REQUIRE(task->ready());
    REQUIRE(task->wait().error().code == error_code::cancelled);
}

TEST_CASE("index metadata encoding", "[manager][metadata]") {
    IndexMetadata meta;
    meta.name = "embedding_idx";
    meta.column = "embedding";
    meta.kind = IndexKind::Vector;
    meta.uuid = generate_uuid();
    meta.distance_type = kernels::DistanceType::Cosine;
    meta.replace = false;
    meta.build_timestamp = 1'700'000'000;
    meta.version = 4;
    meta.num_indexed_rows = 1234;
    meta.data_version = 9;

    const auto bytes = encode_metadata(meta);
    auto decoded = decode_metadata(bytes);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->name == meta.name);
    REQUIRE(decoded->column == meta.column);
    REQUIRE(decoded->uuid == meta.uuid);
    REQUIRE(decoded->distance_type == meta.distance_type);
    REQUIRE_FALSE(decoded->replace);
    REQUIRE(decoded->build_timestamp == meta.build_timestamp);
    REQUIRE(decoded->version == 4);
    REQUIRE(decoded->num_indexed_rows == 1234);
    REQUIRE(decoded->data_version == 9);

    REQUIRE(decode_metadata(std::span(bytes).first(bytes.size() - 1)).error().code ==
            error_code::data_integrity);

    auto extended = bytes;
    extended.push_back(0);
    REQUIRE(decode_metadata(extended).error().code == error_code::data_integrity);

    REQUIRE(generate_uuid() != generate_uuid());
}
