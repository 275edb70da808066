#include <storage/postgres_block_store.hpp>
#include <storage/format_utils.hpp>
#include <database/bulk_copy.hpp>
#include <utils/logger.hpp>
#include <utility>

namespace Dagstore {

namespace {

constexpr const char* BLOCKS_TABLE = "dagstore.blocks";

} // namespace

PostgresBlockStore::PostgresBlockStore(std::string conninfo)
    : conninfo_(std::move(conninfo)) {
    release(acquire());
}

std::unique_ptr<PostgresConnection> PostgresBlockStore::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return conn;
        }
    }

    // Connect outside the lock; other flushes keep using pooled connections
    auto conn = std::make_unique<PostgresConnection>(conninfo_);
    size_t opened;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        opened = ++opened_;
    }
    if (opened > 1) {
        Logger::bulk("Block store pool grew to " + std::to_string(opened) + " connections");
    }
    return conn;
}

void PostgresBlockStore::release(std::unique_ptr<PostgresConnection> conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn && conn->is_connected()) {
        idle_.push_back(std::move(conn));
    } else {
        --opened_;
    }
}

PostgresBlockStore::Lease::Lease(PostgresBlockStore& store)
    : store_(store), conn_(store.acquire()) {}

PostgresBlockStore::Lease::~Lease() {
    store_.release(std::move(conn_));
}

size_t PostgresBlockStore::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opened_;
}

void PostgresBlockStore::ensure_schema() {
    Lease db(*this);
    db->execute("CREATE SCHEMA IF NOT EXISTS dagstore");
    db->execute(
        "CREATE TABLE IF NOT EXISTS dagstore.blocks ("
        "  cid  bytea PRIMARY KEY,"
        "  size bigint NOT NULL,"
        "  data bytea NOT NULL"
        ")");
    Logger::info("Block table ready: " + std::string(BLOCKS_TABLE));
}

void PostgresBlockStore::put_many(const std::vector<Block>& blocks) {
    if (blocks.empty()) return;

    Lease db(*this);
    PostgresConnection::Transaction txn(*db);

    BulkCopy copy(*db);
    copy.begin_table(BLOCKS_TABLE, {"cid", "size", "data"});
    copy.set_conflict_clause("ON CONFLICT (\"cid\") DO NOTHING");

    BulkCopy::BinaryRow row;
    for (const auto& block : blocks) {
        row.clear();
        row.add_bytes(block.cid().data(), block.cid().size());
        row.add_int64(static_cast<int64_t>(block.size()));
        row.add_bytes(block.data().data(), block.size());
        copy.add_row(row);
    }
    copy.flush();

    txn.commit();
}

bool PostgresBlockStore::has(const Cid& cid) {
    Lease db(*this);
    auto found = db->query_single(
        "SELECT 1 FROM dagstore.blocks WHERE cid = $1::bytea",
        {cid_to_bytea_hex(cid)});
    return found.has_value();
}

std::optional<Block> PostgresBlockStore::get(const Cid& cid) {
    Lease db(*this);
    auto data = db->query_single(
        "SELECT data FROM dagstore.blocks WHERE cid = $1::bytea",
        {cid_to_bytea_hex(cid)});
    if (!data) return std::nullopt;
    return Block(cid, bytea_hex_to_bytes(*data));
}

size_t PostgresBlockStore::size() {
    Lease db(*this);
    auto count = db->query_single("SELECT count(*) FROM dagstore.blocks");
    return count ? static_cast<size_t>(std::stoull(*count)) : 0;
}

} // namespace Dagstore
