/**
 * @file postgres_block_store.hpp
 * @brief Block store persisted in PostgreSQL
 */

#pragma once

#include <storage/block_store.hpp>
#include <database/postgres_connection.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Dagstore {

/**
 * @brief BlockStore backed by the dagstore.blocks table.
 *
 * Schema: dagstore.blocks(cid bytea PRIMARY KEY, size bigint, data bytea).
 *
 * Each put_many() borrows a pooled connection (a connection is never used by
 * two threads at once) and writes its blocks in one transaction: binary COPY
 * into a temp table, then INSERT ... ON CONFLICT (cid) DO NOTHING. The pool
 * grows to the number of concurrent callers and keeps idle connections open.
 */
class DAGSTORE_API PostgresBlockStore : public BlockStore {
public:
    /**
     * @brief Open the first connection
     * @throws std::runtime_error if the database is unreachable
     */
    explicit PostgresBlockStore(std::string conninfo = PostgresConnection::conninfo_from_env());

    /**
     * @brief Create schema and table if missing
     */
    void ensure_schema();

    void put_many(const std::vector<Block>& blocks) override;
    bool has(const Cid& cid) override;
    std::optional<Block> get(const Cid& cid) override;
    size_t size() override;

    // Connections opened so far
    size_t connection_count() const;

private:
    class Lease {
    public:
        explicit Lease(PostgresBlockStore& store);
        ~Lease();
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        PostgresConnection& operator*() { return *conn_; }
        PostgresConnection* operator->() { return conn_.get(); }

    private:
        PostgresBlockStore& store_;
        std::unique_ptr<PostgresConnection> conn_;
    };

    std::unique_ptr<PostgresConnection> acquire();
    void release(std::unique_ptr<PostgresConnection> conn);

    const std::string conninfo_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<PostgresConnection>> idle_;
    size_t opened_ = 0;
};

} // namespace Dagstore
