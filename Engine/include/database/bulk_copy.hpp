#pragma once

#include <database/postgres_connection.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace Dagstore {

/**
 * @brief Streams rows into Postgres using binary COPY.
 *
 * Usage:
 *   BulkCopy bc(conn);
 *   bc.begin_table("schema.table", {"col1","col2",...});
 *   for (...) bc.add_row(row);
 *   bc.flush();
 *
 * Rows are COPYed into a session temp table shaped like the target, then
 * moved with INSERT ... SELECT and the conflict clause (default: ON CONFLICT
 * DO NOTHING), so duplicate keys are skipped rather than failing the COPY.
 * The temp table is ON COMMIT DROP: use inside a transaction.
 * Not thread-safe; one instance per connection.
 */
class BulkCopy {
public:
    explicit BulkCopy(PostgresConnection& db) noexcept;

    void begin_table(const std::string& table_name, const std::vector<std::string>& columns);

    // Row builder for the binary COPY format
    struct BinaryRow {
        std::vector<uint8_t> buffer;
        int16_t num_fields = 0;

        // @throws std::length_error if len does not fit a COPY field length
        void add_bytes(const uint8_t* data, size_t len);
        void add_int64(int64_t val);

        void clear() { buffer.clear(); num_fields = 0; }
    };

    void add_row(const BinaryRow& row);

    // Finish the COPY and move the rows into the target table
    void flush();

    // Replaces the default "ON CONFLICT DO NOTHING"
    void set_conflict_clause(const std::string& clause);

private:
    void start_copy_if_needed();
    void write_binary_header();
    void send_buffer();

    std::string quote_identifier(const std::string& id) const;
    std::string full_table_name() const;

    PostgresConnection& db_;
    std::vector<uint8_t> bin_buffer_;

    std::string schema_;
    std::string table_name_;
    std::vector<std::string> columns_;
    std::string temp_table_name_;
    std::string conflict_clause_ = "ON CONFLICT DO NOTHING";
    bool in_copy_ = false;

    static std::atomic<uint64_t> s_counter_;
    static constexpr size_t SEND_THRESHOLD_BYTES = 4 << 20;
};

} // namespace Dagstore
