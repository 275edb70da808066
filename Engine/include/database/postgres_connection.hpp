/**
 * @file postgres_connection.hpp
 * @brief Single libpq connection used by the block store pool
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace Dagstore {

/**
 * @brief Owns one PGconn.
 *
 * Not thread-safe: PostgresBlockStore leases each connection to one flush at
 * a time. Every failure throws std::runtime_error carrying the server message.
 */
class PostgresConnection {
public:
    /**
     * @brief Connect with a libpq conninfo string
     * @throws std::runtime_error if the server cannot be reached
     */
    explicit PostgresConnection(const std::string& conninfo);
    ~PostgresConnection();

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    bool is_connected() const;

    // Statement with no result rows
    void execute(const std::string& sql);

    /**
     * @brief First column of the first row, or nullopt if there is none or it is NULL
     *
     * Parameters are sent as text ($1, $2, ...).
     */
    std::optional<std::string> query_single(const std::string& sql,
                                            const std::vector<std::string>& params = {});

    // COPY FROM STDIN streaming; copy_end() reports the server's verdict
    void copy_data(const char* buffer, int nbytes);
    void copy_end();

    /**
     * @brief BEGIN on construction, ROLLBACK on destruction unless committed
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        void commit();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
    };

    /**
     * @brief conninfo from PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     *
     * Defaults: localhost, 5432, dagstore, postgres, no password.
     */
    static std::string conninfo_from_env();

private:
    void require_connection() const;
    [[noreturn]] void fail(const std::string& what) const;
    void check_result(PGresult* result) const;

    PGconn* conn_ = nullptr;
};

} // namespace Dagstore
