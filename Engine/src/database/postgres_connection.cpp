/**
 * @file postgres_connection.cpp
 * @brief libpq wrapper used by PostgresBlockStore
 */

#include <database/postgres_connection.hpp>
#include <cstdlib>
#include <stdexcept>

namespace Dagstore {

namespace {

std::string env_or(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

} // namespace

std::string PostgresConnection::conninfo_from_env() {
    std::string conninfo =
        "host=" + env_or("PGHOST", "localhost") +
        " port=" + env_or("PGPORT", "5432") +
        " dbname=" + env_or("PGDATABASE", "dagstore") +
        " user=" + env_or("PGUSER", "postgres");
    if (const char* password = std::getenv("PGPASSWORD")) {
        conninfo += " password=" + std::string(password);
    }
    return conninfo;
}

PostgresConnection::PostgresConnection(const std::string& conninfo)
    : conn_(PQconnectdb(conninfo.c_str())) {
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string message = conn_ ? PQerrorMessage(conn_) : "out of memory";
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("PostgreSQL connection failed: " + message);
    }
}

PostgresConnection::~PostgresConnection() {
    PQfinish(conn_);
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::require_connection() const {
    if (!is_connected()) {
        throw std::runtime_error("PostgreSQL connection lost");
    }
}

void PostgresConnection::fail(const std::string& what) const {
    throw std::runtime_error(what + ": " + PQerrorMessage(conn_));
}

void PostgresConnection::check_result(PGresult* result) const {
    ExecStatusType status = PQresultStatus(result);
    if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK || status == PGRES_COPY_IN) {
        return;
    }
    PQclear(result);
    fail("PostgreSQL query failed");
}

void PostgresConnection::execute(const std::string& sql) {
    require_connection();
    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql,
                                                            const std::vector<std::string>& params) {
    require_connection();

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p.c_str());

    PGresult* result = PQexecParams(conn_, sql.c_str(), static_cast<int>(params.size()),
                                    nullptr, values.data(), nullptr, nullptr, 0);
    check_result(result);

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }
    PQclear(result);
    return value;
}

void PostgresConnection::copy_data(const char* buffer, int nbytes) {
    require_connection();
    if (PQputCopyData(conn_, buffer, nbytes) == -1) {
        fail("COPY data failed");
    }
}

void PostgresConnection::copy_end() {
    require_connection();
    if (PQputCopyEnd(conn_, nullptr) == -1) {
        fail("COPY end failed");
    }

    PGresult* result = PQgetResult(conn_);
    // Drain to the terminating null result so the connection stays usable
    while (PGresult* extra = PQgetResult(conn_)) {
        PQclear(extra);
    }
    check_result(result);
    PQclear(result);
}

PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.execute("BEGIN");
}

PostgresConnection::Transaction::~Transaction() {
    if (committed_) return;
    try {
        conn_.execute("ROLLBACK");
    } catch (const std::exception&) {
        // Server discards the aborted transaction when the connection drops
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.execute("COMMIT");
    committed_ = true;
}

} // namespace Dagstore
