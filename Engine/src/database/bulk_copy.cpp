#include <database/bulk_copy.hpp>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <arpa/inet.h> // htonl, htons

namespace Dagstore {

std::atomic<uint64_t> BulkCopy::s_counter_{0};

BulkCopy::BulkCopy(PostgresConnection& db) noexcept : db_(db) {}

// ============================================================================
// BinaryRow
// ============================================================================

void BulkCopy::BinaryRow::add_bytes(const uint8_t* data, size_t len) {
    if (len > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::length_error("BulkCopy: field of " + std::to_string(len) +
                                " bytes exceeds the COPY field limit");
    }
    int32_t net_len = htonl(static_cast<int32_t>(len));
    uint8_t* p = reinterpret_cast<uint8_t*>(&net_len);
    buffer.insert(buffer.end(), p, p + 4);
    buffer.insert(buffer.end(), data, data + len);
    num_fields++;
}

void BulkCopy::BinaryRow::add_int64(int64_t val) {
    int32_t len = htonl(8);
    uint8_t* p = reinterpret_cast<uint8_t*>(&len);
    buffer.insert(buffer.end(), p, p + 4);

    // Postgres expects big-endian 64-bit
    uint64_t net_val = __builtin_bswap64(static_cast<uint64_t>(val));
    uint8_t* v = reinterpret_cast<uint8_t*>(&net_val);
    buffer.insert(buffer.end(), v, v + 8);
    num_fields++;
}

// ============================================================================
// BulkCopy
// ============================================================================

void BulkCopy::begin_table(const std::string& table_name, const std::vector<std::string>& columns) {
    if (in_copy_) throw std::runtime_error("BulkCopy: begin_table called while COPY is active");

    auto dot_pos = table_name.find('.');
    if (dot_pos != std::string::npos) {
        schema_ = table_name.substr(0, dot_pos);
        table_name_ = table_name.substr(dot_pos + 1);
    } else {
        schema_.clear();
        table_name_ = table_name;
    }

    columns_ = columns;
    bin_buffer_.clear();

    temp_table_name_ = "tmp_" + table_name_ + "_" + std::to_string(++s_counter_);
}

std::string BulkCopy::quote_identifier(const std::string& id) const {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string BulkCopy::full_table_name() const {
    if (schema_.empty()) {
        return quote_identifier(table_name_);
    }
    return quote_identifier(schema_) + "." + quote_identifier(table_name_);
}

void BulkCopy::write_binary_header() {
    // PGCOPY\n\377\r\n\0
    static const uint8_t header[] = {'P','G','C','O','P','Y','\n',0xFF,'\r','\n','\0'};
    bin_buffer_.insert(bin_buffer_.end(), std::begin(header), std::end(header));

    // Flags (0), then header extension length (0)
    int32_t zero = 0;
    uint8_t* p = reinterpret_cast<uint8_t*>(&zero);
    bin_buffer_.insert(bin_buffer_.end(), p, p + 4);
    bin_buffer_.insert(bin_buffer_.end(), p, p + 4);
}

void BulkCopy::start_copy_if_needed() {
    if (in_copy_) return;

    if (columns_.empty()) {
        throw std::runtime_error("BulkCopy: columns not set. Call begin_table() first.");
    }

    std::string temp_table = quote_identifier(temp_table_name_);

    std::ostringstream create_sql;
    create_sql << "CREATE TEMP TABLE IF NOT EXISTS " << temp_table
               << " (LIKE " << full_table_name() << " INCLUDING DEFAULTS) ON COMMIT DROP";
    db_.execute(create_sql.str());

    std::ostringstream copy_sql;
    copy_sql << "COPY " << temp_table << " (";
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) copy_sql << ", ";
        copy_sql << quote_identifier(columns_[i]);
    }
    copy_sql << ") FROM STDIN WITH (FORMAT BINARY)";

    db_.execute(copy_sql.str());
    in_copy_ = true;

    write_binary_header();
}

void BulkCopy::send_buffer() {
    if (bin_buffer_.empty()) return;
    db_.copy_data(reinterpret_cast<const char*>(bin_buffer_.data()), static_cast<int>(bin_buffer_.size()));
    bin_buffer_.clear();
}

void BulkCopy::add_row(const BinaryRow& row) {
    if (static_cast<size_t>(row.num_fields) != columns_.size()) {
        throw std::runtime_error("BulkCopy: row has " + std::to_string(row.num_fields) +
                                 " fields, expected " + std::to_string(columns_.size()));
    }
    start_copy_if_needed();

    int16_t nf = htons(row.num_fields);
    uint8_t* p = reinterpret_cast<uint8_t*>(&nf);
    bin_buffer_.insert(bin_buffer_.end(), p, p + 2);
    bin_buffer_.insert(bin_buffer_.end(), row.buffer.begin(), row.buffer.end());

    if (bin_buffer_.size() >= SEND_THRESHOLD_BYTES) {
        send_buffer();
    }
}

void BulkCopy::flush() {
    if (!in_copy_) return;

    // -1 field count marks the end of the binary stream
    int16_t trailer = htons(-1);
    uint8_t* p = reinterpret_cast<uint8_t*>(&trailer);
    bin_buffer_.insert(bin_buffer_.end(), p, p + 2);

    // Leave in_copy_ cleared even if the server rejects the data
    in_copy_ = false;
    try {
        send_buffer();
    } catch (...) {
        bin_buffer_.clear();
        throw;
    }
    db_.copy_end();

    std::string cols_str;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) cols_str += ", ";
        cols_str += quote_identifier(columns_[i]);
    }

    std::ostringstream sql;
    sql << "INSERT INTO " << full_table_name()
        << " (" << cols_str << ") SELECT " << cols_str
        << " FROM " << quote_identifier(temp_table_name_)
        << " " << conflict_clause_;
    db_.execute(sql.str());

    sql.str("");
    sql << "TRUNCATE " << quote_identifier(temp_table_name_);
    db_.execute(sql.str());
}

void BulkCopy::set_conflict_clause(const std::string& clause) {
    conflict_clause_ = clause;
}

} // namespace Dagstore
