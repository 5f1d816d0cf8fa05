#include "bundle_reader.hpp"
#include "trace.hpp"
#include <fmt/core.h>

namespace kumo {

BundleReader::BundleReader(const std::string& bundle_path)
    : db_(nullptr), bundle_path_(bundle_path) {
    int result = sqlite3_open_v2(bundle_path.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
    if (result != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(result);
        sqlite3_close(db_);
        db_ = nullptr;
        throw BundleReaderError(fmt::format("Failed to open bundle file '{}': {}", bundle_path, error));
    }
}

BundleReader::~BundleReader() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void BundleReader::check_sqlite_result(int result, const std::string& operation) {
    if (result != SQLITE_OK && result != SQLITE_ROW && result != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        throw BundleReaderError(fmt::format("{}: {}", operation, error));
    }
}

size_t BundleReader::function_count() {
    sqlite3_stmt* stmt = nullptr;

    const char* sql = "SELECT COUNT(*) FROM functions";
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    check_sqlite_result(result, "Failed to prepare functions count query");

    result = sqlite3_step(stmt);
    if (result != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        check_sqlite_result(result, "Failed to execute functions count query");
        throw BundleReaderError("Functions count query returned no row");
    }
    size_t count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    sqlite3_finalize(stmt);
    return count;
}

// Copies the blob in the given column of the current row.
static std::vector<uint8_t> column_bytes(sqlite3_stmt* stmt, int column) {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, column));
    int size = sqlite3_column_bytes(stmt, column);
    if (data == nullptr || size <= 0) {
        return {};
    }
    return std::vector<uint8_t>(data, data + size);
}

std::vector<uint8_t> BundleReader::get_function(size_t idx) {
    sqlite3_stmt* stmt = nullptr;

    const char* sql = "SELECT code FROM functions WHERE idx = ?";
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    check_sqlite_result(result, "Failed to prepare functions query");

    result = sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(idx));
    if (result != SQLITE_OK) {
        sqlite3_finalize(stmt);
        check_sqlite_result(result, "Failed to bind parameter");
    }

    result = sqlite3_step(stmt);
    if (result != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        throw BundleReaderError(fmt::format("Function not found: {}", idx));
    }

    std::vector<uint8_t> code = column_bytes(stmt, 0);
    sqlite3_finalize(stmt);
    return code;
}

Module BundleReader::read_module() {
    sqlite3_stmt* stmt = nullptr;

    const char* sql = "SELECT idx, code FROM functions ORDER BY idx";
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    check_sqlite_result(result, "Failed to prepare functions query");

    std::vector<FunctionObject> functions;
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        sqlite3_int64 idx = sqlite3_column_int64(stmt, 0);
        if (idx != static_cast<sqlite3_int64>(functions.size())) {
            sqlite3_finalize(stmt);
            throw BundleReaderError(fmt::format(
                "Function indices in '{}' must run from 0 without gaps, expected {} but found {}",
                bundle_path_, functions.size(), idx));
        }
        functions.push_back(FunctionObject{column_bytes(stmt, 1)});
    }

    if (result != SQLITE_DONE) {
        sqlite3_finalize(stmt);
        check_sqlite_result(result, "Failed to execute functions query");
    }
    sqlite3_finalize(stmt);

    if constexpr (TRACE_LOADER) {
        fmt::print("Read {} function(s) from bundle '{}'\n", functions.size(), bundle_path_);
    }
    if (functions.empty()) {
        throw BundleReaderError(fmt::format("Bundle '{}' has no functions", bundle_path_));
    }
    return Module(std::move(functions));
}

} // namespace kumo
