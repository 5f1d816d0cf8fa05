#ifndef BUNDLE_READER_HPP
#define BUNDLE_READER_HPP

#include "module.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>
#include <stdexcept>

namespace kumo {

class BundleReaderError : public std::runtime_error {
public:
    explicit BundleReaderError(const std::string& msg) : std::runtime_error(msg) {}
};

// Reads a module from an SQLite bundle file with the table
//   functions(idx INTEGER PRIMARY KEY, code BLOB NOT NULL)
// Indices must run densely from 0; function 0 is the entry point.
class BundleReader {
private:
    sqlite3* db_;
    std::string bundle_path_;

    // Helper to execute queries and handle errors.
    void check_sqlite_result(int result, const std::string& operation);

public:
    explicit BundleReader(const std::string& bundle_path);
    ~BundleReader();

    // Disable copy, we own the SQLite handle.
    BundleReader(const BundleReader&) = delete;
    BundleReader& operator=(const BundleReader&) = delete;

    // Number of rows in the functions table.
    size_t function_count();

    // Code of a single function.
    std::vector<uint8_t> get_function(size_t idx);

    // All functions, in index order.
    Module read_module();
};

} // namespace kumo

#endif // BUNDLE_READER_HPP
