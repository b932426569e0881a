#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lru_cache {

bool read_file(const std::string &path, std::vector<std::uint8_t> *out,
               std::string *err = nullptr);

// Creates missing parent directories, writes `<path>.tmp`, fsyncs it and
// renames it over `path`. Readers never observe a partially written file.
// Returns false only if `path` still holds its old contents; a failed fsync
// of the directory after the rename is logged as a warning.
bool write_file_atomic(const std::string &path,
                       const std::vector<std::uint8_t> &data,
                       std::string *err = nullptr);

bool fsync_dir(const std::string &dir, std::string *err = nullptr);

} // namespace lru_cache
