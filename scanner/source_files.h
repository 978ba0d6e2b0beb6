#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace CryptoAudit {

/// Walks root recursively and appends every regular file with a known source
/// extension. Hidden entries and `build`, `build-*` and `node_modules`
/// directories are skipped. Symbolic links to directories are not followed,
/// and each directory (by device and inode) is entered at most once, so
/// link loops cannot repeat the walk. Links to regular files are kept.
/// Returns the number of paths appended.
auto collectSourceFiles(const char* root, std::vector<std::string>& out) -> size_t;

/// Reads path into out. Fails with error set when the file cannot be opened
/// or read, or grows past max_size.
[[nodiscard]] auto readSourceFile(const char* path, size_t max_size, std::string& out,
                                  std::string& error) -> bool;

} // namespace CryptoAudit
