#include "scanner/source_files.h"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <set>
#include <utility>

#include "common/logging.h"
#include "scanner/parser.h"

namespace CryptoAudit {

namespace {

using DirectoryId = std::pair<dev_t, ino_t>;

auto skippedDirectory(const char* name) noexcept -> bool {
  return std::strcmp(name, "build") == 0 ||
         std::strcmp(name, "node_modules") == 0 ||
         std::strstr(name, "build-") == name;
}

void walk(const char* path, std::set<DirectoryId>& visited, std::vector<std::string>& out) {
  DIR* dir = opendir(path);
  if (!dir) {
    LOG_WARN("Cannot open directory: %s", path);
    return;
  }

  struct dirent* entry;
  while ((entry = readdir(dir)) != nullptr) {
    // Skip . and .. and hidden entries
    if (entry->d_name[0] == '.') continue;

    char full_path[4096];
    const int ret = snprintf(full_path, sizeof(full_path), "%s/%s", path, entry->d_name);
    if (ret < 0 || static_cast<size_t>(ret) >= sizeof(full_path)) {
      LOG_WARN("Path too long, skipping: %s/%s", path, entry->d_name);
      continue;
    }

    struct stat st;
    if (lstat(full_path, &st) != 0) continue;

    if (S_ISLNK(st.st_mode)) {
      struct stat target;
      if (stat(full_path, &target) != 0 || !S_ISREG(target.st_mode)) {
        LOG_DEBUG("Not following link: %s", full_path);
        continue;
      }
      st = target;
    }

    if (S_ISDIR(st.st_mode)) {
      if (skippedDirectory(entry->d_name)) {
        LOG_DEBUG("Skipping directory: %s", full_path);
        continue;
      }
      if (!visited.emplace(st.st_dev, st.st_ino).second) {
        LOG_DEBUG("Directory already walked: %s", full_path);
        continue;
      }
      walk(full_path, visited, out);
    } else if (S_ISREG(st.st_mode)) {
      if (Parser::languageFromExtension(entry->d_name) != Language::UNKNOWN) {
        out.emplace_back(full_path);
      }
    }
  }
  closedir(dir);
}

} // namespace

auto collectSourceFiles(const char* root, std::vector<std::string>& out) -> size_t {
  const size_t before = out.size();
  std::set<DirectoryId> visited;
  struct stat st;
  if (stat(root, &st) == 0) visited.emplace(st.st_dev, st.st_ino);
  walk(root, visited, out);
  LOG_INFO("Collected %zu source files under %s", out.size() - before, root);
  return out.size() - before;
}

auto readSourceFile(const char* path, size_t max_size, std::string& out, std::string& error) -> bool {
  const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    error = std::strerror(errno);
    return false;
  }

  struct stat st;
  if (::fstat(fd, &st) != 0) {
    error = std::strerror(errno);
    ::close(fd);
    return false;
  }
  if (static_cast<size_t>(st.st_size) > max_size) {
    error = "file exceeds max_input_size";
    ::close(fd);
    return false;
  }

  out.clear();
  out.reserve(static_cast<size_t>(st.st_size));
  char buffer[65536];
  while (true) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) continue;
      error = std::strerror(errno);
      ::close(fd);
      return false;
    }
    if (n == 0) break;
    out.append(buffer, static_cast<size_t>(n));
    if (out.size() > max_size) {
      error = "file exceeds max_input_size";
      ::close(fd);
      return false;
    }
  }
  ::close(fd);
  return true;
}

} // namespace CryptoAudit
