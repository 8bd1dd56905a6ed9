#include "util/file_utils.h"

#include <dirent.h>
#include <errno.h>
#include <stdio.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace scenelink {
namespace util {

bool fileExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool directoryExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool readFile(const std::string& path, std::string& out) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return false;
  }
  out = buffer.str();
  return true;
}

bool writeFileAtomic(const std::string& path, const std::string& content) {
  const size_t slash = path.find_last_of('/');
  if (slash != std::string::npos && slash > 0) {
    if (!createDirectories(path.substr(0, slash))) {
      return false;
    }
  }
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      return false;
    }
    out << content;
    out.flush();
    if (!out) {
      (void)::unlink(tmp.c_str());
      return false;
    }
  }
  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    (void)::unlink(tmp.c_str());
    return false;
  }
  return true;
}

bool removeFile(const std::string& path) {
  return ::unlink(path.c_str()) == 0;
}

bool createDirectories(const std::string& path) {
  if (path.empty()) {
    return true;
  }
  if (directoryExists(path)) {
    return true;
  }
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find('/', pos + 1);
    const std::string partial = path.substr(0, pos);
    if (partial.empty() || directoryExists(partial)) {
      continue;
    }
    if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      return false;
    }
  }
  return directoryExists(path);
}

namespace {

void collectFiles(const std::string& root, const std::string& relative,
                  std::vector<std::string>& out) {
  const std::string dir_path = relative.empty() ? root : joinPath(root, relative);
  DIR* dir = ::opendir(dir_path.c_str());
  if (dir == nullptr) {
    return;
  }
  struct dirent* entry;
  while ((entry = ::readdir(dir)) != nullptr) {
    const std::string name(entry->d_name);
    if (name == "." || name == "..") {
      continue;
    }
    const std::string child = relative.empty() ? name : relative + "/" + name;
    const std::string full = joinPath(root, child);
    if (directoryExists(full)) {
      collectFiles(root, child, out);
    } else if (fileExists(full)) {
      out.push_back(child);
    }
  }
  (void)::closedir(dir);
}

}  // namespace

std::vector<std::string> listFilesRecursive(const std::string& root) {
  std::vector<std::string> files;
  collectFiles(root, std::string(), files);
  std::sort(files.begin(), files.end());
  return files;
}

std::string joinPath(const std::string& base, const std::string& relative) {
  if (base.empty()) {
    return relative;
  }
  if (relative.empty()) {
    return base;
  }
  if (base[base.size() - 1] == '/') {
    return base + relative;
  }
  return base + "/" + relative;
}

}  // namespace util
}  // namespace scenelink
