#ifndef SCENELINK_FILE_UTILS_H
#define SCENELINK_FILE_UTILS_H

#include <string>
#include <vector>

namespace scenelink {
namespace util {

// Thin POSIX helpers shared by the discovery record, the asset database and
// plugin provisioning. All of them report failure by return value and leave
// errno set for the caller to log.

bool fileExists(const std::string& path);
bool directoryExists(const std::string& path);
bool readFile(const std::string& path, std::string& out);

// Writes to "<path>.tmp" and renames over the target. Parent directories are
// created as needed.
bool writeFileAtomic(const std::string& path, const std::string& content);

bool removeFile(const std::string& path);

// mkdir -p. Returns true if the directory exists afterwards.
bool createDirectories(const std::string& path);

// Regular files below root, as paths relative to root, sorted.
std::vector<std::string> listFilesRecursive(const std::string& root);

std::string joinPath(const std::string& base, const std::string& relative);

}  // namespace util
}  // namespace scenelink

#endif  // SCENELINK_FILE_UTILS_H
