/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#include "PluginInstaller.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <vector>

#include "plugin_artifact.h"
#include "util/file_utils.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace scenelink {

namespace {
constexpr const char* kVersionMarker = "Plugin version:";
constexpr const char* kInstallDirectory = "Assets/Editor/SceneLink";
}  // namespace

const char* toString(InstallResult result) {
  switch (result) {
    case InstallResult::INSTALLED:     return "installed";
    case InstallResult::UPDATED:       return "updated";
    case InstallResult::UP_TO_DATE:    return "up to date";
    case InstallResult::SKIPPED_NEWER: return "newer copy present";
    case InstallResult::FAILED:        return "failed";
  }
  return "unknown";
}

PluginInstaller::PluginInstaller()
    : _artifact(provisioning::kPluginArtifact),
      _file_name(provisioning::kPluginArtifactName) {
  if (!extractVersion(_artifact, _version)) {
    _version = "0.0.0";
  }
}

PluginInstaller::PluginInstaller(const std::string& artifact, const std::string& file_name)
    : _artifact(artifact), _file_name(file_name) {
  if (!extractVersion(_artifact, _version)) {
    _version = "0.0.0";
  }
}

std::string PluginInstaller::installPath(const std::string& project_root) const {
  return util::joinPath(util::joinPath(project_root, kInstallDirectory), _file_name);
}

InstallResult PluginInstaller::ensureInstalled(const std::string& project_root) const {
  if (!util::directoryExists(project_root)) {
    log::get()->warn("plugin provisioning skipped: {} is not a directory", project_root);
    return InstallResult::FAILED;
  }
  const std::string path = installPath(project_root);

  InstallResult result = InstallResult::INSTALLED;
  if (util::fileExists(path)) {
    std::string installed;
    std::string installed_version;
    if (util::readFile(path, installed) && extractVersion(installed, installed_version)) {
      const int order = compareVersions(installed_version, _version);
      if (order == 0) {
        return InstallResult::UP_TO_DATE;
      }
      if (order > 0) {
        log::get()->info("agent plugin {} is newer than bundled {}; leaving it", installed_version,
                         _version);
        return InstallResult::SKIPPED_NEWER;
      }
    }
    result = InstallResult::UPDATED;
  }

  if (!util::writeFileAtomic(path, _artifact)) {
    log::get()->warn("could not install agent plugin to {}: {}", path, strerror(errno));
    return InstallResult::FAILED;
  }
  log::get()->info("agent plugin {} {} at {}", _version, toString(result), path);
  return result;
}

bool PluginInstaller::extractVersion(const std::string& text, std::string& version) {
  const size_t marker = text.find(kVersionMarker);
  if (marker == std::string::npos) {
    return false;
  }
  size_t start = marker + strlen(kVersionMarker);
  size_t end = text.find_first_of("\r\n", start);
  if (end == std::string::npos) {
    end = text.size();
  }
  version = util::trim(text.substr(start, end - start));
  return !version.empty();
}

int PluginInstaller::compareVersions(const std::string& a, const std::string& b) {
  const std::vector<std::string> left = util::split(a, '.');
  const std::vector<std::string> right = util::split(b, '.');
  const size_t count = left.size() > right.size() ? left.size() : right.size();
  for (size_t i = 0; i < count; ++i) {
    const long l = i < left.size() ? strtol(left[i].c_str(), nullptr, 10) : 0;
    const long r = i < right.size() ? strtol(right[i].c_str(), nullptr, 10) : 0;
    if (l != r) {
      return l < r ? -1 : 1;
    }
  }
  return 0;
}

}  // namespace scenelink
