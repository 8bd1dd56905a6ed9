/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#ifndef SCENELINK_PLUGIN_INSTALLER_H
#define SCENELINK_PLUGIN_INSTALLER_H

#include <stdint.h>

#include <string>

namespace scenelink {

enum class InstallResult : uint8_t {
  INSTALLED,      // no copy was present
  UPDATED,        // an older copy was overwritten
  UP_TO_DATE,     // installed copy has the same version
  SKIPPED_NEWER,  // installed copy is newer; left alone
  FAILED
};

const char* toString(InstallResult result);

/**
 * @brief Provisions the Agent artifact into a target project.
 *
 * The artifact text carries a "Plugin version: X.Y.Z" marker. An installed
 * copy without a readable marker is treated as older and replaced.
 */
class PluginInstaller {
 public:
  // Uses the artifact embedded at build time.
  PluginInstaller();
  PluginInstaller(const std::string& artifact, const std::string& file_name);

  InstallResult ensureInstalled(const std::string& project_root) const;

  std::string installPath(const std::string& project_root) const;
  const std::string& bundledVersion() const { return _version; }

  static bool extractVersion(const std::string& text, std::string& version);

  // <0, 0, >0 like strcmp; missing components count as 0.
  static int compareVersions(const std::string& a, const std::string& b);

 private:
  std::string _artifact;
  std::string _file_name;
  std::string _version;
};

}  // namespace scenelink

#endif  // SCENELINK_PLUGIN_INSTALLER_H
