#include <stdio.h>

#include <string>

#include "PluginInstaller.h"
#include "test_support.h"
#include "util/file_utils.h"

using namespace scenelink;

static std::string artifact(const std::string& version) {
  return "# SceneLink Agent plugin descriptor\n# Plugin version: " + version +
         "\n\n[agent]\nport = 0\n";
}

static void test_compare_versions() {
  TEST_ASSERT(PluginInstaller::compareVersions("1.2.0", "1.2.0") == 0);
  TEST_ASSERT(PluginInstaller::compareVersions("1.2", "1.2.0") == 0);
  TEST_ASSERT(PluginInstaller::compareVersions("1.10.0", "1.9.9") > 0);
  TEST_ASSERT(PluginInstaller::compareVersions("0.9", "1.0") < 0);
  TEST_ASSERT(PluginInstaller::compareVersions("2", "1.99.99") > 0);
  TEST_CASE_OK("compare_versions");
}

static void test_extract_version() {
  std::string version;
  TEST_ASSERT(PluginInstaller::extractVersion(artifact("1.4.2"), version));
  TEST_ASSERT_EQ_STR(version, "1.4.2");
  TEST_ASSERT(PluginInstaller::extractVersion("// Plugin version:   3.0\r\nrest", version));
  TEST_ASSERT_EQ_STR(version, "3.0");
  TEST_ASSERT(!PluginInstaller::extractVersion("[agent]\nport = 0\n", version));
  TEST_ASSERT(!PluginInstaller::extractVersion("Plugin version:\n", version));

  // The artifact embedded at build time carries a marker.
  PluginInstaller embedded;
  TEST_ASSERT(embedded.bundledVersion() != "0.0.0");
  TEST_CASE_OK("extract_version");
}

static void test_install_outcomes() {
  TempProject project;
  PluginInstaller installer(artifact("1.2.0"), "SceneLinkAgent.plugin");
  const std::string path = installer.installPath(project.root());
  TEST_ASSERT_EQ_STR(path, project.path("Assets/Editor/SceneLink/SceneLinkAgent.plugin"));

  TEST_ASSERT(installer.ensureInstalled(project.root()) == InstallResult::INSTALLED);
  std::string content;
  TEST_ASSERT(util::readFile(path, content));
  TEST_ASSERT_EQ_STR(content, artifact("1.2.0"));

  TEST_ASSERT(installer.ensureInstalled(project.root()) == InstallResult::UP_TO_DATE);

  TEST_ASSERT(util::writeFileAtomic(path, artifact("1.1.9")));
  TEST_ASSERT(installer.ensureInstalled(project.root()) == InstallResult::UPDATED);
  TEST_ASSERT(util::readFile(path, content));
  TEST_ASSERT_EQ_STR(content, artifact("1.2.0"));

  // A newer copy belongs to someone else; leave it.
  TEST_ASSERT(util::writeFileAtomic(path, artifact("1.3.0")));
  TEST_ASSERT(installer.ensureInstalled(project.root()) == InstallResult::SKIPPED_NEWER);
  TEST_ASSERT(util::readFile(path, content));
  TEST_ASSERT_EQ_STR(content, artifact("1.3.0"));

  // No marker reads as older.
  TEST_ASSERT(util::writeFileAtomic(path, "[agent]\nport = 0\n"));
  TEST_ASSERT(installer.ensureInstalled(project.root()) == InstallResult::UPDATED);

  TEST_ASSERT(installer.ensureInstalled(project.path("missing")) == InstallResult::FAILED);
  TEST_ASSERT_EQ_STR(toString(InstallResult::SKIPPED_NEWER), "newer copy present");
  TEST_CASE_OK("install_outcomes");
}

int main() {
  printf("test_plugin_installer\n");
  test_compare_versions();
  test_extract_version();
  test_install_outcomes();
  return 0;
}
