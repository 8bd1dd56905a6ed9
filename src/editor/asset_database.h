#ifndef SCENELINK_EDITOR_ASSET_DATABASE_H
#define SCENELINK_EDITOR_ASSET_DATABASE_H

#include <string>
#include <vector>

#include <json/json.h>

namespace scenelink {
namespace editor {

struct AssetEntry {
  std::string path;  // "Assets/Materials/Red.mat"
  std::string type;  // "Material"
};

/**
 * @brief Index of the files under <project>/Assets.
 *
 * Assets written through this class are indexed immediately; files dropped
 * into the folder from outside show up after refresh().
 */
class AssetDatabase {
 public:
  explicit AssetDatabase(const std::string& project_root);

  const std::string& projectRoot() const { return _root; }
  std::string absolutePath(const std::string& asset_path) const;

  // Rescans Assets/. Returns the number of indexed assets.
  size_t refresh();

  bool isValidFolder(const std::string& folder) const;
  bool createFolder(const std::string& folder);

  bool exists(const std::string& asset_path) const;
  // Writes a JSON asset (materials, prefabs, scenes) and indexes it.
  bool writeJson(const std::string& asset_path, const Json::Value& content);
  bool readJson(const std::string& asset_path, Json::Value& out) const;

  /**
   * @brief Search the index.
   *
   * The filter is a space-separated list of terms: "t:<Type>" restricts the
   * asset type, any other term must appear in the file name. Matching is
   * case-insensitive; an empty filter matches everything. Results are
   * sorted by path.
   */
  std::vector<std::string> find(const std::string& filter) const;

  const std::vector<AssetEntry>& entries() const { return _entries; }

  static std::string typeForPath(const std::string& asset_path);

 private:
  void _index(const std::string& asset_path);

  std::string _root;
  std::vector<AssetEntry> _entries;
};

}  // namespace editor
}  // namespace scenelink

#endif  // SCENELINK_EDITOR_ASSET_DATABASE_H
