#include "editor/asset_database.h"

#include <algorithm>
#include <memory>
#include <sstream>

#include "util/file_utils.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace scenelink {
namespace editor {

namespace {

constexpr const char* kAssetsFolder = "Assets";

struct ExtensionType {
  const char* extension;
  const char* type;
};

const ExtensionType kExtensionTypes[] = {
  {".prefab", "Prefab"},
  {".mat", "Material"},
  {".physicmaterial", "PhysicMaterial"},
  {".scene", "Scene"},
  {".cs", "Script"},
  {".cpp", "Script"},
  {".png", "Texture2D"},
  {".jpg", "Texture2D"},
  {".tga", "Texture2D"},
  {".wav", "AudioClip"},
  {".ogg", "AudioClip"},
  {".mp3", "AudioClip"},
  {".fbx", "Mesh"},
  {".obj", "Mesh"},
  {".anim", "AnimationClip"},
  {".controller", "AnimatorController"},
  {".shader", "Shader"},
  {".txt", "TextAsset"},
  {".json", "TextAsset"},
  {".plugin", "PluginDescriptor"},
};

bool isBookkeeping(const std::string& path) {
  return util::endsWith(path, ".tmp") || util::endsWith(path, ".meta");
}

bool matchesFilter(const AssetEntry& entry, const std::vector<std::string>& terms) {
  const std::string stem = util::toLower(util::fileStem(entry.path));
  for (const std::string& term : terms) {
    if (term.empty()) {
      continue;
    }
    if (util::startsWith(term, "t:")) {
      if (!util::equalsIgnoreCase(term.substr(2), entry.type)) {
        return false;
      }
    } else if (stem.find(util::toLower(term)) == std::string::npos) {
      return false;
    }
  }
  return true;
}

}  // namespace

AssetDatabase::AssetDatabase(const std::string& project_root) : _root(project_root) {
  refresh();
}

std::string AssetDatabase::absolutePath(const std::string& asset_path) const {
  return util::joinPath(_root, asset_path);
}

size_t AssetDatabase::refresh() {
  _entries.clear();
  for (const std::string& relative : util::listFilesRecursive(absolutePath(kAssetsFolder))) {
    const std::string path = std::string(kAssetsFolder) + "/" + relative;
    if (!isBookkeeping(path)) {
      _entries.push_back(AssetEntry{path, typeForPath(path)});
    }
  }
  log::get()->debug("assets: indexed {} files", _entries.size());
  return _entries.size();
}

bool AssetDatabase::isValidFolder(const std::string& folder) const {
  return util::directoryExists(absolutePath(folder));
}

bool AssetDatabase::createFolder(const std::string& folder) {
  if (!util::createDirectories(absolutePath(folder))) {
    log::get()->error("assets: cannot create folder {}", folder);
    return false;
  }
  return true;
}

bool AssetDatabase::exists(const std::string& asset_path) const {
  for (const AssetEntry& entry : _entries) {
    if (entry.path == asset_path) {
      return true;
    }
  }
  return false;
}

bool AssetDatabase::writeJson(const std::string& asset_path, const Json::Value& content) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  const std::string text = Json::writeString(builder, content);
  if (!util::writeFileAtomic(absolutePath(asset_path), text + "\n")) {
    log::get()->error("assets: cannot write {}", asset_path);
    return false;
  }
  _index(asset_path);
  return true;
}

bool AssetDatabase::readJson(const std::string& asset_path, Json::Value& out) const {
  std::string text;
  if (!util::readFile(absolutePath(asset_path), text)) {
    return false;
  }
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &out, &errors)) {
    log::get()->warn("assets: {} is not valid JSON: {}", asset_path, errors);
    return false;
  }
  return true;
}

std::vector<std::string> AssetDatabase::find(const std::string& filter) const {
  std::vector<std::string> terms;
  std::istringstream in(filter);
  std::string term;
  while (in >> term) {
    terms.push_back(term);
  }
  std::vector<std::string> out;
  for (const AssetEntry& entry : _entries) {
    if (matchesFilter(entry, terms)) {
      out.push_back(entry.path);
    }
  }
  return out;
}

std::string AssetDatabase::typeForPath(const std::string& asset_path) {
  const std::string lower = util::toLower(asset_path);
  for (const ExtensionType& mapping : kExtensionTypes) {
    if (util::endsWith(lower, mapping.extension)) {
      return mapping.type;
    }
  }
  return "DefaultAsset";
}

void AssetDatabase::_index(const std::string& asset_path) {
  if (exists(asset_path)) {
    return;
  }
  AssetEntry entry{asset_path, typeForPath(asset_path)};
  auto pos = std::lower_bound(_entries.begin(), _entries.end(), entry,
                              [](const AssetEntry& a, const AssetEntry& b) { return a.path < b.path; });
  _entries.insert(pos, entry);
}

}  // namespace editor
}  // namespace scenelink
