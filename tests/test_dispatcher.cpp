#include <stdio.h>

#include <string>
#include <vector>

#include "agent/command_dispatcher.h"
#include "editor/editor_application.h"
#include "protocol/bridge_message.h"
#include "test_support.h"
#include "util/file_utils.h"

using namespace scenelink;

static rpc::Response call(agent::CommandDispatcher& dispatcher, const std::string& category,
                          const std::string& action,
                          const rpc::ParamMap& params = rpc::ParamMap()) {
  rpc::Request request;
  request.id = "req-" + category + "." + action;
  request.category = category;
  request.action = action;
  request.params = params;
  rpc::Response response = dispatcher.dispatch(request);
  TEST_ASSERT_EQ_STR(response.id, request.id);
  return response;
}

static void test_command_table() {
  TempProject project;
  editor::EditorApplication app(project.root());
  agent::CommandDispatcher dispatcher(app);

  size_t count = 0;
  agent::CommandDispatcher::table(count);
  TEST_ASSERT_EQ_UINT(count, 31);
  TEST_ASSERT_EQ_UINT(dispatcher.keys().size(), count);
  TEST_ASSERT(dispatcher.has("scene.getHierarchy"));
  TEST_ASSERT(dispatcher.has("gameObject.setParent"));
  TEST_ASSERT(dispatcher.has("project.refresh"));
  TEST_ASSERT(!dispatcher.has("scene"));
  TEST_ASSERT(!dispatcher.has("scene.delete"));

  rpc::Response response = call(dispatcher, "x", "y");
  TEST_ASSERT(!response.success);
  TEST_ASSERT_EQ_STR(response.error, "Unknown command: x.y");
  TEST_CASE_OK("command_table");
}

static void test_create_primitive_and_transform() {
  TempProject project;
  editor::EditorApplication app(project.root());
  agent::CommandDispatcher dispatcher(app);

  rpc::Response created =
      call(dispatcher, "gameObject", "createPrimitive", {{"primitiveType", "Capsule"}, {"name", "Player"}});
  TEST_ASSERT(created.success);
  TEST_ASSERT_EQ_STR(created.result["name"].asString(), "Player");
  TEST_ASSERT(created.result["instanceId"].isIntegral());
  TEST_ASSERT(app.activeScene().isDirty());

  rpc::Response moved = call(dispatcher, "gameObject", "setTransform",
                             {{"gameObjectPath", "Player"}, {"position", "[0,1,0]"},
                              {"rotation", "0,90,0"}});
  TEST_ASSERT(moved.success);
  TEST_ASSERT_NEAR(moved.result["position"][1].asDouble(), 1.0, 1e-6);
  TEST_ASSERT_NEAR(moved.result["rotation"][1].asDouble(), 90.0, 0.01);
  TEST_ASSERT_NEAR(moved.result["scale"][0].asDouble(), 1.0, 1e-6);

  rpc::Response all = call(dispatcher, "component", "getAll", {{"gameObjectPath", "Player"}});
  TEST_ASSERT(all.success);
  const Json::Value& components = all.result["components"];
  TEST_ASSERT_EQ_UINT(components.size(), 4);
  TEST_ASSERT_EQ_STR(components[0u]["type"].asString(), "Transform");
  TEST_ASSERT_EQ_STR(components[1u]["type"].asString(), "MeshFilter");
  TEST_ASSERT_EQ_STR(components[2u]["type"].asString(), "MeshRenderer");
  TEST_ASSERT_EQ_STR(components[3u]["type"].asString(), "CapsuleCollider");
  TEST_ASSERT_EQ_STR(components[1u]["properties"]["m_Mesh"].asString(), "Capsule");
  TEST_ASSERT_NEAR(components[3u]["properties"]["height"].asDouble(), 2.0, 1e-6);

  rpc::Response bad = call(dispatcher, "gameObject", "createPrimitive", {{"primitiveType", "Torus"}});
  TEST_ASSERT(!bad.success);
  TEST_ASSERT(bad.error.find("Unknown primitive type: Torus") == 0);

  rpc::Response half = call(dispatcher, "gameObject", "setTransform",
                            {{"gameObjectPath", "Player"}, {"position", "1,2"}});
  TEST_ASSERT(!half.success);
  TEST_ASSERT_EQ_STR(half.error, "Cannot convert '1,2' to Vector3 for position");
  TEST_ASSERT_NEAR(app.activeScene().find("Player")->localPosition().y, 1.0, 1e-6);
  TEST_CASE_OK("create_primitive_and_transform");
}

static void test_find_parent_and_hierarchy() {
  TempProject project;
  editor::EditorApplication app(project.root());
  agent::CommandDispatcher dispatcher(app);

  TEST_ASSERT(call(dispatcher, "gameObject", "create", {{"name", "Rig"}}).success);
  TEST_ASSERT(call(dispatcher, "gameObject", "create", {{"name", "Arm"}, {"parentPath", "Rig"}}).success);

  rpc::Response found = call(dispatcher, "gameObject", "find", {{"gameObjectPath", "Rig/Arm"}});
  TEST_ASSERT(found.success);
  TEST_ASSERT_EQ_STR(found.result["path"].asString(), "Rig/Arm");
  TEST_ASSERT(found.result["active"].asBool());

  rpc::Response missing = call(dispatcher, "gameObject", "find", {{"name", "Ghost"}});
  TEST_ASSERT(!missing.success);
  TEST_ASSERT_EQ_STR(missing.error, "GameObject not found: Ghost");

  rpc::Response orphan = call(dispatcher, "gameObject", "create", {{"name", "X"}, {"parentPath", "Nope"}});
  TEST_ASSERT(!orphan.success);
  TEST_ASSERT_EQ_STR(orphan.error, "Parent not found: Nope");

  rpc::Response cycle = call(dispatcher, "gameObject", "setParent",
                             {{"gameObjectPath", "Rig"}, {"parentPath", "Rig/Arm"}});
  TEST_ASSERT(!cycle.success);

  rpc::Response moved = call(dispatcher, "gameObject", "setParent", {{"gameObjectPath", "Rig/Arm"}});
  TEST_ASSERT(moved.success);
  TEST_ASSERT_EQ_STR(moved.result["path"].asString(), "Arm");

  rpc::Response inactive = call(dispatcher, "gameObject", "setActive",
                                {{"gameObjectPath", "Arm"}, {"active", "false"}});
  TEST_ASSERT(inactive.success);
  TEST_ASSERT(!inactive.result["active"].asBool());
  rpc::Response vague = call(dispatcher, "gameObject", "setActive",
                             {{"gameObjectPath", "Arm"}, {"active", "maybe"}});
  TEST_ASSERT(!vague.success);

  rpc::Response hierarchy = call(dispatcher, "scene", "getHierarchy");
  TEST_ASSERT(hierarchy.success);
  TEST_ASSERT_EQ_STR(hierarchy.result["scene"].asString(), "Untitled");
  TEST_ASSERT_EQ_UINT(hierarchy.result["hierarchy"].size(), 4);
  TEST_ASSERT_EQ_STR(hierarchy.result["hierarchy"][3u]["name"].asString(), "Arm");
  TEST_ASSERT(!hierarchy.result["hierarchy"][3u]["active"].asBool());

  rpc::Response selected = call(dispatcher, "gameObject", "getSelected");
  TEST_ASSERT(selected.success);
  TEST_ASSERT_EQ_UINT(selected.result["selected"].size(), 1);
  TEST_ASSERT_EQ_STR(selected.result["selected"][0u].asString(), "Arm");

  TEST_ASSERT(call(dispatcher, "gameObject", "destroy", {{"gameObjectPath", "Rig"}}).success);
  TEST_ASSERT(app.activeScene().find("Rig") == nullptr);
  TEST_CASE_OK("find_parent_and_hierarchy");
}

static void test_component_properties() {
  TempProject project;
  editor::EditorApplication app(project.root());
  agent::CommandDispatcher dispatcher(app);
  TEST_ASSERT(call(dispatcher, "gameObject", "create", {{"name", "Crate"}}).success);

  rpc::Response absent = call(dispatcher, "component", "setProperty",
                              {{"gameObjectPath", "Crate"}, {"componentType", "Rigidbody"},
                               {"propertyName", "mass"}, {"value", "2"}});
  TEST_ASSERT(!absent.success);
  TEST_ASSERT_EQ_STR(absent.error, "Component not found: Rigidbody on Crate");

  rpc::Response added = call(dispatcher, "component", "add",
                             {{"gameObjectPath", "Crate"}, {"componentType", "Engine.Physics.Rigidbody"}});
  TEST_ASSERT(added.success);
  TEST_ASSERT_EQ_STR(added.result["component"].asString(), "Rigidbody");

  rpc::Response twice = call(dispatcher, "component", "add",
                             {{"gameObjectPath", "Crate"}, {"componentType", "Rigidbody"}});
  TEST_ASSERT(!twice.success);
  TEST_ASSERT_EQ_STR(twice.error, "Component Rigidbody already present on Crate");

  rpc::Response unknown = call(dispatcher, "component", "add",
                               {{"gameObjectPath", "Crate"}, {"componentType", "Warp"}});
  TEST_ASSERT_EQ_STR(unknown.error, "Component type not found: Warp");

  // Reflected alias of a serialized field.
  rpc::Response mass = call(dispatcher, "component", "setProperty",
                            {{"gameObjectPath", "Crate"}, {"componentType", "Rigidbody"},
                             {"propertyName", "mass"}, {"value", "2.5"}});
  TEST_ASSERT(mass.success);
  TEST_ASSERT_EQ_STR(mass.result["property"].asString(), "mass");
  TEST_ASSERT(mass.result["set"].asBool());

  // Serialized field by name, enum by label.
  rpc::Response mode = call(dispatcher, "component", "setProperty",
                            {{"gameObjectPath", "Crate"}, {"componentType", "Rigidbody"},
                             {"propertyName", "m_Interpolate"}, {"value", "Extrapolate"}});
  TEST_ASSERT(mode.success);

  rpc::Response wrong = call(dispatcher, "component", "setProperty",
                             {{"gameObjectPath", "Crate"}, {"componentType", "Rigidbody"},
                              {"propertyName", "isKinematic"}, {"value", "maybe"}});
  TEST_ASSERT(!wrong.success);
  TEST_ASSERT_EQ_STR(wrong.error, "Cannot convert 'maybe' to Boolean for isKinematic");

  rpc::Response nowhere = call(dispatcher, "component", "setProperty",
                               {{"gameObjectPath", "Crate"}, {"componentType", "Rigidbody"},
                                {"propertyName", "warpFactor"}, {"value", "9"}});
  TEST_ASSERT_EQ_STR(nowhere.error, "Property not found: warpFactor on Rigidbody");

  rpc::Response all = call(dispatcher, "component", "getAll", {{"gameObjectPath", "Crate"}});
  const Json::Value& body = all.result["components"][1u];
  TEST_ASSERT_EQ_STR(body["type"].asString(), "Rigidbody");
  TEST_ASSERT(body["enabled"].asBool());
  TEST_ASSERT_NEAR(body["properties"]["m_Mass"].asDouble(), 2.5, 1e-6);
  TEST_ASSERT_NEAR(body["properties"]["mass"].asDouble(), 2.5, 1e-6);
  TEST_ASSERT_EQ_STR(body["properties"]["m_Interpolate"].asString(), "Extrapolate");

  rpc::Response transform = call(dispatcher, "component", "remove",
                                 {{"gameObjectPath", "Crate"}, {"componentType", "Transform"}});
  TEST_ASSERT(!transform.success);
  TEST_ASSERT(call(dispatcher, "component", "remove",
                   {{"gameObjectPath", "Crate"}, {"componentType", "Rigidbody"}}).success);
  TEST_ASSERT_EQ_UINT(app.activeScene().find("Crate")->components().size(), 1);
  TEST_CASE_OK("component_properties");
}

static void test_undo_and_redo_commands() {
  TempProject project;
  editor::EditorApplication app(project.root());
  agent::CommandDispatcher dispatcher(app);

  TEST_ASSERT(call(dispatcher, "gameObject", "createPrimitive",
                   {{"primitiveType", "Sphere"}, {"name", "Ball"}}).success);
  TEST_ASSERT(call(dispatcher, "gameObject", "setTransform",
                   {{"gameObjectPath", "Ball"}, {"position", "5,0,0"}}).success);

  rpc::Response undone = call(dispatcher, "editor", "undo");
  TEST_ASSERT(undone.result["undone"].asBool());
  TEST_ASSERT_EQ_STR(undone.result["name"].asString(), "Set Transform");
  TEST_ASSERT_NEAR(app.activeScene().find("Ball")->localPosition().x, 0.0, 1e-6);

  undone = call(dispatcher, "editor", "undo");
  TEST_ASSERT(undone.result["undone"].asBool());
  TEST_ASSERT_EQ_STR(undone.result["name"].asString(), "Create Ball");
  TEST_ASSERT(app.activeScene().find("Ball") == nullptr);

  rpc::Response redone = call(dispatcher, "editor", "redo");
  TEST_ASSERT(redone.result["redone"].asBool());
  TEST_ASSERT(app.activeScene().find("Ball") != nullptr);

  call(dispatcher, "editor", "undo");
  TEST_ASSERT(!call(dispatcher, "editor", "undo").result["undone"].asBool());
  TEST_CASE_OK("undo_and_redo_commands");
}

static void test_prefab_round_trip() {
  TempProject project;
  editor::EditorApplication app(project.root());
  agent::CommandDispatcher dispatcher(app);
  TEST_ASSERT(call(dispatcher, "gameObject", "createPrimitive",
                   {{"primitiveType", "Cube"}, {"name", "Crate"}}).success);

  rpc::Response bad_path = call(dispatcher, "prefab", "create",
                                {{"gameObjectPath", "Crate"}, {"assetPath", "Assets/Crate.txt"}});
  TEST_ASSERT(!bad_path.success);

  rpc::Response created = call(dispatcher, "prefab", "create", {{"gameObjectPath", "Crate"}});
  TEST_ASSERT(created.success);
  TEST_ASSERT_EQ_STR(created.result["path"].asString(), "Assets/Prefabs/Crate.prefab");
  TEST_ASSERT(util::fileExists(project.path("Assets/Prefabs/Crate.prefab")));

  rpc::Response listed = call(dispatcher, "prefab", "getAll");
  TEST_ASSERT_EQ_UINT(listed.result["prefabs"].size(), 1);

  const editor::GameObject* source = app.activeScene().find("Crate");
  rpc::Response instance = call(dispatcher, "prefab", "instantiate",
                                {{"prefabPath", "Assets/Prefabs/Crate.prefab"}});
  TEST_ASSERT(instance.success);
  TEST_ASSERT_EQ_STR(instance.result["name"].asString(), "Crate");
  TEST_ASSERT(instance.result["instanceId"].asInt() != source->instanceId());
  TEST_ASSERT_EQ_UINT(app.activeScene().rootCount(), 4);

  rpc::Response missing = call(dispatcher, "prefab", "instantiate",
                               {{"prefabPath", "Assets/Prefabs/None.prefab"}});
  TEST_ASSERT_EQ_STR(missing.error, "Prefab not found at: Assets/Prefabs/None.prefab");
  TEST_CASE_OK("prefab_round_trip");
}

static void test_asset_commands() {
  TempProject project;
  editor::EditorApplication app(project.root());
  agent::CommandDispatcher dispatcher(app);

  rpc::Response created = call(dispatcher, "asset", "create",
                               {{"assetType", "Material"}, {"path", "Assets/Materials/Red.mat"}});
  TEST_ASSERT(created.success);
  TEST_ASSERT(call(dispatcher, "asset", "create",
                   {{"assetType", "PhysicMaterial"}, {"path", "Assets/Ice.physicmaterial"}}).success);

  rpc::Response unsupported = call(dispatcher, "asset", "create",
                                   {{"assetType", "Shader"}, {"path", "Assets/A.shader"}});
  TEST_ASSERT(!unsupported.success);
  TEST_ASSERT(call(dispatcher, "asset", "create", {{"assetType", "Material"}}).error ==
              "path is required");

  rpc::Response found = call(dispatcher, "asset", "find", {{"filter", "t:Material red"}});
  TEST_ASSERT_EQ_UINT(found.result["total"].asUInt(), 1);
  TEST_ASSERT_EQ_STR(found.result["assets"][0u].asString(), "Assets/Materials/Red.mat");

  // Files dropped in behind the editor's back appear after an import.
  TEST_ASSERT(util::writeFileAtomic(project.path("Assets/Notes.txt"), "hello\n"));
  TEST_ASSERT_EQ_UINT(call(dispatcher, "asset", "find", {{"filter", "Notes"}}).result["total"].asUInt(), 0);
  TEST_ASSERT(call(dispatcher, "asset", "import").success);
  TEST_ASSERT_EQ_UINT(call(dispatcher, "asset", "find", {{"filter", "Notes"}}).result["total"].asUInt(), 1);
  TEST_CASE_OK("asset_commands");
}

static void test_play_mode_and_menu() {
  TempProject project;
  editor::EditorApplication app(project.root());
  agent::CommandDispatcher dispatcher(app);

  TEST_ASSERT_EQ_STR(call(dispatcher, "editor", "getPlayMode").result["state"].asString(), "stopped");
  TEST_ASSERT_EQ_STR(call(dispatcher, "editor", "play").result["state"].asString(), "playing");
  TEST_ASSERT(call(dispatcher, "editor", "pause").result["paused"].asBool());
  TEST_ASSERT_EQ_STR(call(dispatcher, "editor", "getPlayMode").result["state"].asString(), "paused");
  TEST_ASSERT_EQ_STR(call(dispatcher, "editor", "stop").result["state"].asString(), "stopped");

  rpc::Response menu = call(dispatcher, "editor", "executeMenuItem",
                            {{"menuPath", "GameObject/Create Empty"}});
  TEST_ASSERT(menu.success);
  TEST_ASSERT(menu.result["executed"].asBool());
  TEST_ASSERT(app.activeScene().find("GameObject") != nullptr);

  rpc::Response nothing = call(dispatcher, "editor", "executeMenuItem", {{"menuPath", "No/Such"}});
  TEST_ASSERT(nothing.success);
  TEST_ASSERT(!nothing.result["executed"].asBool());
  TEST_ASSERT(!call(dispatcher, "editor", "executeMenuItem").success);
  TEST_CASE_OK("play_mode_and_menu");
}

static void test_scene_and_project() {
  TempProject project;
  editor::EditorApplication app(project.root());
  agent::CommandDispatcher dispatcher(app);

  rpc::Response active = call(dispatcher, "scene", "getActive");
  TEST_ASSERT_EQ_STR(active.result["name"].asString(), "Untitled");
  TEST_ASSERT_EQ_UINT(active.result["rootCount"].asUInt(), 2);
  TEST_ASSERT(!active.result["isDirty"].asBool());

  rpc::Response created = call(dispatcher, "scene", "create",
                               {{"name", "Level1"}, {"path", "Assets/Scenes/Level1.scene"}});
  TEST_ASSERT(created.success);
  TEST_ASSERT_EQ_STR(created.result["name"].asString(), "Level1");
  TEST_ASSERT(util::fileExists(project.path("Assets/Scenes/Level1.scene")));

  TEST_ASSERT(call(dispatcher, "gameObject", "create", {{"name", "Spawn"}}).success);
  rpc::Response saved = call(dispatcher, "scene", "save");
  TEST_ASSERT(saved.success);
  TEST_ASSERT_EQ_STR(saved.result["path"].asString(), "Assets/Scenes/Level1.scene");
  TEST_ASSERT(!app.activeScene().isDirty());

  rpc::Response info = call(dispatcher, "project", "getInfo");
  TEST_ASSERT(info.success);
  TEST_ASSERT(!info.result["name"].asString().empty());
  TEST_ASSERT(!info.result["engineVersion"].asString().empty());
  TEST_ASSERT(call(dispatcher, "project", "refresh").success);
  TEST_CASE_OK("scene_and_project");
}

int main() {
  printf("test_dispatcher\n");
  test_command_table();
  test_create_primitive_and_transform();
  test_find_parent_and_hierarchy();
  test_component_properties();
  test_undo_and_redo_commands();
  test_prefab_round_trip();
  test_asset_commands();
  test_play_mode_and_menu();
  test_scene_and_project();
  return 0;
}
