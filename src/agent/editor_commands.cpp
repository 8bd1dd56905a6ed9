#include "agent/command_handlers.h"

namespace scenelink {
namespace agent {
namespace commands {

namespace {

Json::Value stateResult(const editor::EditorApplication& app) {
  Json::Value out(Json::objectValue);
  out["state"] = rpc::toString(app.playModeState());
  return out;
}

}  // namespace

CommandResult editorGetPlayMode(CommandContext& ctx, const rpc::ParamMap&) {
  return stateResult(ctx.editor);
}

CommandResult editorPlay(CommandContext& ctx, const rpc::ParamMap&) {
  ctx.editor.play();
  return stateResult(ctx.editor);
}

CommandResult editorPause(CommandContext& ctx, const rpc::ParamMap&) {
  Json::Value out(Json::objectValue);
  out["paused"] = ctx.editor.togglePause();
  return out;
}

CommandResult editorStop(CommandContext& ctx, const rpc::ParamMap&) {
  ctx.editor.stop();
  return stateResult(ctx.editor);
}

CommandResult editorExecuteMenuItem(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string menu_path = param(params, "menuPath");
  if (menu_path.empty()) {
    return fail("menuPath is required");
  }
  Json::Value out(Json::objectValue);
  out["executed"] = ctx.editor.executeMenuItem(menu_path);
  out["menuPath"] = menu_path;
  return out;
}

CommandResult editorUndo(CommandContext& ctx, const rpc::ParamMap&) {
  const std::string name = ctx.undo().currentName();
  Json::Value out(Json::objectValue);
  out["undone"] = ctx.editor.undo();
  out["name"] = name;
  return out;
}

CommandResult editorRedo(CommandContext& ctx, const rpc::ParamMap&) {
  Json::Value out(Json::objectValue);
  out["redone"] = ctx.editor.redo();
  out["name"] = ctx.undo().currentName();
  return out;
}

CommandResult projectGetInfo(CommandContext& ctx, const rpc::ParamMap&) {
  Json::Value out(Json::objectValue);
  out["name"] = ctx.editor.productName();
  out["engineVersion"] = ctx.editor.engineVersion();
  out["platform"] = ctx.editor.platform();
  return out;
}

CommandResult projectRefresh(CommandContext& ctx, const rpc::ParamMap&) {
  ctx.editor.assets().refresh();
  return emptyResult();
}

}  // namespace commands
}  // namespace agent
}  // namespace scenelink
