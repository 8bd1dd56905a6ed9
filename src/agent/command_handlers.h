#ifndef SCENELINK_AGENT_COMMAND_HANDLERS_H
#define SCENELINK_AGENT_COMMAND_HANDLERS_H

#include "agent/command_context.h"

namespace scenelink {
namespace agent {
namespace commands {

// scene.*
CommandResult sceneGetActive(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult sceneGetHierarchy(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult sceneCreate(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult sceneSave(CommandContext& ctx, const rpc::ParamMap& params);

// gameObject.*
CommandResult gameObjectCreate(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult gameObjectCreatePrimitive(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult gameObjectFind(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult gameObjectDestroy(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult gameObjectSetActive(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult gameObjectSetTransform(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult gameObjectSetParent(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult gameObjectGetSelected(CommandContext& ctx, const rpc::ParamMap& params);

// component.*
CommandResult componentAdd(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult componentRemove(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult componentGetAll(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult componentSetProperty(CommandContext& ctx, const rpc::ParamMap& params);

// prefab.*
CommandResult prefabCreate(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult prefabInstantiate(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult prefabGetAll(CommandContext& ctx, const rpc::ParamMap& params);

// asset.*
CommandResult assetCreate(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult assetFind(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult assetImport(CommandContext& ctx, const rpc::ParamMap& params);

// editor.* and project.*
CommandResult editorGetPlayMode(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult editorPlay(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult editorPause(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult editorStop(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult editorExecuteMenuItem(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult editorUndo(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult editorRedo(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult projectGetInfo(CommandContext& ctx, const rpc::ParamMap& params);
CommandResult projectRefresh(CommandContext& ctx, const rpc::ParamMap& params);

}  // namespace commands
}  // namespace agent
}  // namespace scenelink

#endif  // SCENELINK_AGENT_COMMAND_HANDLERS_H
