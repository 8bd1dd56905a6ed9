/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#ifndef SCENELINK_H
#define SCENELINK_H

#include "BridgeAgent.h"
#include "BridgeController.h"
#include "PluginInstaller.h"
#include "editor/editor_application.h"
#include "protocol/bridge_message.h"
#include "protocol/bridge_protocol.h"
#include "util/clock.h"
#include "util/log.h"

#endif  // SCENELINK_H
