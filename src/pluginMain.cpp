#include <maya/MFnPlugin.h>
#include <maya/MGlobal.h>
#include <maya/MObject.h>
#include <maya/MStatus.h>
#include <string>

#include "TransferVertexGroupsCmd.h"
#include "DeleteUnusedVertexGroupsCmd.h"
#include "DeleteUnusedBonesCmd.h"
#include "RigPollCmd.h"
#include "MayaScene.h"
#include "Operators.h"
#include "PluginLog.h"
#include "ToolOptions.h"

static const char* kPluginVersion = "1.0.0";
static const char* kMenuName = "OutfitRigPluginMenu";

struct MenuEntry {
    Operators::Action action;
    const char* item;       // menuItem name
    const char* command;
};

static const MenuEntry kMenuEntries[] = {
    { Operators::Action::TransferVertexGroups,     "outfitRigTransferItem",    "outfitTransferVertexGroups" },
    { Operators::Action::DeleteUnusedVertexGroups, "outfitRigDeleteGroupsItem", "outfitDeleteUnusedVertexGroups" },
    { Operators::Action::DeleteUnusedBones,        "outfitRigDeleteBonesItem",  "outfitDeleteUnusedBones" },
};

static void createMenu()
{
    // The post-menu proc re-polls every action each time the menu opens, so a
    // disabled item carries the reason as its annotation.
    std::string proc = "global proc outfitRigUpdateMenu()\n{\n    string $why;\n";
    for (const auto& entry : kMenuEntries) {
        proc += "    $why = `outfitRigPoll -action \"" + std::string(Operators::actionName(entry.action)) + "\"`;\n";
        proc += "    if ($why == \"\")\n";
        proc += "        menuItem -e -enable true -annotation \""
              + std::string(Operators::actionDescription(entry.action)) + "\" " + entry.item + ";\n";
        proc += "    else\n";
        proc += "        menuItem -e -enable false -annotation $why " + std::string(entry.item) + ";\n";
    }
    proc += "}\n";
    MGlobal::executeCommand(MString(proc.c_str()));

    std::string mel;
    mel += "if (`menu -exists " + std::string(kMenuName) + "`) deleteUI " + kMenuName + ";\n";
    mel += "global string $gMainWindow;\n";
    mel += "menu -parent $gMainWindow -tearOff true -label \"Outfit Rig\" -postMenuCommand \"outfitRigUpdateMenu\" "
         + std::string(kMenuName) + ";\n";
    for (const auto& entry : kMenuEntries) {
        if (entry.action == Operators::Action::DeleteUnusedBones) {
            mel += "menuItem -divider true;\n";
        }
        mel += "menuItem -label \"" + std::string(Operators::actionLabel(entry.action))
             + "\" -command \"" + entry.command
             + "\" -annotation \"" + Operators::actionDescription(entry.action)
             + "\" " + entry.item + ";\n";
    }
    MGlobal::executeCommand(MString(mel.c_str()));
}

static void deleteMenu()
{
    MString cmd;
    cmd += "if (`menu -exists " + MString(kMenuName) + "`) deleteUI " + MString(kMenuName) + ";";
    MGlobal::executeCommand(cmd);
}

PLUGIN_EXPORT MStatus initializePlugin(MObject obj)
{
    MStatus status;

    MFnPlugin plugin(obj, "OutfitRig", kPluginVersion, "Any", &status);
    CHECK_MSTATUS_AND_RETURN_IT(status);

    MayaScene::installScriptEditorSink();

    // Register outfitTransferVertexGroups command
    status = plugin.registerCommand(
        TransferVertexGroupsCmd::kCommandName,
        TransferVertexGroupsCmd::creator,
        TransferVertexGroupsCmd::newSyntax
    );
    if (!status) {
        PluginLog::error("Plugin", "Failed to register command: outfitTransferVertexGroups");
        return status;
    }

    // Register outfitDeleteUnusedVertexGroups command
    status = plugin.registerCommand(
        DeleteUnusedVertexGroupsCmd::kCommandName,
        DeleteUnusedVertexGroupsCmd::creator,
        DeleteUnusedVertexGroupsCmd::newSyntax
    );
    if (!status) {
        PluginLog::error("Plugin", "Failed to register command: outfitDeleteUnusedVertexGroups");
        return status;
    }

    // Register outfitDeleteUnusedBones command
    status = plugin.registerCommand(
        DeleteUnusedBonesCmd::kCommandName,
        DeleteUnusedBonesCmd::creator,
        DeleteUnusedBonesCmd::newSyntax
    );
    if (!status) {
        PluginLog::error("Plugin", "Failed to register command: outfitDeleteUnusedBones");
        return status;
    }

    // Register outfitRigPoll command
    status = plugin.registerCommand(
        RigPollCmd::kCommandName,
        RigPollCmd::creator,
        RigPollCmd::newSyntax
    );
    if (!status) {
        PluginLog::error("Plugin", "Failed to register command: outfitRigPoll");
        return status;
    }

    // Create menu
    createMenu();

    const ToolOptions options = ToolOptions::fromEnvironment();
    if (!PluginLog::init(options.resolveLogDir(MayaScene::userAppDir()))) {
        PluginLog::warn("Plugin", "Log file could not be opened; logging to the Script Editor only.");
    }
    PluginLog::logBlock("Environment", MayaScene::environmentRows());
    PluginLog::info("Plugin", std::string("OutfitRig v") + kPluginVersion + " loaded successfully.");
    PluginLog::info("Plugin", std::string("Build: ") + __DATE__ + " " + __TIME__);
    return MS::kSuccess;
}

PLUGIN_EXPORT MStatus uninitializePlugin(MObject obj)
{
    MStatus status;

    MFnPlugin plugin(obj);

    // Delete menu
    deleteMenu();

    status = plugin.deregisterCommand(TransferVertexGroupsCmd::kCommandName);
    if (!status) {
        PluginLog::error("Plugin", "Failed to deregister command: outfitTransferVertexGroups");
        return status;
    }

    status = plugin.deregisterCommand(DeleteUnusedVertexGroupsCmd::kCommandName);
    if (!status) {
        PluginLog::error("Plugin", "Failed to deregister command: outfitDeleteUnusedVertexGroups");
        return status;
    }

    status = plugin.deregisterCommand(DeleteUnusedBonesCmd::kCommandName);
    if (!status) {
        PluginLog::error("Plugin", "Failed to deregister command: outfitDeleteUnusedBones");
        return status;
    }

    status = plugin.deregisterCommand(RigPollCmd::kCommandName);
    if (!status) {
        PluginLog::error("Plugin", "Failed to deregister command: outfitRigPoll");
        return status;
    }

    PluginLog::info("Plugin", std::string("OutfitRig v") + kPluginVersion + " unloaded.");
    PluginLog::shutdown();
    PluginLog::setDisplaySink(nullptr);
    return MS::kSuccess;
}
