#include "DeleteUnusedBonesCmd.h"
#include "DeleteBonesDialog.h"
#include "MayaScene.h"
#include "Operators.h"
#include "PluginLog.h"
#include "ToolOptions.h"

#include <maya/MArgDatabase.h>
#include <maya/MGlobal.h>
#include <maya/MString.h>

const char* DeleteUnusedBonesCmd::kCommandName = "outfitDeleteUnusedBones";

static const char* kDuplicateFlag     = "-ds";
static const char* kDuplicateFlagLong = "-duplicateSkeleton";
static const char* kNoDialogFlag      = "-nd";
static const char* kNoDialogFlagLong  = "-noDialog";

static const char* kDuplicateOptionVar = "outfitRigDuplicateSkeleton";

DeleteUnusedBonesCmd::DeleteUnusedBonesCmd() {}
DeleteUnusedBonesCmd::~DeleteUnusedBonesCmd() {}

void* DeleteUnusedBonesCmd::creator() {
    return new DeleteUnusedBonesCmd();
}

MSyntax DeleteUnusedBonesCmd::newSyntax() {
    MSyntax syntax;
    syntax.addFlag(kDuplicateFlag, kDuplicateFlagLong, MSyntax::kBoolean);
    syntax.addFlag(kNoDialogFlag, kNoDialogFlagLong);
    return syntax;
}

MStatus DeleteUnusedBonesCmd::doIt(const MArgList& args) {
    MStatus status;
    MArgDatabase db(syntax(), args, &status);
    if (!status) return status;

    MayaSceneHost host;
    SceneContext ctx = host.captureContext();

    // Refuse before asking anything.
    if (auto reason = Operators::pollDeleteUnusedBones(ctx)) {
        PluginLog::error("DeleteUnusedBones", *reason);
        return MS::kFailure;
    }

    // Flag beats the remembered dialog choice, which beats the default.
    const ToolOptions defaults = ToolOptions::fromEnvironment();
    bool duplicate = MayaScene::optionVarBool(kDuplicateOptionVar, defaults.duplicateSkeleton);
    if (db.isFlagSet(kDuplicateFlag)) {
        db.getFlagArgument(kDuplicateFlag, 0, duplicate);
    }

    const bool interactive = MGlobal::mayaState() == MGlobal::kInteractive;
    if (!db.isFlagSet(kNoDialogFlag) && interactive) {
        if (!DeleteBonesDialog::ask(Operators::confirmDeleteUnusedBonesText(ctx), duplicate)) {
            PluginLog::info("DeleteUnusedBones", "Cancelled by user.");
            return MS::kSuccess;
        }
        MayaScene::setOptionVarBool(kDuplicateOptionVar, duplicate);

        // The dialog ran its own event loop; the scene may have changed.
        ctx = host.captureContext();
    }

    OperationResult result;
    {
        UndoChunk chunk(kCommandName);
        result = Operators::executeDeleteUnusedBones(host, ctx, duplicate);
    }

    setResult(MString(result.message.c_str()));
    return MayaScene::reportResult("DeleteUnusedBones", result) ? MS::kSuccess : MS::kFailure;
}
