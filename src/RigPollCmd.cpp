#include "RigPollCmd.h"
#include "MayaScene.h"
#include "Operators.h"

#include <maya/MArgDatabase.h>
#include <maya/MGlobal.h>
#include <maya/MString.h>

const char* RigPollCmd::kCommandName = "outfitRigPoll";

static const char* kActionFlag     = "-a";
static const char* kActionFlagLong = "-action";

RigPollCmd::RigPollCmd() {}
RigPollCmd::~RigPollCmd() {}

void* RigPollCmd::creator() {
    return new RigPollCmd();
}

MSyntax RigPollCmd::newSyntax() {
    MSyntax syntax;
    syntax.addFlag(kActionFlag, kActionFlagLong, MSyntax::kString);
    return syntax;
}

// Returns "" when the action can run, otherwise the reason it cannot. The
// menu uses the reason as the disabled item's annotation.
MStatus RigPollCmd::doIt(const MArgList& args) {
    MStatus status;
    MArgDatabase db(syntax(), args, &status);
    if (!status) return status;

    if (!db.isFlagSet(kActionFlag)) {
        MGlobal::displayError("outfitRigPoll: -action is required");
        return MS::kInvalidParameter;
    }

    MString actionName;
    db.getFlagArgument(kActionFlag, 0, actionName);

    Operators::Action action;
    if (!Operators::actionFromName(actionName.asChar(), action)) {
        MGlobal::displayError(MString("outfitRigPoll: unknown action '") + actionName + "'");
        return MS::kInvalidParameter;
    }

    MayaSceneHost host;
    SceneContext ctx = host.captureContext();
    std::optional<std::string> reason = Operators::poll(action, ctx);

    setResult(MString(reason ? reason->c_str() : ""));
    return MS::kSuccess;
}
