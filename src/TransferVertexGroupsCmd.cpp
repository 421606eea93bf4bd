#include "TransferVertexGroupsCmd.h"
#include "MayaScene.h"
#include "Operators.h"
#include "PluginLog.h"

#include <maya/MGlobal.h>
#include <maya/MString.h>

#include <string>

const char* TransferVertexGroupsCmd::kCommandName = "outfitTransferVertexGroups";

TransferVertexGroupsCmd::TransferVertexGroupsCmd() {}
TransferVertexGroupsCmd::~TransferVertexGroupsCmd() {}

void* TransferVertexGroupsCmd::creator() {
    return new TransferVertexGroupsCmd();
}

MSyntax TransferVertexGroupsCmd::newSyntax() {
    MSyntax syntax;
    return syntax;
}

MStatus TransferVertexGroupsCmd::doIt(const MArgList& /*args*/) {
    MayaSceneHost host;
    SceneContext ctx = host.captureContext();

    PluginLog::info("TransferVertexGroups", "doIt: " + std::to_string(ctx.selected.size())
                    + " object(s) selected");

    OperationResult result;
    {
        UndoChunk chunk(kCommandName);
        result = Operators::executeTransferVertexGroups(host, ctx);
    }

    setResult(MString(result.message.c_str()));
    return MayaScene::reportResult("TransferVertexGroups", result) ? MS::kSuccess : MS::kFailure;
}
