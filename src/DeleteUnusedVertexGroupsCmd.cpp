#include "DeleteUnusedVertexGroupsCmd.h"
#include "MayaScene.h"
#include "Operators.h"

#include <maya/MString.h>

const char* DeleteUnusedVertexGroupsCmd::kCommandName = "outfitDeleteUnusedVertexGroups";

DeleteUnusedVertexGroupsCmd::DeleteUnusedVertexGroupsCmd() {}
DeleteUnusedVertexGroupsCmd::~DeleteUnusedVertexGroupsCmd() {}

void* DeleteUnusedVertexGroupsCmd::creator() {
    return new DeleteUnusedVertexGroupsCmd();
}

MSyntax DeleteUnusedVertexGroupsCmd::newSyntax() {
    MSyntax syntax;
    return syntax;
}

MStatus DeleteUnusedVertexGroupsCmd::doIt(const MArgList& /*args*/) {
    MayaSceneHost host;
    SceneContext ctx = host.captureContext();

    OperationResult result;
    {
        UndoChunk chunk(kCommandName);
        result = Operators::executeDeleteUnusedVertexGroups(host, ctx);
    }

    setResult(MString(result.message.c_str()));
    return MayaScene::reportResult("DeleteUnusedVertexGroups", result) ? MS::kSuccess : MS::kFailure;
}
