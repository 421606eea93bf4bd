#pragma once
#ifndef BONEDELETEWORKFLOW_H
#define BONEDELETEWORKFLOW_H

#include "OperationResult.h"
#include "SceneModel.h"

#include <optional>
#include <set>
#include <string>

struct BoneDeleteResult {
    OperationResult result;
    int deleted = 0;
    bool duplicated = false;
    std::string skeletonName;   // skeleton that was pruned (the copy when duplicated)
};

namespace BoneDeleteWorkflow {

    // Active mesh with vertex groups, parented to a skeleton with one
    // matching armature modifier, object mode.
    std::optional<std::string> checkPreconditions(const SceneContext& ctx);

    // Every vertex-group name on the mesh, weighted or not.
    std::set<std::string> usedBoneNames(const MeshView& mesh);

    // Deletes the bones of the active mesh's skeleton that no vertex group
    // names. With duplicateSkeleton the skeleton is copied first, the mesh is
    // moved onto the copy and only the copy is pruned.
    BoneDeleteResult run(SceneHost& host, const SceneContext& ctx, bool duplicateSkeleton);

} // namespace BoneDeleteWorkflow

#endif // BONEDELETEWORKFLOW_H
