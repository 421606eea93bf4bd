#pragma once
#ifndef WEIGHTTRANSFER_H
#define WEIGHTTRANSFER_H

#include "OperationResult.h"
#include "SceneModel.h"

#include <optional>
#include <string>

struct TransferResult {
    OperationResult result;
    int processed = 0;          // targets fully re-parented and transferred
    std::string failedTarget;   // name of the target that stopped the batch
};

namespace WeightTransfer {

    // Selection of 2+ including active, active mesh with vertex groups,
    // parented to a skeleton with one matching armature modifier, object mode.
    std::optional<std::string> checkPreconditions(const SceneContext& ctx);

    // Gives target exactly one armature modifier bound to skeleton: creates
    // one when there is none, rebinds the single existing one. Returns false
    // without touching anything when target already has two or more.
    bool ensureSingleArmatureModifier(MeshView& target, SkeletonView& skeleton);

    // Re-parents every selected object other than the active one to the
    // active mesh's skeleton and copies vertex-group weights onto it, one
    // target at a time. A failing target cancels the rest of the batch;
    // targets already processed keep their changes. The host selection is
    // cleared before returning.
    TransferResult transferVertexGroups(SceneHost& host, const SceneContext& ctx);

} // namespace WeightTransfer

#endif // WEIGHTTRANSFER_H
