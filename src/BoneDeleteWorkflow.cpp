#include "BoneDeleteWorkflow.h"
#include "BonePruner.h"
#include "PluginLog.h"
#include "Validation.h"

#include <sstream>
#include <vector>

namespace BoneDeleteWorkflow {

std::optional<std::string> checkPreconditions(const SceneContext& ctx)
{
    if (auto msg = Validation::validateActiveObject(ctx, ObjectKind::Mesh, true)) return msg;
    if (auto msg = Validation::validateArmatureParentAndModifier(*ctx.active->asMesh())) return msg;
    if (auto msg = Validation::validateInteractionMode(ctx)) return msg;
    return std::nullopt;
}

std::set<std::string> usedBoneNames(const MeshView& mesh)
{
    const std::vector<std::string> groups = mesh.vertexGroups();
    return std::set<std::string>(groups.begin(), groups.end());
}

// Moves mesh and its armature modifiers from the original skeleton onto a
// free-standing duplicate. Returns the duplicate, or null on failure.
static SkeletonView* switchToDuplicate(SceneHost& host, MeshView& mesh, SkeletonView& original)
{
    host.setSelection({&original}, &original);
    SkeletonView* copy = host.duplicateSkeleton(original);
    if (!copy) {
        PluginLog::error("BoneDelete", "Duplicating '" + original.name() + "' failed");
        return nullptr;
    }

    if (copy->parent() && !copy->clearParent()) {
        PluginLog::warn("BoneDelete", "Could not detach '" + copy->name() + "' from its parent");
    }

    if (!mesh.setParent(copy, nullptr)) {
        PluginLog::error("BoneDelete", "Failed to parent '" + mesh.name() + "' to '" + copy->name() + "'");
        return nullptr;
    }

    const std::vector<DeformModifier> mods = mesh.modifiers();
    for (int i = 0; i < static_cast<int>(mods.size()); ++i) {
        if (mods[i].kind != ModifierKind::Armature) continue;
        if (!mesh.setModifierSkeleton(i, copy)) {
            PluginLog::error("BoneDelete", "Failed to retarget modifier '" + mods[i].name
                             + "' to '" + copy->name() + "'");
            return nullptr;
        }
    }
    if (auto msg = Validation::validateArmatureModifier(mesh, copy)) {
        PluginLog::error("BoneDelete", "'" + mesh.name() + "' is not bound to '" + copy->name() + "': " + *msg);
        return nullptr;
    }

    PluginLog::info("BoneDelete", "Working on duplicate '" + copy->name() + "' of '"
                    + original.name() + "'");
    return copy;
}

BoneDeleteResult run(SceneHost& host, const SceneContext& ctx, bool duplicateSkeleton)
{
    BoneDeleteResult out;

    if (auto msg = checkPreconditions(ctx)) {
        out.result = OperationResult::cancelled(*msg);
        return out;
    }

    MeshView& mesh = *ctx.active->asMesh();
    SkeletonView* skeleton = mesh.parent()->asSkeleton();

    if (auto msg = Validation::validateArmatureModifier(mesh, skeleton)) {
        out.result = OperationResult::cancelled(*msg);
        return out;
    }

    // Edit mode needs a visible skeleton.
    if (skeleton->isHidden()) skeleton->setHidden(false);

    if (duplicateSkeleton) {
        SkeletonView* copy = switchToDuplicate(host, mesh, *skeleton);
        if (!copy) {
            out.result = OperationResult::cancelled(
                "Could not duplicate armature '" + skeleton->name() + "'; nothing was deleted.");
            return out;
        }
        skeleton = copy;
        out.duplicated = true;
    }

    out.skeletonName = skeleton->name();
    const std::set<std::string> used = usedBoneNames(mesh);

    host.setSelection({skeleton}, skeleton);

    std::string error;
    out.deleted = BonePruner::pruneUnusedBones(host, *skeleton, used, &error);
    if (!error.empty()) {
        out.result = OperationResult::cancelled(error);
        return out;
    }

    std::ostringstream msg;
    msg << "Deleted " << out.deleted << " unused bones.";
    out.result = OperationResult::info(msg.str());
    return out;
}

} // namespace BoneDeleteWorkflow
