#include "WeightTransfer.h"
#include "PluginLog.h"
#include "Validation.h"

#include <sstream>
#include <vector>

namespace {

// Clears the host selection when the transfer returns, on every path.
class SelectionReset {
public:
    explicit SelectionReset(SceneHost& host) : host_(host) {}
    ~SelectionReset() { host_.clearSelection(); }

    SelectionReset(const SelectionReset&) = delete;
    SelectionReset& operator=(const SelectionReset&) = delete;

private:
    SceneHost& host_;
};

} // namespace

namespace WeightTransfer {

std::optional<std::string> checkPreconditions(const SceneContext& ctx)
{
    if (auto msg = Validation::validateSelection(ctx, 2)) return msg;
    if (auto msg = Validation::validateActiveObject(ctx, ObjectKind::Mesh, true)) return msg;
    if (auto msg = Validation::validateArmatureParentAndModifier(*ctx.active->asMesh())) return msg;
    if (auto msg = Validation::validateInteractionMode(ctx)) return msg;
    return std::nullopt;
}

bool ensureSingleArmatureModifier(MeshView& target, SkeletonView& skeleton)
{
    const std::vector<DeformModifier> mods = target.modifiers();
    std::vector<int> armatureSlots;
    for (int i = 0; i < static_cast<int>(mods.size()); ++i) {
        if (mods[i].kind == ModifierKind::Armature) armatureSlots.push_back(i);
    }

    if (armatureSlots.empty()) {
        if (!target.addArmatureModifier(&skeleton)) {
            PluginLog::warn("WeightTransfer", "Failed to create an armature modifier on '"
                            + target.name() + "'");
            return false;
        }
        PluginLog::info("WeightTransfer", "Created a new armature modifier for '" + target.name() + "'.");
        return true;
    }
    if (armatureSlots.size() == 1) {
        if (!target.setModifierSkeleton(armatureSlots[0], &skeleton)) {
            PluginLog::warn("WeightTransfer", "Failed to rebind the armature modifier on '"
                            + target.name() + "'");
            return false;
        }
        PluginLog::info("WeightTransfer", "Updated existing armature modifier for '" + target.name() + "'.");
        return true;
    }
    return false;
}

TransferResult transferVertexGroups(SceneHost& host, const SceneContext& ctx)
{
    TransferResult out;
    SelectionReset selectionReset(host);

    if (auto msg = checkPreconditions(ctx)) {
        out.result = OperationResult::cancelled(*msg);
        return out;
    }

    MeshView& active = *ctx.active->asMesh();
    SkeletonView& skeleton = *active.parent()->asSkeleton();

    Matrix44 parentInverse;
    if (!invert(skeleton.worldMatrix(), parentInverse)) {
        out.result = OperationResult::cancelled(
            "Armature '" + skeleton.name() + "' has a singular world matrix; cannot re-parent.");
        return out;
    }

    std::vector<MeshView*> targets;
    for (SceneObject* obj : ctx.selected) {
        if (obj == ctx.active) continue;
        MeshView* mesh = obj->asMesh();
        if (!mesh) {
            PluginLog::warn("WeightTransfer", "Skipping '" + obj->name() + "': not a mesh");
            continue;
        }
        targets.push_back(mesh);
    }

    TransferOptions options;
    options.vertexGroupWeights = true;
    options.nearestVertex = true;
    options.useObjectTransform = true;
    options.autoTransform = false;
    options.sourceLayers = LayerSelection::All;
    options.destinationLayers = LayerSelection::ByName;

    for (MeshView* target : targets) {
        const std::string targetName = target->name();

        if (Validation::countArmatureModifiers(*target) > 1) {
            out.failedTarget = targetName;
            out.result = OperationResult::cancelled(
                "'" + targetName + "' has multiple armature modifiers. Only one is allowed.");
            return out;
        }
        if (!ensureSingleArmatureModifier(*target, skeleton)) {
            out.failedTarget = targetName;
            out.result = OperationResult::cancelled(
                "Could not bind '" + targetName + "' to armature '" + skeleton.name() + "'.");
            return out;
        }
        // A host may accept the rebind and still leave the old skeleton bound.
        if (auto msg = Validation::validateArmatureModifier(*target, &skeleton)) {
            out.failedTarget = targetName;
            out.result = OperationResult::cancelled(
                "Could not bind '" + targetName + "' to armature '" + skeleton.name() + "': " + *msg);
            return out;
        }

        if (!target->setParent(&skeleton, &parentInverse)) {
            out.failedTarget = targetName;
            out.result = OperationResult::cancelled(
                "Failed to parent '" + targetName + "' to '" + skeleton.name() + "'.");
            return out;
        }

        host.setSelection({&active, target}, &active);
        if (!host.transferWeights(active, *target, options)) {
            out.failedTarget = targetName;
            out.result = OperationResult::cancelled(
                "Vertex group transfer from '" + active.name() + "' to '" + targetName + "' failed.");
            return out;
        }

        ++out.processed;
        PluginLog::info("WeightTransfer", "Transferred vertex groups to '" + targetName + "'");
    }

    std::ostringstream msg;
    msg << "Vertex groups transferred from '" << active.name() << "' to "
        << out.processed << " objects";
    out.result = OperationResult::info(msg.str());
    return out;
}

} // namespace WeightTransfer
