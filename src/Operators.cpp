#include "Operators.h"
#include "BoneDeleteWorkflow.h"
#include "GroupUsage.h"
#include "PluginLog.h"
#include "Validation.h"
#include "WeightTransfer.h"

#include <initializer_list>
#include <sstream>

namespace Operators {

const char* actionName(Action action)
{
    switch (action) {
    case Action::TransferVertexGroups:     return "transferVertexGroups";
    case Action::DeleteUnusedVertexGroups: return "deleteUnusedVertexGroups";
    case Action::DeleteUnusedBones:        return "deleteUnusedBones";
    }
    return "";
}

bool actionFromName(const std::string& name, Action& out)
{
    for (Action a : {Action::TransferVertexGroups,
                     Action::DeleteUnusedVertexGroups,
                     Action::DeleteUnusedBones}) {
        if (name == actionName(a)) {
            out = a;
            return true;
        }
    }
    return false;
}

const char* actionLabel(Action action)
{
    switch (action) {
    case Action::TransferVertexGroups:     return "Transfer Vertex Groups from Active Object";
    case Action::DeleteUnusedVertexGroups: return "Delete Unused Vertex Groups";
    case Action::DeleteUnusedBones:        return "Delete Unused Bones";
    }
    return "";
}

const char* actionDescription(Action action)
{
    switch (action) {
    case Action::TransferVertexGroups:
        return "Transfer vertex groups and armatures from active object to selected object(s)";
    case Action::DeleteUnusedVertexGroups:
        return "Remove all vertex groups from the active object that have no weight assignments";
    case Action::DeleteUnusedBones:
        return "Delete all bones that do not have a corresponding vertex group";
    }
    return "";
}

std::optional<std::string> poll(Action action, const SceneContext& ctx)
{
    switch (action) {
    case Action::TransferVertexGroups:     return pollTransferVertexGroups(ctx);
    case Action::DeleteUnusedVertexGroups: return pollDeleteUnusedVertexGroups(ctx);
    case Action::DeleteUnusedBones:        return pollDeleteUnusedBones(ctx);
    }
    return std::nullopt;
}

static void logOutcome(const char* module, const std::string& object,
                       const OperationResult& result, int affected, int failed)
{
    PluginLog::OperationSummary summary;
    summary.module = module;
    summary.object = object;
    summary.status = result.finished() ? "Finished" : "Cancelled";
    summary.affected = affected;
    summary.failed = failed;
    summary.notes.push_back(result.message);
    PluginLog::logSummary(summary);
}

// ============================================================================
// Transfer vertex groups
// ============================================================================

std::optional<std::string> pollTransferVertexGroups(const SceneContext& ctx)
{
    return WeightTransfer::checkPreconditions(ctx);
}

OperationResult executeTransferVertexGroups(SceneHost& host, const SceneContext& ctx)
{
    TransferResult transfer = WeightTransfer::transferVertexGroups(host, ctx);
    const std::string activeName = ctx.active ? ctx.active->name() : std::string();
    logOutcome("TransferVertexGroups", activeName, transfer.result,
               transfer.processed, transfer.failedTarget.empty() ? 0 : 1);
    return transfer.result;
}

// ============================================================================
// Delete unused vertex groups
// ============================================================================

std::optional<std::string> pollDeleteUnusedVertexGroups(const SceneContext& ctx)
{
    if (auto msg = Validation::validateActiveObject(ctx, ObjectKind::Mesh, true)) return msg;
    if (auto msg = Validation::validateArmatureModifier(*ctx.active->asMesh())) return msg;
    if (auto msg = Validation::validateInteractionMode(ctx)) return msg;
    return std::nullopt;
}

OperationResult executeDeleteUnusedVertexGroups(SceneHost& /*host*/, const SceneContext& ctx)
{
    if (auto msg = pollDeleteUnusedVertexGroups(ctx)) {
        return OperationResult::cancelled(*msg);
    }

    MeshView& mesh = *ctx.active->asMesh();
    const std::vector<std::string> removed = GroupUsage::pruneUnusedGroups(mesh);

    OperationResult result;
    if (removed.empty()) {
        result = OperationResult::info("No zero-weight vertex groups found.");
    } else {
        std::ostringstream msg;
        msg << "Removed " << removed.size() << " zero-weight vertex groups!";
        result = OperationResult::info(msg.str());
        for (const auto& name : removed) {
            PluginLog::info("GroupUsage", "Removed vertex group '" + name + "' from '" + mesh.name() + "'");
        }
    }
    logOutcome("DeleteUnusedVertexGroups", mesh.name(), result,
               static_cast<int>(removed.size()), 0);
    return result;
}

// ============================================================================
// Delete unused bones
// ============================================================================

std::optional<std::string> pollDeleteUnusedBones(const SceneContext& ctx)
{
    return BoneDeleteWorkflow::checkPreconditions(ctx);
}

std::string confirmDeleteUnusedBonesText(const SceneContext& ctx)
{
    SceneObject* parent = (ctx.active) ? ctx.active->parent() : nullptr;
    const std::string name = parent ? parent->name() : std::string();
    return "You are about to delete unused bones from '" + name + "'";
}

OperationResult executeDeleteUnusedBones(SceneHost& host, const SceneContext& ctx,
                                         bool duplicateSkeleton)
{
    BoneDeleteResult outcome = BoneDeleteWorkflow::run(host, ctx, duplicateSkeleton);
    const std::string object = outcome.skeletonName.empty() && ctx.active
        ? ctx.active->name() : outcome.skeletonName;
    logOutcome("DeleteUnusedBones", object, outcome.result, outcome.deleted, 0);
    return outcome.result;
}

} // namespace Operators
