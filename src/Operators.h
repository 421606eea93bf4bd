#pragma once
#ifndef OPERATORS_H
#define OPERATORS_H

#include "OperationResult.h"
#include "SceneModel.h"

#include <optional>
#include <string>

// The three user-facing actions. poll*() answers whether the action can run
// right now (the message doubles as the disabled-control tooltip);
// execute*() polls again against the context it is given before mutating.
namespace Operators {

    enum class Action {
        TransferVertexGroups,
        DeleteUnusedVertexGroups,
        DeleteUnusedBones
    };

    // "transferVertexGroups", "deleteUnusedVertexGroups", "deleteUnusedBones"
    const char* actionName(Action action);
    bool actionFromName(const std::string& name, Action& out);
    const char* actionLabel(Action action);
    const char* actionDescription(Action action);

    std::optional<std::string> poll(Action action, const SceneContext& ctx);

    std::optional<std::string> pollTransferVertexGroups(const SceneContext& ctx);
    OperationResult executeTransferVertexGroups(SceneHost& host, const SceneContext& ctx);

    std::optional<std::string> pollDeleteUnusedVertexGroups(const SceneContext& ctx);
    OperationResult executeDeleteUnusedVertexGroups(SceneHost& host, const SceneContext& ctx);

    std::optional<std::string> pollDeleteUnusedBones(const SceneContext& ctx);
    // Text shown above the "duplicate skeleton first" option.
    std::string confirmDeleteUnusedBonesText(const SceneContext& ctx);
    OperationResult executeDeleteUnusedBones(SceneHost& host, const SceneContext& ctx,
                                             bool duplicateSkeleton);

} // namespace Operators

#endif // OPERATORS_H
