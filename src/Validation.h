#pragma once
#ifndef VALIDATION_H
#define VALIDATION_H

#include "SceneModel.h"

#include <optional>
#include <string>

// Precondition checks. Each returns std::nullopt on pass, or one
// human-readable reason for the first failing condition.
namespace Validation {

    using Message = std::optional<std::string>;

    Message validateActiveObject(const SceneContext& ctx,
                                 ObjectKind kind = ObjectKind::Mesh,
                                 bool requireVertexGroups = false);

    Message validateSelection(const SceneContext& ctx,
                              int minCount = 2,
                              bool requireActiveInSelection = true);

    // Exactly one Armature-kind modifier with its skeleton set, and pointing
    // at requiredSkeleton when one is given.
    Message validateArmatureModifier(const MeshView& obj,
                                     const SkeletonView* requiredSkeleton = nullptr);

    Message validateArmatureParentAndModifier(const MeshView& obj);

    Message validateInteractionMode(const SceneContext& ctx);

    // Number of Armature-kind modifiers on obj.
    int countArmatureModifiers(const MeshView& obj);

} // namespace Validation

#endif // VALIDATION_H
