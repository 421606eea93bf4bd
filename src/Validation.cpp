#include "Validation.h"

#include <sstream>

namespace Validation {

Message validateActiveObject(const SceneContext& ctx, ObjectKind kind, bool requireVertexGroups)
{
    SceneObject* obj = ctx.active;
    if (!obj) {
        return std::string("No active object!");
    }
    if (obj->kind() != kind) {
        return std::string("Active object must be a ") + objectKindName(kind) + "!";
    }
    if (requireVertexGroups) {
        MeshView* mesh = obj->asMesh();
        if (!mesh || mesh->vertexGroups().empty()) {
            return std::string("Active object must have vertex groups!");
        }
    }
    return std::nullopt;
}

Message validateSelection(const SceneContext& ctx, int minCount, bool requireActiveInSelection)
{
    if (static_cast<int>(ctx.selected.size()) < minCount) {
        std::ostringstream msg;
        msg << "You must select at least " << minCount << " objects.";
        return msg.str();
    }
    if (requireActiveInSelection) {
        if (!ctx.active || !ctx.isSelected(ctx.active)) {
            return std::string("Active object must be among the selected objects.");
        }
    }
    return std::nullopt;
}

int countArmatureModifiers(const MeshView& obj)
{
    int count = 0;
    for (const auto& mod : obj.modifiers()) {
        if (mod.kind == ModifierKind::Armature) ++count;
    }
    return count;
}

Message validateArmatureModifier(const MeshView& obj, const SkeletonView* requiredSkeleton)
{
    const SkeletonView* bound = nullptr;
    int count = 0;
    for (const auto& mod : obj.modifiers()) {
        if (mod.kind != ModifierKind::Armature) continue;
        bound = mod.skeleton;
        ++count;
    }

    if (count != 1) {
        return std::string("Object must have exactly one armature modifier.");
    }
    if (!bound) {
        return std::string("Armature modifier has no object assigned.");
    }
    if (requiredSkeleton && bound != requiredSkeleton) {
        return std::string("Armature modifier does not point to the required armature.");
    }
    return std::nullopt;
}

Message validateArmatureParentAndModifier(const MeshView& obj)
{
    SceneObject* parent = obj.parent();
    SkeletonView* skeleton = parent ? parent->asSkeleton() : nullptr;
    if (!skeleton) {
        return std::string("Object must be parented to an armature.");
    }
    return validateArmatureModifier(obj, skeleton);
}

Message validateInteractionMode(const SceneContext& ctx)
{
    if (ctx.mode != InteractionMode::Object) {
        return std::string("This function only works in object mode! Current mode is: '")
            + interactionModeName(ctx.mode) + "'";
    }
    return std::nullopt;
}

} // namespace Validation
