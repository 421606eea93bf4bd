#pragma once
#ifndef SCENEMODEL_H
#define SCENEMODEL_H

#include <string>
#include <vector>

// Host-neutral view of the scene graph. The host (Maya plugin, test fake)
// owns every object; the core only reads and mutates through these views.

enum class ObjectKind {
    Mesh,
    Skeleton,
    Other
};

enum class InteractionMode {
    Object,
    Edit,
    Pose,
    WeightPaint,
    Other
};

enum class ModifierKind {
    Armature,
    Other
};

// "MESH", "ARMATURE", "OTHER"
const char* objectKindName(ObjectKind kind);

// "OBJECT", "EDIT", "POSE", "PAINT_WEIGHT", "OTHER"
const char* interactionModeName(InteractionMode mode);

// Row-major 4x4 with row vectors (translation in m[12..14]), the layout
// returned by `xform -q -matrix`.
struct Matrix44 {
    double m[16];

    static Matrix44 identity();
};

Matrix44 multiply(const Matrix44& a, const Matrix44& b);

// Returns false (and leaves out untouched) when the matrix is singular.
bool invert(const Matrix44& in, Matrix44& out);

class MeshView;
class SkeletonView;

struct WeightAssignment {
    int group;      // index into the owning mesh's vertex-group sequence
    double weight;  // [0,1]; > 0 means assigned
};

struct DeformModifier {
    std::string name;
    ModifierKind kind;
    SkeletonView* skeleton;  // bound skeleton, null when unset
};

struct Bone {
    std::string name;
    std::string parent;  // empty for a root bone
};

class SceneObject {
public:
    virtual ~SceneObject() = default;

    virtual std::string name() const = 0;
    virtual ObjectKind kind() const = 0;
    virtual SceneObject* parent() const = 0;
    virtual Matrix44 worldMatrix() const = 0;

    virtual bool isHidden() const = 0;
    virtual void setHidden(bool hidden) = 0;

    virtual MeshView* asMesh() { return nullptr; }
    virtual SkeletonView* asSkeleton() { return nullptr; }
};

class MeshView : public SceneObject {
public:
    ObjectKind kind() const override { return ObjectKind::Mesh; }
    MeshView* asMesh() override { return this; }

    // Ordered; a group's index is its position. Indices shift on removal.
    virtual std::vector<std::string> vertexGroups() const = 0;
    virtual int vertexCount() const = 0;
    virtual std::vector<WeightAssignment> vertexWeights(int vertex) const = 0;

    // Removes the group and every weight pair that references it; later
    // groups move down by one.
    virtual bool removeVertexGroup(int index) = 0;

    virtual std::vector<DeformModifier> modifiers() const = 0;
    virtual bool addArmatureModifier(SkeletonView* skeleton) = 0;
    // modifierIndex is a position in modifiers(), any kind.
    virtual bool setModifierSkeleton(int modifierIndex, SkeletonView* skeleton) = 0;

    // parentInverse == nullptr keeps the current parent-inverse transform.
    virtual bool setParent(SkeletonView* skeleton, const Matrix44* parentInverse) = 0;
};

class SkeletonView : public SceneObject {
public:
    ObjectKind kind() const override { return ObjectKind::Skeleton; }
    SkeletonView* asSkeleton() override { return this; }

    virtual std::vector<Bone> bones() const = 0;
    virtual bool hasBone(const std::string& name) const = 0;

    // Deletes a single bone. Children are left to the host's hierarchy rules.
    virtual bool removeBone(const std::string& name) = 0;

    // Makes the skeleton a free root.
    virtual bool clearParent() = 0;
};

enum class LayerSelection {
    All,
    ByName,
    ByIndex
};

// Options for the host's generic attribute-transfer operation.
struct TransferOptions {
    bool vertexGroupWeights  = true;
    bool nearestVertex       = true;
    bool useObjectTransform  = true;   // object transforms, not the posed/deformed result
    bool autoTransform       = false;
    LayerSelection sourceLayers      = LayerSelection::All;
    LayerSelection destinationLayers = LayerSelection::ByName;
};

// Host-level operations the core may request.
class SceneHost {
public:
    virtual ~SceneHost() = default;

    virtual InteractionMode mode() const = 0;
    virtual bool setMode(InteractionMode mode, SceneObject* target) = 0;

    virtual void setSelection(const std::vector<SceneObject*>& objects, SceneObject* active) = 0;
    virtual void clearSelection() = 0;

    // Returns the new skeleton, or null on failure.
    virtual SkeletonView* duplicateSkeleton(SkeletonView& skeleton) = 0;

    virtual bool transferWeights(MeshView& source, MeshView& target,
                                 const TransferOptions& options) = 0;
};

// Explicit snapshot of the host's ambient state, passed into every entry point.
struct SceneContext {
    SceneObject* active = nullptr;
    std::vector<SceneObject*> selected;
    InteractionMode mode = InteractionMode::Object;

    bool isSelected(const SceneObject* obj) const;
};

#endif // SCENEMODEL_H
