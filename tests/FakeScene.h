#pragma once
#ifndef FAKESCENE_H
#define FAKESCENE_H

#include "SceneModel.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

// In-memory scene used by the unit tests. FakeSceneHost owns every object it
// creates; tests hold references.

class FakeObject : public SceneObject {
public:
    explicit FakeObject(const std::string& name) : name_(name), world_(Matrix44::identity()) {}

    std::string name() const override { return name_; }
    ObjectKind kind() const override { return ObjectKind::Other; }
    SceneObject* parent() const override { return parent_; }
    Matrix44 worldMatrix() const override { return world_; }
    bool isHidden() const override { return hidden_; }
    void setHidden(bool hidden) override { hidden_ = hidden; }

    void setParentObject(SceneObject* parent) { parent_ = parent; }

private:
    std::string name_;
    SceneObject* parent_ = nullptr;
    Matrix44 world_;
    bool hidden_ = false;
};

class FakeSkeleton : public SkeletonView {
public:
    FakeSkeleton(const std::string& name, const std::vector<Bone>& bones);

    std::string name() const override { return name_; }
    SceneObject* parent() const override { return parent_; }
    Matrix44 worldMatrix() const override { return world_; }
    bool isHidden() const override { return hidden_; }
    void setHidden(bool hidden) override { hidden_ = hidden; }

    std::vector<Bone> bones() const override { return bones_; }
    bool hasBone(const std::string& name) const override;
    // Children of the removed bone are re-parented to its parent.
    bool removeBone(const std::string& name) override;
    bool clearParent() override;

    void setParentObject(SceneObject* parent) { parent_ = parent; }
    void setWorldMatrix(const Matrix44& m) { world_ = m; }
    std::vector<std::string> boneNames() const;
    std::string boneParent(const std::string& bone) const;

    // Bones whose removal reports failure; they stay in place.
    std::set<std::string> failRemove;
    // Names of removed bones, in removal order.
    std::vector<std::string> removeLog;
    int clearParentCalls = 0;

private:
    std::string name_;
    std::vector<Bone> bones_;
    SceneObject* parent_ = nullptr;
    Matrix44 world_;
    bool hidden_ = false;
};

struct Vec3 {
    double x, y, z;
};

class FakeMesh : public MeshView {
public:
    explicit FakeMesh(const std::string& name);

    std::string name() const override { return name_; }
    SceneObject* parent() const override { return parent_; }
    Matrix44 worldMatrix() const override { return world_; }
    bool isHidden() const override { return hidden_; }
    void setHidden(bool hidden) override { hidden_ = hidden; }

    std::vector<std::string> vertexGroups() const override { return groups_; }
    int vertexCount() const override { return static_cast<int>(positions_.size()); }
    std::vector<WeightAssignment> vertexWeights(int vertex) const override;
    bool removeVertexGroup(int index) override;

    std::vector<DeformModifier> modifiers() const override { return modifiers_; }
    bool addArmatureModifier(SkeletonView* skeleton) override;
    bool setModifierSkeleton(int modifierIndex, SkeletonView* skeleton) override;
    bool setParent(SkeletonView* skeleton, const Matrix44* parentInverse) override;

    // --- setup ---
    int addGroup(const std::string& name);
    int addVertex(double x, double y, double z);
    void setWeight(int vertex, const std::string& group, double weight);
    void addModifier(const std::string& name, ModifierKind kind, SkeletonView* skeleton);
    void setParentObject(SceneObject* parent) { parent_ = parent; }
    void setWorldMatrix(const Matrix44& m) { world_ = m; }

    // --- inspection ---
    Vec3 worldPosition(int vertex) const;
    double weight(int vertex, const std::string& group) const;
    int groupIndex(const std::string& group) const;

    std::vector<int> removeCalls;   // indices passed to removeVertexGroup
    bool hasParentInverse = false;
    Matrix44 parentInverse = Matrix44::identity();
    int setParentCalls = 0;
    bool failAddModifier = false;
    // setModifierSkeleton reports success but keeps the old skeleton bound.
    bool ignoreRebind = false;

    // Direct access for the host's weight copy.
    std::vector<std::vector<WeightAssignment>>& rawWeights() { return weights_; }

private:
    std::string name_;
    std::vector<std::string> groups_;
    std::vector<Vec3> positions_;
    std::vector<std::vector<WeightAssignment>> weights_;
    std::vector<DeformModifier> modifiers_;
    SceneObject* parent_ = nullptr;
    Matrix44 world_;
    bool hidden_ = false;
};

struct TransferCall {
    std::string source;
    std::string target;
    TransferOptions options;
    std::vector<std::string> selection;   // host selection at call time, active last
};

class FakeSceneHost : public SceneHost {
public:
    FakeSceneHost() = default;

    FakeMesh& addMesh(const std::string& name);
    FakeSkeleton& addSkeleton(const std::string& name, const std::vector<Bone>& bones);
    FakeObject& addObject(const std::string& name);

    // Mesh parented to skeleton with one armature modifier bound to it.
    FakeMesh& addRiggedMesh(const std::string& name, FakeSkeleton& skeleton);

    InteractionMode mode() const override { return mode_; }
    bool setMode(InteractionMode mode, SceneObject* target) override;

    void setSelection(const std::vector<SceneObject*>& objects, SceneObject* active) override;
    void clearSelection() override;

    SkeletonView* duplicateSkeleton(SkeletonView& skeleton) override;

    // Copies weights from the nearest source vertex in world space, matching
    // groups by name and creating the ones the target lacks.
    bool transferWeights(MeshView& source, MeshView& target,
                         const TransferOptions& options) override;

    SceneContext context(SceneObject* active, const std::vector<SceneObject*>& selected,
                         InteractionMode mode = InteractionMode::Object) const;

    void setCurrentMode(InteractionMode mode) { mode_ = mode; }

    std::vector<InteractionMode> modeRequests;
    std::vector<std::string> selection;
    std::vector<TransferCall> transfers;
    int clearSelectionCalls = 0;

    bool failEditMode = false;
    bool failDuplicate = false;
    std::set<std::string> failTransferTo;

private:
    InteractionMode mode_ = InteractionMode::Object;
    std::vector<std::unique_ptr<SceneObject>> objects_;
};

#endif // FAKESCENE_H
