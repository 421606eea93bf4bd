#pragma once
#ifndef MAYASCENE_H
#define MAYASCENE_H

#include "OperationResult.h"
#include "SceneModel.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Maya implementation of the scene views.
//
//   mesh object       -> transform with a non-intermediate mesh shape
//   armature modifier -> skinCluster in the shape's history
//   vertex group      -> skinCluster influence (joint) and its weights
//   skeleton          -> joint hierarchy, addressed by its root joint(s)
//   bone              -> joint
//
// Nodes are tracked by UUID because re-parenting changes full DAG paths.

class MayaSceneHost;

// Common access to the DAG node behind a wrapper.
class MayaNodeHandle {
public:
    virtual ~MayaNodeHandle() = default;
    // Current full DAG path; empty once the node has been deleted.
    virtual std::string dagPath() const = 0;
};

class MayaMesh : public MeshView, public MayaNodeHandle {
public:
    MayaMesh(MayaSceneHost& host, const std::string& uuid);

    std::string dagPath() const override;

    std::string name() const override;
    SceneObject* parent() const override;
    Matrix44 worldMatrix() const override;
    bool isHidden() const override;
    void setHidden(bool hidden) override;

    std::vector<std::string> vertexGroups() const override;
    int vertexCount() const override;
    std::vector<WeightAssignment> vertexWeights(int vertex) const override;
    bool removeVertexGroup(int index) override;

    std::vector<DeformModifier> modifiers() const override;
    bool addArmatureModifier(SkeletonView* skeleton) override;
    bool setModifierSkeleton(int modifierIndex, SkeletonView* skeleton) override;
    bool setParent(SkeletonView* skeleton, const Matrix44* parentInverse) override;

    std::string shapePath() const;
    // First skinCluster in the shape's history, empty when unbound.
    std::string skinCluster() const;

private:
    void loadWeights() const;
    void invalidateWeights() { weightsLoaded_ = false; weights_.clear(); }

    MayaSceneHost& host_;
    std::string uuid_;

    mutable bool weightsLoaded_;
    mutable std::vector<std::vector<WeightAssignment>> weights_;
};

class MayaSkeleton : public SkeletonView, public MayaNodeHandle {
public:
    MayaSkeleton(MayaSceneHost& host, const std::string& rootUuid);

    // Path of the first surviving root joint.
    std::string dagPath() const override;

    std::string name() const override;
    SceneObject* parent() const override;
    Matrix44 worldMatrix() const override;
    bool isHidden() const override;
    void setHidden(bool hidden) override;

    std::vector<Bone> bones() const override;
    bool hasBone(const std::string& name) const override;
    bool removeBone(const std::string& name) override;
    bool clearParent() override;

    // Full paths of every joint, roots first.
    std::vector<std::string> jointPaths() const;
    // Joint in this skeleton matching the given joint of another hierarchy,
    // by path relative to its root and then by short name.
    std::string matchJoint(const std::string& foreignJointPath) const;

private:
    std::string findJoint(const std::string& shortName) const;

    MayaSceneHost& host_;
    std::vector<std::string> rootUuids_;   // grows when a root joint is deleted
};

// Any other DAG node (group, locator, camera, ...).
class MayaObject : public SceneObject, public MayaNodeHandle {
public:
    MayaObject(MayaSceneHost& host, const std::string& uuid);

    std::string dagPath() const override;

    std::string name() const override;
    ObjectKind kind() const override { return ObjectKind::Other; }
    SceneObject* parent() const override;
    Matrix44 worldMatrix() const override;
    bool isHidden() const override;
    void setHidden(bool hidden) override;

private:
    MayaSceneHost& host_;
    std::string uuid_;
};

class MayaSceneHost : public SceneHost {
public:
    MayaSceneHost();
    ~MayaSceneHost() override;

    // Active object (lead of the selection), selected transforms and the
    // current interaction mode, read fresh from Maya.
    SceneContext captureContext();

    // Wrapper for the node at dagPath, created on first use. Null when the
    // path does not resolve.
    SceneObject* objectAt(const std::string& dagPath);

    // Skeleton wrapper rooted at the top joint above jointPath.
    SkeletonView* skeletonForJoint(const std::string& jointPath);

    InteractionMode mode() const override;
    bool setMode(InteractionMode mode, SceneObject* target) override;

    void setSelection(const std::vector<SceneObject*>& objects, SceneObject* active) override;
    void clearSelection() override;

    SkeletonView* duplicateSkeleton(SkeletonView& skeleton) override;

    bool transferWeights(MeshView& source, MeshView& target,
                         const TransferOptions& options) override;

    static std::string pathOf(const SceneObject* obj);

private:
    std::map<std::string, std::unique_ptr<SceneObject>> objects_;   // by UUID
};

// Groups every MEL edit made while alive into one undo step.
class UndoChunk {
public:
    explicit UndoChunk(const std::string& name);
    ~UndoChunk();

    UndoChunk(const UndoChunk&) = delete;
    UndoChunk& operator=(const UndoChunk&) = delete;

private:
    bool open_;
};

namespace MayaScene {

    std::string userAppDir();

    // Maya version, API version, OS, scene and workspace for the log banner.
    std::vector<std::pair<std::string, std::string>> environmentRows();

    bool optionVarBool(const char* name, bool fallback);
    void setOptionVarBool(const char* name, bool value);

    // Display sink that forwards PluginLog output to the Script Editor.
    void installScriptEditorSink();

    // Shows the result in the Script Editor. False for a cancelled result.
    bool reportResult(const char* module, const OperationResult& result);

} // namespace MayaScene

#endif // MAYASCENE_H
