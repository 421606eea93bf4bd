#include "MayaScene.h"
#include "PluginLog.h"

#include <maya/MGlobal.h>
#include <maya/MString.h>
#include <maya/MStringArray.h>
#include <maya/MDoubleArray.h>
#include <maya/MStatus.h>
#include <maya/MSelectionList.h>
#include <maya/MDagPath.h>
#include <maya/MDagPathArray.h>
#include <maya/MObject.h>
#include <maya/MFnSkinCluster.h>
#include <maya/MFnSingleIndexedComponent.h>

#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#endif

// Convert MString to UTF-8 std::string safely on Windows
static std::string toUtf8(const MString& ms) {
#ifdef _WIN32
    const wchar_t* wstr = ms.asWChar();
    if (!wstr || !*wstr) return std::string();
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr, -1, nullptr, 0, nullptr, nullptr);
    if (len <= 0) return std::string(ms.asChar());  // fallback
    std::string result(len, '\0');
    int ret = WideCharToMultiByte(CP_UTF8, 0, wstr, -1, &result[0], len, nullptr, nullptr);
    if (ret <= 0) return std::string(ms.asChar());
    if (!result.empty() && result.back() == '\0') result.pop_back();
    return result;
#else
    return std::string(ms.asChar());
#endif
}

// Convert UTF-8 std::string to MString safely on Windows
static MString utf8ToMString(const std::string& utf8) {
#ifdef _WIN32
    if (utf8.empty()) return MString();
    int wlen = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), -1, nullptr, 0);
    if (wlen <= 0) return MString(utf8.c_str());
    std::wstring wstr(wlen, L'\0');
    int ret = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), -1, &wstr[0], wlen);
    if (ret <= 0) return MString(utf8.c_str());
    if (!wstr.empty() && wstr.back() == L'\0') wstr.pop_back();
    return MString(wstr.c_str());
#else
    return MString(utf8.c_str());
#endif
}

// Helper: execute MEL command.
static bool melExec(const std::string& cmd) {
    MStatus status = MGlobal::executeCommand(utf8ToMString(cmd));
    if (status != MS::kSuccess) {
        PluginLog::warn("MayaScene", std::string("MEL failed: ") + cmd);
        return false;
    }
    return true;
}

// Helper: execute MEL and return string array
static std::vector<std::string> melQueryStringArray(const std::string& cmd) {
    MStringArray result;
    MGlobal::executeCommand(utf8ToMString(cmd), result);
    std::vector<std::string> vec;
    for (unsigned int i = 0; i < result.length(); ++i) {
        vec.push_back(toUtf8(result[i]));
    }
    return vec;
}

// Helper: execute MEL and return string result
static std::string melQueryString(const std::string& cmd) {
    MString result;
    MGlobal::executeCommand(utf8ToMString(cmd), result);
    return toUtf8(result);
}

// Helper: execute MEL and return int result
static int melQueryInt(const std::string& cmd) {
    int result = 0;
    MGlobal::executeCommand(utf8ToMString(cmd), result);
    return result;
}

static bool melQueryDoubles(const std::string& cmd, MDoubleArray& out) {
    MStatus st = MGlobal::executeCommand(utf8ToMString(cmd), out);
    return st == MS::kSuccess;
}

static std::string quoted(const std::string& s) {
    return "\"" + s + "\"";
}

// Helper: get short name from full DAG path
static std::string shortName(const std::string& fullPath) {
    size_t pos = fullPath.rfind('|');
    return (pos != std::string::npos) ? fullPath.substr(pos + 1) : fullPath;
}

static bool nodeExists(const std::string& node) {
    return melQueryInt("objExists " + quoted(node)) != 0;
}

static std::string nodeType(const std::string& node) {
    return melQueryString("nodeType " + quoted(node));
}

static std::string longPath(const std::string& node) {
    std::vector<std::string> p = melQueryStringArray("ls -long " + quoted(node));
    return p.empty() ? std::string() : p[0];
}

static std::string uuidOf(const std::string& path) {
    std::vector<std::string> u = melQueryStringArray("ls -uuid " + quoted(path));
    return u.empty() ? std::string() : u[0];
}

static std::string pathForUuid(const std::string& uuid) {
    if (uuid.empty()) return std::string();
    return longPath(uuid);
}

static std::string parentPath(const std::string& path) {
    std::vector<std::string> p = melQueryStringArray("listRelatives -parent -fullPath " + quoted(path));
    return p.empty() ? std::string() : p[0];
}

static std::string jointParentPath(const std::string& path) {
    std::vector<std::string> p = melQueryStringArray(
        "listRelatives -parent -type \"joint\" -fullPath " + quoted(path));
    return p.empty() ? std::string() : p[0];
}

static std::string rootJointOf(const std::string& jointPath) {
    std::string cur = jointPath;
    for (;;) {
        std::string up = jointParentPath(cur);
        if (up.empty()) return cur;
        cur = up;
    }
}

static Matrix44 queryMatrix(const std::string& node, bool worldSpace) {
    MDoubleArray arr;
    const std::string space = worldSpace ? "-ws" : "-os";
    if (!melQueryDoubles("xform -q " + space + " -matrix " + quoted(node), arr) || arr.length() != 16) {
        PluginLog::warn("MayaScene", "Could not read matrix of '" + node + "'");
        return Matrix44::identity();
    }
    Matrix44 m;
    for (unsigned int i = 0; i < 16; ++i) m.m[i] = arr[i];
    return m;
}

static bool setLocalMatrix(const std::string& node, const Matrix44& m) {
    std::ostringstream cmd;
    cmd << "xform -os -matrix";
    for (int i = 0; i < 16; ++i) {
        cmd << " " << std::setprecision(15) << m.m[i];
    }
    cmd << " " << quoted(node);
    return melExec(cmd.str());
}

static bool visibilityOff(const std::string& node) {
    if (node.empty()) return false;
    return melQueryInt("getAttr " + quoted(node + ".visibility")) == 0;
}

static void setVisibility(const std::string& node, bool visible) {
    if (node.empty()) return;
    melExec("setAttr " + quoted(node + ".visibility") + (visible ? " 1" : " 0"));
}

static std::vector<std::string> skinInfluences(const std::string& skin) {
    if (skin.empty()) return {};
    return melQueryStringArray("skinCluster -q -influence " + quoted(skin));
}

// ============================================================================
// MayaMesh
// ============================================================================

MayaMesh::MayaMesh(MayaSceneHost& host, const std::string& uuid)
    : host_(host)
    , uuid_(uuid)
    , weightsLoaded_(false)
{
}

std::string MayaMesh::dagPath() const
{
    return pathForUuid(uuid_);
}

std::string MayaMesh::name() const
{
    return shortName(dagPath());
}

SceneObject* MayaMesh::parent() const
{
    std::string p = parentPath(dagPath());
    return p.empty() ? nullptr : host_.objectAt(p);
}

Matrix44 MayaMesh::worldMatrix() const
{
    return queryMatrix(dagPath(), true);
}

bool MayaMesh::isHidden() const
{
    return visibilityOff(dagPath());
}

void MayaMesh::setHidden(bool hidden)
{
    setVisibility(dagPath(), !hidden);
}

std::string MayaMesh::shapePath() const
{
    std::vector<std::string> shapes = melQueryStringArray(
        "listRelatives -shapes -noIntermediate -type \"mesh\" -fullPath " + quoted(dagPath()));
    return shapes.empty() ? std::string() : shapes[0];
}

std::string MayaMesh::skinCluster() const
{
    for (const auto& mod : modifiers()) {
        if (mod.kind == ModifierKind::Armature) return mod.name;
    }
    return std::string();
}

std::vector<std::string> MayaMesh::vertexGroups() const
{
    std::vector<std::string> names;
    for (const auto& infl : skinInfluences(skinCluster())) {
        names.push_back(shortName(infl));
    }
    return names;
}

int MayaMesh::vertexCount() const
{
    const std::string shape = shapePath();
    if (shape.empty()) return 0;
    return melQueryInt("polyEvaluate -vertex " + quoted(shape));
}

// Reads the whole weight table of skin on shape in one getWeights call.
// Columns follow influenceObjects() and are mapped onto groups by short name.
static bool readSkinWeights(const std::string& skin, const std::string& shape,
                            const std::vector<std::string>& groups,
                            std::vector<std::vector<WeightAssignment>>& out)
{
    MSelectionList list;
    if (list.add(utf8ToMString(skin)) != MS::kSuccess) return false;
    if (list.add(utf8ToMString(shape)) != MS::kSuccess) return false;

    MObject skinNode;
    MDagPath shapeDag;
    if (list.getDependNode(0, skinNode) != MS::kSuccess) return false;
    if (list.getDagPath(1, shapeDag) != MS::kSuccess) return false;

    MStatus status;
    MFnSkinCluster fnSkin(skinNode, &status);
    if (!status) return false;

    MDagPathArray influences;
    fnSkin.influenceObjects(influences, &status);
    if (!status) return false;

    std::vector<int> column(influences.length(), -1);
    for (unsigned int k = 0; k < influences.length(); ++k) {
        const std::string infl = shortName(toUtf8(influences[k].partialPathName()));
        auto it = std::find(groups.begin(), groups.end(), infl);
        if (it != groups.end()) column[k] = static_cast<int>(it - groups.begin());
    }

    MFnSingleIndexedComponent fnComp;
    MObject components = fnComp.create(MFn::kMeshVertComponent, &status);
    if (!status) return false;
    fnComp.setCompleteData(static_cast<int>(out.size()));

    MDoubleArray values;
    unsigned int influenceCount = 0;
    status = fnSkin.getWeights(shapeDag, components, values, influenceCount);
    if (!status) return false;
    if (values.length() < out.size() * influenceCount) return false;

    for (size_t v = 0; v < out.size(); ++v) {
        for (unsigned int k = 0; k < influenceCount && k < column.size(); ++k) {
            const double w = values[static_cast<unsigned int>(v * influenceCount + k)];
            if (w != 0.0 && column[k] >= 0) {
                out[v].push_back(WeightAssignment{column[k], w});
            }
        }
    }
    return true;
}

void MayaMesh::loadWeights() const
{
    if (weightsLoaded_) return;

    const int count = vertexCount();
    weights_.assign(count, std::vector<WeightAssignment>());

    const std::string skin = skinCluster();
    const std::string shape = shapePath();
    if (count > 0 && !skin.empty() && !shape.empty()) {
        if (!readSkinWeights(skin, shape, vertexGroups(), weights_)) {
            PluginLog::warn("MayaScene", "Could not read skin weights of '" + skin + "'");
            weights_.assign(count, std::vector<WeightAssignment>());
        }
    }
    weightsLoaded_ = true;
}

std::vector<WeightAssignment> MayaMesh::vertexWeights(int vertex) const
{
    loadWeights();
    if (vertex < 0 || vertex >= static_cast<int>(weights_.size())) return {};
    return weights_[vertex];
}

bool MayaMesh::removeVertexGroup(int index)
{
    const std::string skin = skinCluster();
    std::vector<std::string> infl = skinInfluences(skin);
    if (index < 0 || index >= static_cast<int>(infl.size())) return false;

    invalidateWeights();
    return melExec("skinCluster -e -removeInfluence " + quoted(infl[index]) + " " + quoted(skin));
}

std::vector<DeformModifier> MayaMesh::modifiers() const
{
    std::vector<DeformModifier> mods;
    const std::string shape = shapePath();
    if (shape.empty()) return mods;

    std::vector<std::string> history = melQueryStringArray(
        "listHistory -pruneDagObjects true " + quoted(shape));
    if (history.empty()) return mods;

    std::string cmd = "ls -type \"geometryFilter\"";
    for (const auto& h : history) cmd += " " + quoted(h);

    for (const auto& deformer : melQueryStringArray(cmd)) {
        DeformModifier mod;
        mod.name = deformer;
        mod.kind = (nodeType(deformer) == "skinCluster") ? ModifierKind::Armature : ModifierKind::Other;
        mod.skeleton = nullptr;
        if (mod.kind == ModifierKind::Armature) {
            std::vector<std::string> infl = skinInfluences(deformer);
            if (!infl.empty()) {
                std::string joint = longPath(infl[0]);
                if (!joint.empty() && nodeType(joint) == "joint") {
                    mod.skeleton = host_.skeletonForJoint(joint);
                }
            }
        }
        mods.push_back(mod);
    }
    return mods;
}

bool MayaMesh::addArmatureModifier(SkeletonView* skeleton)
{
    MayaSkeleton* skel = dynamic_cast<MayaSkeleton*>(skeleton);
    if (!skel) return false;

    std::vector<std::string> joints = skel->jointPaths();
    if (joints.empty()) return false;

    std::ostringstream cmd;
    cmd << "skinCluster -toSelectedBones -bindMethod 0 -normalizeWeights 1 -name "
        << quoted(name() + "_skinCluster");
    for (const auto& j : joints) cmd << " " << quoted(j);
    cmd << " " << quoted(dagPath());

    invalidateWeights();
    return melExec(cmd.str());
}

bool MayaMesh::setModifierSkeleton(int modifierIndex, SkeletonView* skeleton)
{
    MayaSkeleton* skel = dynamic_cast<MayaSkeleton*>(skeleton);
    if (!skel) return false;

    std::vector<DeformModifier> mods = modifiers();
    if (modifierIndex < 0 || modifierIndex >= static_cast<int>(mods.size())) return false;
    if (mods[modifierIndex].kind != ModifierKind::Armature) return false;
    const std::string skin = mods[modifierIndex].name;

    // Pairs of (skin.matrix[k], joint.worldMatrix[0]).
    std::vector<std::string> conns = melQueryStringArray(
        "listConnections -plugs true -connections true -source true -destination false "
        + quoted(skin + ".matrix"));

    bool ok = true;
    for (size_t i = 0; i + 1 < conns.size(); i += 2) {
        const std::string& dstPlug = conns[i];
        const std::string& srcPlug = conns[i + 1];
        std::string joint = longPath(srcPlug.substr(0, srcPlug.find('.')));
        if (joint.empty()) continue;

        std::string replacement = skel->matchJoint(joint);
        if (replacement.empty()) {
            PluginLog::warn("MayaScene", "No joint matching '" + shortName(joint) + "' in '"
                            + skel->name() + "'");
            ok = false;
            continue;
        }
        if (replacement == joint) continue;

        if (!melExec("connectAttr -force " + quoted(replacement + ".worldMatrix[0]") + " " + quoted(dstPlug))) {
            ok = false;
        }
    }
    invalidateWeights();
    return ok;
}

bool MayaMesh::setParent(SkeletonView* skeleton, const Matrix44* parentInverse)
{
    const std::string path = dagPath();
    if (!skeleton) {
        return melExec("parent -world -absolute " + quoted(path));
    }

    const std::string skelPath = MayaSceneHost::pathOf(skeleton);
    if (skelPath.empty()) return false;
    if (parentPath(path) == skelPath) return true;

    // Relative parenting keeps the local values; folding in the inverse of
    // the new parent's world matrix keeps the mesh where it was.
    const Matrix44 local = queryMatrix(path, false);
    if (!melExec("parent -relative " + quoted(path) + " " + quoted(skelPath))) return false;
    if (!parentInverse) return true;

    return setLocalMatrix(dagPath(), multiply(local, *parentInverse));
}

// ============================================================================
// MayaSkeleton
// ============================================================================

MayaSkeleton::MayaSkeleton(MayaSceneHost& host, const std::string& rootUuid)
    : host_(host)
{
    rootUuids_.push_back(rootUuid);
}

std::string MayaSkeleton::dagPath() const
{
    for (const auto& uuid : rootUuids_) {
        std::string p = pathForUuid(uuid);
        if (!p.empty()) return p;
    }
    return std::string();
}

std::string MayaSkeleton::name() const
{
    return shortName(dagPath());
}

SceneObject* MayaSkeleton::parent() const
{
    std::string p = parentPath(dagPath());
    return p.empty() ? nullptr : host_.objectAt(p);
}

Matrix44 MayaSkeleton::worldMatrix() const
{
    return queryMatrix(dagPath(), true);
}

bool MayaSkeleton::isHidden() const
{
    return visibilityOff(dagPath());
}

void MayaSkeleton::setHidden(bool hidden)
{
    setVisibility(dagPath(), !hidden);
}

std::vector<std::string> MayaSkeleton::jointPaths() const
{
    std::vector<std::string> paths;
    for (const auto& uuid : rootUuids_) {
        std::string root = pathForUuid(uuid);
        if (root.empty()) continue;
        paths.push_back(root);

        // listRelatives returns the deepest joints first.
        std::vector<std::string> desc = melQueryStringArray(
            "listRelatives -allDescendents -type \"joint\" -fullPath " + quoted(root));
        std::reverse(desc.begin(), desc.end());
        paths.insert(paths.end(), desc.begin(), desc.end());
    }
    return paths;
}

std::vector<Bone> MayaSkeleton::bones() const
{
    std::vector<Bone> result;
    for (const auto& path : jointPaths()) {
        Bone bone;
        bone.name = shortName(path);
        bone.parent = shortName(jointParentPath(path));
        result.push_back(bone);
    }
    return result;
}

std::string MayaSkeleton::findJoint(const std::string& jointName) const
{
    for (const auto& path : jointPaths()) {
        if (shortName(path) == jointName) return path;
    }
    return std::string();
}

bool MayaSkeleton::hasBone(const std::string& boneName) const
{
    return !findJoint(boneName).empty();
}

bool MayaSkeleton::removeBone(const std::string& boneName)
{
    const std::string path = findJoint(boneName);
    if (path.empty()) return false;

    const std::string boneUuid = uuidOf(path);
    const bool isRoot = std::find(rootUuids_.begin(), rootUuids_.end(), boneUuid) != rootUuids_.end();
    const std::string newParent = parentPath(path);

    // Deleting a DAG node takes its subtree with it, so children move up to
    // the deleted joint's parent first.
    std::vector<std::string> childUuids;
    for (const auto& child : melQueryStringArray("listRelatives -children -fullPath " + quoted(path))) {
        const bool childIsJoint = nodeType(child) == "joint";
        const std::string childUuid = uuidOf(child);
        bool moved = newParent.empty()
            ? melExec("parent -world -absolute " + quoted(child))
            : melExec("parent -absolute " + quoted(child) + " " + quoted(newParent));
        if (!moved) return false;
        if (isRoot && childIsJoint) childUuids.push_back(childUuid);
    }

    if (!melExec("delete " + quoted(pathForUuid(boneUuid)))) return false;

    if (isRoot) {
        rootUuids_.erase(std::remove(rootUuids_.begin(), rootUuids_.end(), boneUuid), rootUuids_.end());
        rootUuids_.insert(rootUuids_.end(), childUuids.begin(), childUuids.end());
    }
    return true;
}

bool MayaSkeleton::clearParent()
{
    const std::string path = dagPath();
    if (path.empty()) return false;
    if (parentPath(path).empty()) return true;
    return melExec("parent -world " + quoted(path));
}

std::string MayaSkeleton::matchJoint(const std::string& foreignJointPath) const
{
    const std::string foreignRoot = rootJointOf(foreignJointPath);
    const std::string relative = foreignJointPath.substr(foreignRoot.size());

    for (const auto& uuid : rootUuids_) {
        std::string root = pathForUuid(uuid);
        if (root.empty()) continue;
        if (nodeExists(root + relative)) return longPath(root + relative);
    }
    return findJoint(shortName(foreignJointPath));
}

// ============================================================================
// MayaObject
// ============================================================================

MayaObject::MayaObject(MayaSceneHost& host, const std::string& uuid)
    : host_(host)
    , uuid_(uuid)
{
}

std::string MayaObject::dagPath() const
{
    return pathForUuid(uuid_);
}

std::string MayaObject::name() const
{
    return shortName(dagPath());
}

SceneObject* MayaObject::parent() const
{
    std::string p = parentPath(dagPath());
    return p.empty() ? nullptr : host_.objectAt(p);
}

Matrix44 MayaObject::worldMatrix() const
{
    return queryMatrix(dagPath(), true);
}

bool MayaObject::isHidden() const
{
    return visibilityOff(dagPath());
}

void MayaObject::setHidden(bool hidden)
{
    setVisibility(dagPath(), !hidden);
}

// ============================================================================
// MayaSceneHost
// ============================================================================

MayaSceneHost::MayaSceneHost() {}
MayaSceneHost::~MayaSceneHost() {}

std::string MayaSceneHost::pathOf(const SceneObject* obj)
{
    const MayaNodeHandle* handle = dynamic_cast<const MayaNodeHandle*>(obj);
    return handle ? handle->dagPath() : std::string();
}

SkeletonView* MayaSceneHost::skeletonForJoint(const std::string& jointPath)
{
    const std::string root = rootJointOf(jointPath);
    const std::string uuid = uuidOf(root);
    if (uuid.empty()) return nullptr;

    auto it = objects_.find(uuid);
    if (it != objects_.end()) return it->second->asSkeleton();

    // A skeleton whose original root was deleted is keyed by that old UUID.
    for (auto& kv : objects_) {
        MayaSkeleton* skel = dynamic_cast<MayaSkeleton*>(kv.second.get());
        if (!skel) continue;
        for (const auto& path : skel->jointPaths()) {
            if (path == root) return skel;
        }
    }

    std::unique_ptr<SceneObject> skel(new MayaSkeleton(*this, uuid));
    SkeletonView* view = skel->asSkeleton();
    objects_[uuid] = std::move(skel);
    return view;
}

SceneObject* MayaSceneHost::objectAt(const std::string& dagPath)
{
    if (dagPath.empty()) return nullptr;

    const std::string type = nodeType(dagPath);
    if (type == "joint") return skeletonForJoint(longPath(dagPath));

    const std::string uuid = uuidOf(dagPath);
    if (uuid.empty()) return nullptr;

    auto it = objects_.find(uuid);
    if (it != objects_.end()) return it->second.get();

    std::unique_ptr<SceneObject> obj;
    std::vector<std::string> meshShapes = melQueryStringArray(
        "listRelatives -shapes -noIntermediate -type \"mesh\" " + quoted(dagPath));
    if (!meshShapes.empty()) {
        obj.reset(new MayaMesh(*this, uuid));
    } else {
        obj.reset(new MayaObject(*this, uuid));
    }
    SceneObject* raw = obj.get();
    objects_[uuid] = std::move(obj);
    return raw;
}

SceneContext MayaSceneHost::captureContext()
{
    SceneContext ctx;
    std::vector<std::string> sel = melQueryStringArray("ls -selection -long -type \"transform\"");
    for (const auto& path : sel) {
        SceneObject* obj = objectAt(path);
        if (!obj || ctx.isSelected(obj)) continue;
        ctx.selected.push_back(obj);
    }
    // Maya's lead object is the last one selected.
    if (!sel.empty()) ctx.active = objectAt(sel.back());
    ctx.mode = mode();
    return ctx;
}

InteractionMode MayaSceneHost::mode() const
{
    const std::string ctx = melQueryString("currentCtx");
    if (!ctx.empty()) {
        const std::string cls = melQueryString("contextInfo -c " + quoted(ctx));
        if (cls == "artAttrSkin") return InteractionMode::WeightPaint;
    }
    if (melQueryInt("selectMode -q -component") != 0) return InteractionMode::Edit;
    if (melQueryInt("selectMode -q -object") != 0) return InteractionMode::Object;
    return InteractionMode::Other;
}

bool MayaSceneHost::setMode(InteractionMode mode, SceneObject* target)
{
    switch (mode) {
    case InteractionMode::Edit: {
        const std::string path = pathOf(target);
        if (!path.empty() && !melExec("select -replace " + quoted(path))) return false;
        return melExec("selectMode -component");
    }
    case InteractionMode::Object:
        return melExec("selectMode -object");
    default:
        PluginLog::warn("MayaScene", std::string("Unsupported mode switch to ")
                        + interactionModeName(mode));
        return false;
    }
}

void MayaSceneHost::setSelection(const std::vector<SceneObject*>& objects, SceneObject* active)
{
    melExec("select -clear");
    for (SceneObject* obj : objects) {
        if (obj == active) continue;
        const std::string path = pathOf(obj);
        if (!path.empty()) melExec("select -add " + quoted(path));
    }
    const std::string activePath = pathOf(active);
    if (!activePath.empty()) melExec("select -add " + quoted(activePath));
}

void MayaSceneHost::clearSelection()
{
    melExec("select -clear");
}

SkeletonView* MayaSceneHost::duplicateSkeleton(SkeletonView& skeleton)
{
    const std::string root = pathOf(&skeleton);
    if (root.empty()) return nullptr;

    std::vector<std::string> dup = melQueryStringArray("duplicate -returnRootsOnly " + quoted(root));
    if (dup.empty()) {
        PluginLog::warn("MayaScene", "duplicate returned nothing for '" + root + "'");
        return nullptr;
    }
    const std::string dupRoot = longPath(dup[0]);

    // duplicate copies the whole subtree; keep only the joints.
    std::vector<std::string> joints = melQueryStringArray(
        "listRelatives -allDescendents -type \"joint\" -fullPath " + quoted(dupRoot));
    joints.push_back(dupRoot);
    std::vector<std::string> strays;
    for (const auto& j : joints) {
        for (const auto& child : melQueryStringArray("listRelatives -children -fullPath " + quoted(j))) {
            if (nodeType(child) != "joint") strays.push_back(child);
        }
    }
    for (const auto& s : strays) {
        melExec("delete " + quoted(s));
    }

    return skeletonForJoint(dupRoot);
}

bool MayaSceneHost::transferWeights(MeshView& source, MeshView& target, const TransferOptions& options)
{
    MayaMesh* src = dynamic_cast<MayaMesh*>(&source);
    MayaMesh* dst = dynamic_cast<MayaMesh*>(&target);
    if (!src || !dst) return false;

    const std::string srcSkin = src->skinCluster();
    const std::string dstSkin = dst->skinCluster();
    if (srcSkin.empty() || dstSkin.empty()) {
        PluginLog::warn("MayaScene", "copySkinWeights needs a skinCluster on both '"
                        + src->name() + "' and '" + dst->name() + "'");
        return false;
    }

    if (options.destinationLayers == LayerSelection::ByName) {
        std::set<std::string> existing;
        for (const auto& infl : skinInfluences(dstSkin)) existing.insert(shortName(infl));
        for (const auto& infl : skinInfluences(srcSkin)) {
            if (existing.count(shortName(infl))) continue;
            melExec("skinCluster -e -addInfluence " + quoted(infl) + " -weight 0 " + quoted(dstSkin));
        }
    }

    // copySkinWeights samples the undeformed meshes with their object
    // transforms applied.
    std::ostringstream cmd;
    cmd << "copySkinWeights -noMirror"
        << " -sourceSkin " << quoted(srcSkin)
        << " -destinationSkin " << quoted(dstSkin)
        << " -surfaceAssociation " << (options.nearestVertex ? "closestPoint" : "closestComponent")
        << " -influenceAssociation "
        << (options.destinationLayers == LayerSelection::ByIndex ? "oneToOne" : "name");
    return melExec(cmd.str());
}

// ============================================================================
// UndoChunk
// ============================================================================

UndoChunk::UndoChunk(const std::string& name)
    : open_(melExec("undoInfo -openChunk -chunkName " + quoted(name)))
{
}

UndoChunk::~UndoChunk()
{
    if (open_) melExec("undoInfo -closeChunk");
}

// ============================================================================
// MayaScene
// ============================================================================

namespace MayaScene {

std::string userAppDir()
{
    return melQueryString("internalVar -userAppDir");
}

std::vector<std::pair<std::string, std::string>> environmentRows()
{
    std::vector<std::pair<std::string, std::string>> rows;
    rows.emplace_back("Maya Version", melQueryString("about -v"));

    // `about -api` is numeric; capturing it into an MString yields "".
    int apiVer = 0;
    if (MGlobal::executeCommand("about -api", apiVer) == MS::kSuccess && apiVer > 0) {
        rows.emplace_back("API Version", std::to_string(apiVer));
    }
    rows.emplace_back("OS (Maya)", melQueryString("about -os"));

    std::string scene = melQueryString("file -q -sn");
    rows.emplace_back("Scene", scene.empty() ? "(untitled)" : scene);
    rows.emplace_back("Workspace", melQueryString("workspace -q -rd"));
    return rows;
}

bool optionVarBool(const char* name, bool fallback)
{
    if (melQueryInt(std::string("optionVar -exists ") + quoted(name)) == 0) return fallback;
    return melQueryInt(std::string("optionVar -q ") + quoted(name)) != 0;
}

void setOptionVarBool(const char* name, bool value)
{
    melExec(std::string("optionVar -intValue ") + quoted(name) + (value ? " 1" : " 0"));
}

void installScriptEditorSink()
{
    PluginLog::setDisplaySink([](PluginLog::Level level, const std::string& msg) {
        // msg is UTF-8 across the plugin; go through the wide-char conversion
        // so the Script Editor does not show mojibake on non-UTF-8 Windows.
        MString display = utf8ToMString(msg);
        switch (level) {
        case PluginLog::Level::Info:  MGlobal::displayInfo(display); break;
        case PluginLog::Level::Warn:  MGlobal::displayWarning(display); break;
        case PluginLog::Level::Error: MGlobal::displayError(display); break;
        }
    });
}

bool reportResult(const char* module, const OperationResult& result)
{
    if (!result.finished()) {
        PluginLog::error(module, result.message);
        return false;
    }
    if (result.severity == Severity::Warning) {
        PluginLog::warn(module, result.message);
    } else {
        PluginLog::info(module, result.message);
    }
    return true;
}

} // namespace MayaScene
