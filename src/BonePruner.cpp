#include "BonePruner.h"
#include "PluginLog.h"

#include <sstream>
#include <vector>

// ============================================================================
// EditModeScope
// ============================================================================

EditModeScope::EditModeScope(SceneHost& host, SkeletonView& skeleton)
    : host_(host)
    , skeleton_(skeleton)
    , previous_(host.mode())
    , entered_(false)
{
    entered_ = host_.setMode(InteractionMode::Edit, &skeleton_);
    if (!entered_) {
        PluginLog::warn("BonePruner", "Could not enter edit mode on '" + skeleton_.name() + "'");
    }
}

EditModeScope::~EditModeScope()
{
    if (!entered_) return;
    if (!host_.setMode(previous_, &skeleton_)) {
        PluginLog::error("BonePruner", std::string("Failed to restore ")
                         + interactionModeName(previous_) + " mode after editing '"
                         + skeleton_.name() + "'");
    }
}

// ============================================================================
// pruneUnusedBones
// ============================================================================

namespace BonePruner {

int pruneUnusedBones(SceneHost& host,
                     SkeletonView& skeleton,
                     const std::set<std::string>& usedNames,
                     std::string* error)
{
    const std::string skeletonName = skeleton.name();
    EditModeScope scope(host, skeleton);
    if (!scope.entered()) {
        if (error) *error = "Could not enter edit mode on '" + skeletonName + "'.";
        return 0;
    }

    std::vector<std::string> toDelete;
    for (const auto& bone : skeleton.bones()) {
        if (!usedNames.count(bone.name)) toDelete.push_back(bone.name);
    }

    int deleted = 0;
    for (const auto& name : toDelete) {
        if (!skeleton.hasBone(name)) continue;
        if (skeleton.removeBone(name)) {
            ++deleted;
        } else {
            PluginLog::warn("BonePruner", "Failed to delete bone '" + name + "'");
        }
    }

    std::ostringstream msg;
    msg << "Deleted " << deleted << " of " << toDelete.size()
        << " unused bone(s) from '" << skeletonName << "'";
    PluginLog::info("BonePruner", msg.str());
    return deleted;
}

} // namespace BonePruner
