#pragma once
#ifndef BONEPRUNER_H
#define BONEPRUNER_H

#include "SceneModel.h"

#include <set>
#include <string>

// Holds the host in edit mode on one skeleton for the lifetime of the scope.
// The mode that was active before is restored on destruction, whichever way
// the enclosing block is left.
class EditModeScope {
public:
    EditModeScope(SceneHost& host, SkeletonView& skeleton);
    ~EditModeScope();

    EditModeScope(const EditModeScope&) = delete;
    EditModeScope& operator=(const EditModeScope&) = delete;

    bool entered() const { return entered_; }

private:
    SceneHost& host_;
    SkeletonView& skeleton_;
    InteractionMode previous_;
    bool entered_;
};

namespace BonePruner {

    // Deletes every bone whose name is not in usedNames. Bones are collected
    // before any deletion and deleted by name; a bone that has already gone
    // is skipped. Returns the number actually deleted. When edit mode cannot
    // be entered nothing is deleted, 0 is returned and *error is filled.
    int pruneUnusedBones(SceneHost& host,
                         SkeletonView& skeleton,
                         const std::set<std::string>& usedNames,
                         std::string* error = nullptr);

} // namespace BonePruner

#endif // BONEPRUNER_H
