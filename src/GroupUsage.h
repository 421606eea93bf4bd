#pragma once
#ifndef GROUPUSAGE_H
#define GROUPUSAGE_H

#include "SceneModel.h"

#include <set>
#include <string>
#include <vector>

namespace GroupUsage {

    // Indices of vertex groups with weight > 0 on at least one vertex.
    std::set<int> computeUsedGroups(const MeshView& mesh);

    // Removes every vertex group that computeUsedGroups() does not report,
    // highest index first so pending indices stay valid. Returns the removed
    // names in deletion order; empty when nothing was unused.
    std::vector<std::string> pruneUnusedGroups(MeshView& mesh);

} // namespace GroupUsage

#endif // GROUPUSAGE_H
