#include "GroupUsage.h"
#include "PluginLog.h"

#include <functional>

namespace GroupUsage {

std::set<int> computeUsedGroups(const MeshView& mesh)
{
    std::set<int> used;
    const int count = mesh.vertexCount();
    for (int v = 0; v < count; ++v) {
        for (const auto& w : mesh.vertexWeights(v)) {
            if (w.weight > 0.0) used.insert(w.group);
        }
    }
    return used;
}

std::vector<std::string> pruneUnusedGroups(MeshView& mesh)
{
    const std::set<int> used = computeUsedGroups(mesh);
    const int groupCount = static_cast<int>(mesh.vertexGroups().size());

    std::set<int, std::greater<int>> unused;
    for (int i = 0; i < groupCount; ++i) {
        if (!used.count(i)) unused.insert(i);
    }

    std::vector<std::string> removed;
    for (int index : unused) {
        // Name is read from the live sequence right before each removal.
        const std::vector<std::string> groups = mesh.vertexGroups();
        if (index >= static_cast<int>(groups.size())) {
            PluginLog::warn("GroupUsage", "Vertex group index " + std::to_string(index)
                            + " out of range on '" + mesh.name() + "', skipped");
            continue;
        }
        const std::string name = groups[index];
        if (!mesh.removeVertexGroup(index)) {
            PluginLog::warn("GroupUsage", "Failed to remove vertex group '" + name
                            + "' from '" + mesh.name() + "'");
            continue;
        }
        removed.push_back(name);
    }
    return removed;
}

} // namespace GroupUsage
