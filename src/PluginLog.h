#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace PluginLog {

enum class Level { Info, Warn, Error };

// Receives every message as "[Module] msg" for on-screen display (Script
// Editor in Maya, a capture buffer in tests). No sink means file only.
using DisplaySink = std::function<void(Level, const std::string&)>;
void setDisplaySink(DisplaySink sink);

// Opens (or creates) <dir>/OutfitRig.log and writes a session banner.
// Returns false when the file cannot be opened; display output still works.
bool init(const std::string& dir);
void shutdown();

// Empty when no file is open.
std::string logPath();

void info(const char* module, const std::string& msg);
void warn(const char* module, const std::string& msg);
void error(const char* module, const std::string& msg);

// "[2026-10-19 12:00:00][Info][Module] msg"
std::string formatLine(const char* level, const char* module, const std::string& msg);

// Titled key/value block (environment details at plugin load).
void logBlock(const std::string& title,
              const std::vector<std::pair<std::string, std::string>>& rows);

// Summary block written after each operator runs.
struct OperationSummary {
    std::string module;       // e.g. "TransferVertexGroups", "DeleteUnusedBones"
    std::string object;       // active mesh or pruned skeleton
    std::string status;       // "Finished" / "Cancelled"
    int affected = 0;         // objects transferred, groups or bones removed
    int failed   = 0;
    std::vector<std::string> notes; // optional extra lines
};
void logSummary(const OperationSummary& summary);

} // namespace PluginLog
