#include "ToolOptions.h"

#include <cstdlib>

const char* ToolOptions::kLogDirEnv = "OUTFITRIG_LOG_DIR";

static std::string withTrailingSlash(std::string dir) {
    if (!dir.empty() && dir.back() != '/' && dir.back() != '\\')
        dir.push_back('/');
    return dir;
}

ToolOptions ToolOptions::fromEnvironment()
{
    ToolOptions opts;
    const char* dir = std::getenv(kLogDirEnv);
    if (dir && *dir) opts.logDirOverride = dir;
    return opts;
}

std::string ToolOptions::resolveLogDir(const std::string& hostAppDir) const
{
    if (!logDirOverride.empty()) return logDirOverride;
    if (!hostAppDir.empty()) return withTrailingSlash(hostAppDir) + "OutfitRig";

    const char* temp = std::getenv("TEMP");
    if (!temp || !*temp) temp = std::getenv("TMP");
    if (!temp || !*temp) temp = std::getenv("TMPDIR");
    if (!temp || !*temp) temp = ".";
    return withTrailingSlash(temp) + "OutfitRig";
}
