#pragma once
#ifndef TOOLOPTIONS_H
#define TOOLOPTIONS_H

#include <string>

// User-tunable defaults. Command flags override these per invocation.
struct ToolOptions {
    bool duplicateSkeleton = true;   // copy the skeleton before deleting bones
    std::string logDirOverride;      // OUTFITRIG_LOG_DIR; empty = host default

    static const char* kLogDirEnv;

    // Defaults with environment overrides applied.
    static ToolOptions fromEnvironment();

    // Directory for OutfitRig.log: the override when set, otherwise
    // <hostAppDir>/OutfitRig, otherwise $TEMP/$TMPDIR/OutfitRig.
    std::string resolveLogDir(const std::string& hostAppDir) const;
};

#endif // TOOLOPTIONS_H
