#pragma once
#ifndef DELETEUNUSEDBONESCMD_H
#define DELETEUNUSEDBONESCMD_H

#include <maya/MPxCommand.h>
#include <maya/MSyntax.h>
#include <maya/MArgList.h>

class DeleteUnusedBonesCmd : public MPxCommand {
public:
    DeleteUnusedBonesCmd();
    ~DeleteUnusedBonesCmd() override;

    MStatus doIt(const MArgList& args) override;

    static void* creator();
    static MSyntax newSyntax();

    static const char* kCommandName;
};

#endif // DELETEUNUSEDBONESCMD_H
