#pragma once
#ifndef DELETEUNUSEDVERTEXGROUPSCMD_H
#define DELETEUNUSEDVERTEXGROUPSCMD_H

#include <maya/MPxCommand.h>
#include <maya/MSyntax.h>
#include <maya/MArgList.h>

class DeleteUnusedVertexGroupsCmd : public MPxCommand {
public:
    DeleteUnusedVertexGroupsCmd();
    ~DeleteUnusedVertexGroupsCmd() override;

    MStatus doIt(const MArgList& args) override;

    static void* creator();
    static MSyntax newSyntax();

    static const char* kCommandName;
};

#endif // DELETEUNUSEDVERTEXGROUPSCMD_H
