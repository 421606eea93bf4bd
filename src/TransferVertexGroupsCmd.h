#pragma once
#ifndef TRANSFERVERTEXGROUPSCMD_H
#define TRANSFERVERTEXGROUPSCMD_H

#include <maya/MPxCommand.h>
#include <maya/MSyntax.h>
#include <maya/MArgList.h>

class TransferVertexGroupsCmd : public MPxCommand {
public:
    TransferVertexGroupsCmd();
    ~TransferVertexGroupsCmd() override;

    MStatus doIt(const MArgList& args) override;

    static void* creator();
    static MSyntax newSyntax();

    static const char* kCommandName;
};

#endif // TRANSFERVERTEXGROUPSCMD_H
