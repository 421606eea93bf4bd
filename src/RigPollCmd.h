#pragma once
#ifndef RIGPOLLCMD_H
#define RIGPOLLCMD_H

#include <maya/MPxCommand.h>
#include <maya/MSyntax.h>
#include <maya/MArgList.h>

class RigPollCmd : public MPxCommand {
public:
    RigPollCmd();
    ~RigPollCmd() override;

    MStatus doIt(const MArgList& args) override;

    static void* creator();
    static MSyntax newSyntax();

    static const char* kCommandName;
};

#endif // RIGPOLLCMD_H
