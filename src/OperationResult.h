#pragma once
#ifndef OPERATIONRESULT_H
#define OPERATIONRESULT_H

#include <string>

enum class OperationStatus {
    Finished,
    Cancelled
};

enum class Severity {
    Info,
    Warning,
    Error
};

// Outcome reported back to the host command layer.
struct OperationResult {
    OperationStatus status = OperationStatus::Finished;
    Severity severity = Severity::Info;
    std::string message;

    bool finished() const { return status == OperationStatus::Finished; }

    static OperationResult info(const std::string& msg)
    {
        return OperationResult{OperationStatus::Finished, Severity::Info, msg};
    }

    static OperationResult cancelled(const std::string& msg)
    {
        return OperationResult{OperationStatus::Cancelled, Severity::Error, msg};
    }
};

#endif // OPERATIONRESULT_H
