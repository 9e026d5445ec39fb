#pragma once
#include <string>
#include <cstdint>

enum class OutcomeStatus {
    Valid,
    Invalid,
    Fault
};

enum class FaultKind {
    None,
    FileRead,
    SignatureNotFound,
    InvalidSignature,
    Store
};

struct ValidationOutcome {
    OutcomeStatus status = OutcomeStatus::Invalid;
    FaultKind fault = FaultKind::None;
    std::string filePath;
    std::string extension;
    std::string message;
    std::string expectedHex;   // last pattern compared, on mismatch
    std::string actualHex;     // bytes found at offset 0, on mismatch
    bool structureFailed = false;

    bool valid() const { return status == OutcomeStatus::Valid; }
};

std::string faultKindName(FaultKind kind);
