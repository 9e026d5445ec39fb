#pragma once
#include <stdexcept>
#include <string>

class HexGuardError : public std::runtime_error {
public:
    explicit HexGuardError(const std::string& msg) : std::runtime_error(msg) {}
};

// Candidate file missing, unreadable, too large, or failed mid-read.
class FileReadError : public HexGuardError {
public:
    explicit FileReadError(const std::string& msg) : HexGuardError(msg) {}
};

// Magic bytes or container structure do not confirm the declared extension.
class ValidationError : public HexGuardError {
public:
    explicit ValidationError(const std::string& msg) : HexGuardError(msg) {}
};

class SignatureNotFound : public HexGuardError {
public:
    explicit SignatureNotFound(const std::string& msg) : HexGuardError(msg) {}
};

class DuplicateSignature : public HexGuardError {
public:
    explicit DuplicateSignature(const std::string& msg) : HexGuardError(msg) {}
};

class InvalidInput : public HexGuardError {
public:
    explicit InvalidInput(const std::string& msg) : HexGuardError(msg) {}
};

// A pattern already in the store is not valid hex.
class InvalidSignature : public HexGuardError {
public:
    explicit InvalidSignature(const std::string& msg) : HexGuardError(msg) {}
};

class StoreError : public HexGuardError {
public:
    explicit StoreError(const std::string& msg) : HexGuardError(msg) {}
};
