#pragma once
#include "validationresult.hpp"
#include <iostream>
#include <string>

class SignatureStore;
struct AppConfig;

struct ScanSummary {
    size_t valid = 0;
    size_t invalid = 0;
    size_t errors = 0;
};

void printValidationResult(const ValidationOutcome& outcome, bool verbose, std::ostream& out = std::cout);
void printFileHash(const std::string& filePath, const std::string& digest, std::ostream& out = std::cout);
void printInfo(const std::string& msg, std::ostream& out = std::cout);
void printError(const std::string& msg, std::ostream& out = std::cerr);
void printSignatureList(SignatureStore& store, std::ostream& out = std::cout);
void printStatus(SignatureStore& store, const AppConfig& config, bool verbose, std::ostream& out = std::cout);
void printScanSummary(const ScanSummary& summary, std::ostream& out = std::cout);

// Category used by the signature listing; "Other" for anything unlisted.
std::string categoryOf(const std::string& extension);
