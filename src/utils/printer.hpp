#pragma once
#include <string>
#include "scanresult.hpp"

struct cJSON;

// Caller owns the returned tree (cJSON_Delete).
cJSON* buildJson(const ScanResult& result);
std::string toJson(const ScanResult& result);
bool dumpJson(const ScanResult& result, const std::string& filename);

void printScanResult(const ScanResult& result, const std::string& inputFile, bool verbose = false);
