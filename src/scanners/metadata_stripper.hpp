#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "access_validator.hpp"
#include "scan_policy.hpp"

// Rewrites an image without descriptive metadata. JPEG loses APP1..APP15
// (APP2 ICC profiles are kept) and COM segments, PNG loses tEXt, zTXt,
// iTXt, eXIf and tIME chunks; both are truncated after their end marker.
// Other formats are reported as unsupported.
bool stripMetadata(const std::vector<uint8_t>& in, std::vector<uint8_t>& out, std::string& error);

// File variant: the source goes through the access validator and the size
// guard before it is read.
bool stripMetadataFile(const AccessValidator& access, const std::string& inPath, const std::string& outPath,
                       const ScanPolicy& policy, std::string& error);
