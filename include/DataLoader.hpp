#pragma once

#include "DataMatrix.hpp"
#include "Signatures.hpp"
#include <map>
#include <string>
#include <vector>

namespace sigproj {
namespace loading {

// Delimited text (tab or comma, detected from the header), genes in the first column
DataMatrix loadExpressionMatrix(const std::string& path);

// .gmt files hold unsigned signatures; anything else is read as name/sign/gene lines
std::vector<Signature> loadSignatures(const std::string& path);
std::vector<Signature> loadGMT(const std::string& path);
std::vector<Signature> loadSignatureTable(const std::string& path);

// One gene per line, blank lines and '#' comments ignored
std::vector<std::string> loadHousekeepingGenes(const std::string& path);

// Header holds sample labels; rows are name, type (numerical or factor), values
std::map<std::string, SignatureScore> loadPrecomputedSignatures(const std::string& path);

// +1 / -1 for plus/minus, 0 for both
int parseSign(const std::string& token);

} // namespace loading
} // namespace sigproj
