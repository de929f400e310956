#pragma once

#include "DataMatrix.hpp"
#include <string>
#include <vector>

namespace sigproj {
namespace filters {

constexpr const char* NO_FILTER = "No_Filter";
constexpr const char* THRESHOLD_FILTER = "Threshold";
constexpr const char* HDT_FILTER = "HDT";

// Returns a copy of the matrix with named gene filters attached.
// Empty filters are left out and reported through warnings.
DataMatrix applyFilters(const DataMatrix& data,
                        int threshold,
                        bool disable,
                        bool lean,
                        std::vector<std::string>* warnings = nullptr);

// Genes detected (non-zero) in at least `threshold` samples
std::vector<std::string> thresholdFilter(const DataMatrix& data, int threshold);

// Genes whose log Fano factor is high relative to genes of similar mean
std::vector<std::string> highDispersionFilter(const DataMatrix& data,
                                              const std::vector<std::string>& candidates,
                                              int numBins = 30,
                                              double zCutoff = 1.65);

} // namespace filters
} // namespace sigproj
