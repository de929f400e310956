#pragma once

#include "DataStructures.hpp"
#include <map>
#include <set>
#include <string>

namespace sigproj {
namespace pruning {

constexpr int OUTPUT_SIGNATURE_LIMIT = 200;
constexpr int LARGE_DATASET_SAMPLES = 2000;
constexpr double DEFAULT_LOG_P_THRESHOLD = -1.3010299956639813;   // log10(0.05)

struct PruneOptions {
    bool keepAll = false;
    int totalSamples = 0;   // Sample count of the input, before sub-sampling
};

// Minimum log10 p-value of each signature over every ProjectionData of the model.
// Signatures without any row are reported as 0 (p = 1).
std::map<std::string, double> minimumSignificance(const Model& model);

// Names of the signatures that survive, precomputed scores included.
// Eligible signatures are ranked by (minimum log10 p, name); large datasets keep
// exactly the first K, others keep everything at or under the default threshold
// and fall back to exactly the first K when that leaves fewer than K.
std::set<std::string> selectSignatures(const Model& model, const PruneOptions& options);

// Removes dropped signatures from the score map and from every ProjectionData
Model applySelection(const Model& model, const std::set<std::string>& keep);

Model pruneModel(const Model& model, const PruneOptions& options);

// Throws ConsistencyError unless keys, matrix rows and score names line up
void checkConsistency(const Model& model);

} // namespace pruning
} // namespace sigproj
