#pragma once

#include "DataStructures.hpp"
#include <map>
#include <string>
#include <vector>

namespace sigproj {
namespace scoring {

// Normalization and score method used for one kind of model
struct KindScoringConfig {
    NormalizationMethod normalization;
    ScoreMethod method;
};

// EXPRESSION follows the configured methods, PROBABILITY is always scored unnormalized and naive
KindScoringConfig scoringConfigFor(ModelKind kind, const AnalysisParameters& params);

// Scores one signature against (normalized) data.
// zeroLocations marks entries that were zero in the raw expression and has the data's shape.
ScoreOutcome scoreSignature(const DataMatrix& sigData,
                            const Signature& signature,
                            const BoolMatrix& zeroLocations,
                            int minSignatureGenes,
                            ScoreMethod method);

struct BatchResult {
    std::map<std::string, SignatureScore> scores;
    std::vector<CoverageSkip> skipped;
};

// Signatures are scored independently; coverage failures are collected, never thrown
BatchResult scoreSignatures(const DataMatrix& sigData,
                            const std::vector<Signature>& signatures,
                            const BoolMatrix& zeroLocations,
                            int minSignatureGenes,
                            ScoreMethod method,
                            const ProgressCallback& progress = nullptr,
                            const std::string& stage = "Scoring signatures");

// Many scores over the same samples, one column per signature.
// Labels are held once for the whole set.
struct ScoreMatrix {
    std::vector<std::string> sampleLabels;
    std::vector<std::string> names;
    std::vector<int> numGenes;
    Eigen::MatrixXd values;   // samples x signatures

    int size() const { return static_cast<int>(names.size()); }
};

// Scores straight into one matrix; signatures without enough coverage are left out
ScoreMatrix scoreSignatureMatrix(const DataMatrix& sigData,
                                 const std::vector<Signature>& signatures,
                                 const BoolMatrix& zeroLocations,
                                 int minSignatureGenes,
                                 ScoreMethod method,
                                 const ProgressCallback& progress = nullptr,
                                 const std::string& stage = "Scoring signatures");

// Fraction of zero entries in each sample (column)
Eigen::VectorXd zeroProportion(const Eigen::MatrixXd& data);

ScoreMethod parseMethod(const std::string& name);
std::string methodName(ScoreMethod method);
std::vector<std::string> availableMethods();

} // namespace scoring
} // namespace sigproj
