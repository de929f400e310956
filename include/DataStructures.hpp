#pragma once

#include "DataMatrix.hpp"
#include "Signatures.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sigproj {

enum class NormalizationMethod {
    NONE,
    ZNORM_COLUMNS,
    ZNORM_ROWS,
    ZNORM_ROWS_THEN_COLUMNS,
    RANK_NORM_COLUMNS
};

enum class ScoreMethod {
    NAIVE,
    WEIGHTED_AVG,
    IMPUTED,
    ONLY_NONZERO
};

enum class ModelKind {
    EXPRESSION,
    PROBABILITY
};

// stage, progress, total
using ProgressCallback = std::function<void(const std::string&, int, int)>;

// Parameters for the whole analysis run
struct AnalysisParameters {
    // Sampling and filtering
    std::optional<int> subsampleSize;
    std::optional<int> threshold;   // Defaults to 20% of the working samples
    bool noFilter = false;
    bool lean = false;

    // Probabilistic model and quality control
    bool noModel = false;
    bool qcFilter = false;
    bool probabilityModel = false;
    double qcNmads = 3.0;

    // Signature scoring
    NormalizationMethod sigNormMethod = NormalizationMethod::ZNORM_ROWS;
    ScoreMethod sigScoreMethod = ScoreMethod::WEIGHTED_AVG;
    int minSignatureGenes = 5;
    std::vector<int> backgroundSizes = {5, 10, 20, 50, 100, 200};
    int backgroundRepetitions = 3000;

    // Projections, clusters and significance
    int pcaComponents = 30;
    double neighborhoodSize = 0.33;
    std::vector<std::string> clusterMethods = {"kmeans"};
    std::vector<int> clusterCounts = {2, 3, 4, 5, 6};
    int factorPermutations = 100;

    // Output
    bool allSigs = false;
    bool reorderGenes = true;

    std::optional<uint32_t> randomSeed;
    bool verbose = false;
};

// projection name -> cluster method -> label per sample
using ClusterMap = std::map<std::string, std::map<std::string, std::vector<int>>>;

// Projections and signature significance for one (filter, representation) pair
struct ProjectionData {
    std::string filter;
    std::vector<std::string> genes;
    bool pca = false;

    // projection name -> samples x 2 coordinates
    std::map<std::string, Eigen::MatrixXd> projections;
    ClusterMap clusters;

    // Rows follow signatureKeys, columns follow projectionKeys
    Eigen::MatrixXd sigProjMatrix;
    Eigen::MatrixXd sigProjMatrixP;   // log10 p-values
    std::vector<std::string> signatureKeys;
    std::vector<std::string> projectionKeys;

    // First three PCA loadings, genes x 3; empty unless pca
    Eigen::MatrixXd loadings;
};

struct Model {
    std::string name;
    ModelKind kind = ModelKind::EXPRESSION;
    DataMatrix data;
    std::map<std::string, SignatureScore> signatureScores;
    std::vector<std::string> sampleLabels;
    std::vector<ProjectionData> projectionData;
};

// Gene-averaged parameters of the detected/non-detected mixture
struct MixtureSummary {
    double muHigh = 0.0;
    double muLow = 0.0;
    double sigmaHigh = 0.0;
    double mixtureWeight = 0.0;
};

// Per-sample quality score and pass decision
struct QCReport {
    std::vector<std::string> sampleLabels;
    std::vector<double> scores;
    std::vector<bool> passes;

    // Unset when the probabilistic model is disabled
    std::optional<MixtureSummary> mixture;

    size_t size() const { return sampleLabels.size(); }
    int numPassing() const;
};

struct AnalysisResult {
    std::vector<Model> models;
    QCReport qc;
    std::vector<std::string> warnings;

    // Throws ProcessingError when no model has this name
    const Model& model(const std::string& name) const;
};

// Names of the scores injected into every model
constexpr const char* QUALITY_SCORE_NAME = "FP_Quality";
constexpr const char* ZERO_PROPORTION_NAME = "Zero_Proportion";

std::string modelKindName(ModelKind kind);

} // namespace sigproj
