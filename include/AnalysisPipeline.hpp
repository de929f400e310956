#pragma once

#include "DataStructures.hpp"
#include "Errors.hpp"
#include "Projections.hpp"
#include "SignatureScoring.hpp"
#include "SubSample.hpp"
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace sigproj {

class AnalysisPipeline {
public:
    AnalysisPipeline(DataMatrix expression,
                     std::vector<Signature> signatures,
                     AnalysisParameters params);
    ~AnalysisPipeline();

    // Optional inputs
    void setHousekeepingGenes(std::vector<std::string> genes) { housekeepingGenes = std::move(genes); }
    void setPrecomputedSignatures(std::map<std::string, SignatureScore> scores);
    void setInputWeights(DataMatrix weights) { inputWeights = std::move(weights); }
    void setInputProjections(projections::InputProjections projections) { inputProjections = std::move(projections); }
    void setProgressCallback(ProgressCallback callback) { progress = std::move(callback); }

    // Replaces the generator seeded from the parameters
    void setRandomSource(std::mt19937 source) { rng = source; }

    // A fixed null set skips background generation
    void setBackgroundSignatures(std::vector<Signature> background) { fixedBackground = std::move(background); }

    // Runs every stage; throws StageError naming the stage that failed
    AnalysisResult run();

    const std::vector<std::string>& getWarnings() const { return warnings; }

    // Throws ConfigurationError for invalid options
    static void validateParameters(const AnalysisParameters& params);

private:
    DataMatrix expression;
    std::vector<Signature> signatures;
    AnalysisParameters params;

    std::vector<std::string> housekeepingGenes;
    std::map<std::string, SignatureScore> precomputed;
    std::optional<DataMatrix> inputWeights;
    projections::InputProjections inputProjections;
    std::optional<std::vector<Signature>> fixedBackground;
    ProgressCallback progress;
    std::mt19937 rng;

    std::vector<std::string> warnings;

    struct QCStageResult {
        std::vector<Model> models;
        QCReport report;
        subsample::WorkingSetFit fit;
    };

    // model name -> background scores over the model's samples
    using BackgroundScores = std::map<std::string, scoring::ScoreMatrix>;

    // Stages
    DataMatrix filterStage(const DataMatrix& working);
    QCStageResult qualityControlStage(const DataMatrix& filtered);
    BackgroundScores scoringStage(std::vector<Model>& models, const QCReport& report);
    std::vector<ProjectionData> projectionStage(const Model& model, const scoring::ScoreMatrix& background);
    void reorderGenesStage(std::vector<Model>& models) const;

    ProjectionData analyzeRepresentation(const Model& model,
                                         const std::string& filter,
                                         const DataMatrix& representation,
                                         const std::map<std::string, Eigen::MatrixXd>& projections,
                                         const scoring::ScoreMatrix& background) const;

    template <typename Func>
    auto runStage(const std::string& stage, Func&& func) const -> decltype(func());

    void logStage(const std::string& message) const;
    void addWarning(const std::string& warning) { warnings.push_back(warning); }
};

} // namespace sigproj
