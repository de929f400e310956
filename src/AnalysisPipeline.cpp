#include "AnalysisPipeline.hpp"
#include "BackgroundSignatures.hpp"
#include "ClusteringMethods.hpp"
#include "Filters.hpp"
#include "Normalization.hpp"
#include "Pruning.hpp"
#include "SignatureScoring.hpp"
#include "Significance.hpp"
#include "Transforms.hpp"
#include <algorithm>
#include <iostream>

namespace sigproj {

namespace {

constexpr double DEFAULT_THRESHOLD_FRACTION = 0.2;
constexpr int NUM_LOADINGS = 3;

std::mt19937 seededGenerator(const AnalysisParameters& params) {
    if (params.randomSeed) {
        return std::mt19937(*params.randomSeed);
    }
    std::random_device device;
    return std::mt19937(device());
}

} // namespace

AnalysisPipeline::AnalysisPipeline(DataMatrix expression,
                                   std::vector<Signature> signatures,
                                   AnalysisParameters params)
    : expression(std::move(expression)),
      signatures(std::move(signatures)),
      params(std::move(params)),
      rng(seededGenerator(this->params)) {
}

AnalysisPipeline::~AnalysisPipeline() = default;

void AnalysisPipeline::setPrecomputedSignatures(std::map<std::string, SignatureScore> scores) {
    for (auto& entry : scores) {
        entry.second.isPrecomputed = true;
        entry.second.numGenes = 0;
    }
    precomputed = std::move(scores);
}

void AnalysisPipeline::validateParameters(const AnalysisParameters& params) {
    if (params.subsampleSize && *params.subsampleSize < 1) {
        throw ConfigurationError("Sub-sample size must be positive");
    }
    if (params.threshold && *params.threshold < 0) {
        throw ConfigurationError("Threshold must be non-negative");
    }
    if (params.qcNmads <= 0.0) {
        throw ConfigurationError("QC MAD multiplier must be positive");
    }
    if (params.minSignatureGenes < 1) {
        throw ConfigurationError("Minimum signature genes must be at least 1");
    }
    if (params.backgroundRepetitions < 0) {
        throw ConfigurationError("Background repetitions must be non-negative");
    }
    for (int size : params.backgroundSizes) {
        if (size < 1) {
            throw ConfigurationError("Background signature sizes must be positive");
        }
    }
    if (params.pcaComponents < 2) {
        throw ConfigurationError("At least two principal components are required");
    }
    if (params.neighborhoodSize <= 0.0) {
        throw ConfigurationError("Neighborhood size must be positive");
    }
    if (params.factorPermutations < 0) {
        throw ConfigurationError("Factor permutations must be non-negative");
    }

    std::vector<std::string> methods = clustering::ClusteringMethodFactory::availableMethods();
    for (const auto& method : params.clusterMethods) {
        if (std::find(methods.begin(), methods.end(), method) == methods.end()) {
            throw ConfigurationError("Unknown clustering method: " + method);
        }
    }
    for (int count : params.clusterCounts) {
        if (count < 1) {
            throw ConfigurationError("Cluster counts must be positive");
        }
    }

    // Both lookups throw for values outside the enums
    normalization::methodName(params.sigNormMethod);
    scoring::methodName(params.sigScoreMethod);
}

void AnalysisPipeline::logStage(const std::string& message) const {
    if (params.verbose) {
        std::cout << message << "\n";
    }
}

template <typename Func>
auto AnalysisPipeline::runStage(const std::string& stage, Func&& func) const -> decltype(func()) {
    try {
        return func();
    }
    catch (const ConsistencyError&) {
        throw;
    }
    catch (const StageError&) {
        throw;
    }
    catch (const std::exception& e) {
        throw StageError(stage, e.what());
    }
}

DataMatrix AnalysisPipeline::filterStage(const DataMatrix& working) {
    int threshold = params.threshold.value_or(
        static_cast<int>(DEFAULT_THRESHOLD_FRACTION * working.numSamples()));

    logStage("Applying filters (threshold " + std::to_string(threshold) + " samples)...");
    DataMatrix filtered = filters::applyFilters(working, threshold, params.noFilter, params.lean, &warnings);
    if (filtered.filters.empty()) {
        throw ProcessingError("Every gene filter is empty");
    }
    for (const auto& name : filtered.filterNames()) {
        logStage("  " + name + ": " + std::to_string(filtered.filteredGenes(name).size()) + " genes");
    }
    return filtered;
}

AnalysisPipeline::QCStageResult AnalysisPipeline::qualityControlStage(const DataMatrix& filtered) {
    QCStageResult result;
    result.report.sampleLabels = filtered.sampleLabels;

    Model expressionModel;
    expressionModel.name = modelKindName(ModelKind::EXPRESSION);
    expressionModel.kind = ModelKind::EXPRESSION;
    expressionModel.data = filtered;

    if (params.noModel) {
        logStage("Probabilistic model disabled; skipping quality control");
        if (inputWeights) {
            addWarning("Input weights are ignored when the probabilistic model is disabled");
        }
        if (params.probabilityModel) {
            addWarning("Probability model requested with the probabilistic model disabled; skipping it");
        }
        result.report.scores.assign(filtered.numSamples(), 0.0);
        result.report.passes.assign(filtered.numSamples(), true);
        expressionModel.sampleLabels = filtered.sampleLabels;
        result.models.push_back(expressionModel);
        return result;
    }

    logStage("Creating false-negative map...");
    transforms::FalseNegativeModel falseNegative =
        transforms::FalseNegativeModel::fit(filtered, housekeepingGenes, &warnings);

    Eigen::MatrixXd weights;
    if (inputWeights) {
        logStage("Aligning input weights...");
        weights = transforms::alignWeights(*inputWeights, filtered);
    } else {
        logStage("Computing weights from false-negative curves...");
        weights = transforms::computeWeights(falseNegative, filtered);
    }
    expressionModel.data.weights = weights;

    transforms::QualityCheck check = transforms::qualityCheck(falseNegative, params.qcNmads);
    result.report.scores.assign(check.scores.data(), check.scores.data() + check.scores.size());
    result.report.passes = check.passes;

    result.fit.falseNegative = falseNegative;
    result.fit.geneLevels = transforms::detectedGeneLevels(filtered.values);
    result.fit.qcCutoff = check.cutoff;
    result.fit.inputWeights = inputWeights ? &*inputWeights : nullptr;

    result.models.push_back(expressionModel);

    logStage("Fitting expression data to exp/norm mixture model...");
    transforms::ProbabilityFit fit = transforms::probabilityOfExpression(filtered);
    result.fit.probability = fit.parameters;
    result.report.mixture = transforms::summarizeMixture(fit.parameters);

    if (params.probabilityModel) {
        logStage("Adjusting probabilities for false negatives...");
        Eigen::MatrixXd adjusted = transforms::adjustProbabilities(fit.probabilities, weights, filtered.values);

        Model probabilityModel;
        probabilityModel.name = modelKindName(ModelKind::PROBABILITY);
        probabilityModel.kind = ModelKind::PROBABILITY;
        probabilityModel.data = DataMatrix(adjusted, filtered.geneNames, filtered.sampleLabels, DataKind::PROBABILITY);
        probabilityModel.data.weights = weights;
        probabilityModel.data.filters = filtered.filters;
        result.models.push_back(probabilityModel);
    }

    if (params.qcFilter) {
        int passing = result.report.numPassing();
        logStage("Removing " + std::to_string(filtered.numSamples() - passing) + " samples failing QC...");
        if (passing == 0) {
            throw ProcessingError("No sample passes quality control");
        }

        QCReport narrowed;
        narrowed.mixture = result.report.mixture;
        for (size_t s = 0; s < result.report.size(); ++s) {
            if (result.report.passes[s]) {
                narrowed.sampleLabels.push_back(result.report.sampleLabels[s]);
                narrowed.scores.push_back(result.report.scores[s]);
                narrowed.passes.push_back(true);
            }
        }
        for (auto& model : result.models) {
            model.data = model.data.subsetSamples(result.report.passes);
        }
        result.report = narrowed;
    }

    for (auto& model : result.models) {
        model.sampleLabels = model.data.sampleLabels;
    }
    return result;
}

AnalysisPipeline::BackgroundScores AnalysisPipeline::scoringStage(std::vector<Model>& models,
                                                                  const QCReport& report) {
    const Model& expressionModel = models.front();

    std::vector<Signature> background;
    if (fixedBackground) {
        background = *fixedBackground;
    } else {
        logStage("Generating background signatures...");
        background = generateBackgroundSignatures(expressionModel.data.geneNames, params.backgroundSizes,
                                                  params.backgroundRepetitions, rng, &warnings);
    }

    // Zeros of the raw expression mark missing entries for every model kind
    BoolMatrix zeros = expressionModel.data.zeroLocations();
    Eigen::VectorXd zeroFraction = scoring::zeroProportion(expressionModel.data.values);

    BackgroundScores backgroundScores;
    for (auto& model : models) {
        scoring::KindScoringConfig config = scoring::scoringConfigFor(model.kind, params);
        logStage("Scoring signatures for " + model.name + " data (" +
                 normalization::methodName(config.normalization) + ", " +
                 scoring::methodName(config.method) + ")...");

        DataMatrix sigData = model.data;
        sigData.values = normalization::normalize(model.data.values, config.normalization);

        scoring::BatchResult real = scoring::scoreSignatures(sigData, signatures, zeros, params.minSignatureGenes,
                                                             config.method, progress, "Scoring signatures");
        if (!real.skipped.empty()) {
            addWarning(std::to_string(real.skipped.size()) + " signatures skipped in " + model.name +
                       " data: fewer than " + std::to_string(params.minSignatureGenes) + " genes found");
        }
        model.signatureScores = real.scores;

        backgroundScores[model.name] = scoring::scoreSignatureMatrix(sigData, background, zeros,
                                                                     params.minSignatureGenes, config.method,
                                                                     progress, "Scoring background signatures");

        if (!params.noModel) {
            Eigen::VectorXd quality = Eigen::Map<const Eigen::VectorXd>(report.scores.data(), report.scores.size());
            model.signatureScores[QUALITY_SCORE_NAME] =
                SignatureScore(QUALITY_SCORE_NAME, report.sampleLabels, quality, false, true, 0);
        }
        model.signatureScores[ZERO_PROPORTION_NAME] =
            SignatureScore(ZERO_PROPORTION_NAME, model.sampleLabels, zeroFraction, false, true, 0);
        for (const auto& entry : precomputed) {
            model.signatureScores[entry.first] = entry.second.subset(model.sampleLabels);
        }
    }
    return backgroundScores;
}

ProjectionData AnalysisPipeline::analyzeRepresentation(const Model& model,
                                                       const std::string& filter,
                                                       const DataMatrix& representation,
                                                       const std::map<std::string, Eigen::MatrixXd>& projections,
                                                       const scoring::ScoreMatrix& background) const {
    ProjectionData record;
    record.filter = filter;
    record.genes = representation.geneNames;
    record.pca = representation.kind == DataKind::PRINCIPAL_COMPONENTS;
    record.projections = projections;

    record.clusters = runStage("Clustering", [&] {
        return clustering::defineClusters(projections, params);
    });

    significance::SigProjResult sigProj = runStage("Significance", [&] {
        return significance::sigsVsProjections(projections, model.sampleLabels, model.signatureScores,
                                               background, params);
    });
    record.sigProjMatrix = sigProj.consistency;
    record.sigProjMatrixP = sigProj.logPValues;
    record.signatureKeys = sigProj.signatureKeys;
    record.projectionKeys = sigProj.projectionKeys;
    return record;
}

std::vector<ProjectionData> AnalysisPipeline::projectionStage(const Model& model,
                                                              const scoring::ScoreMatrix& background) {
    std::vector<ProjectionData> records;
    for (const auto& filter : model.data.filterNames()) {
        DataMatrix filterData = model.data.filtered(filter);

        logStage("Projecting " + model.name + " data onto 2 dimensions (filter " + filter + ")...");
        projections::ProjectionResult raw = runStage("Projection", [&] {
            return projections::generateProjections(filterData, params,
                                                    inputProjections.empty() ? nullptr : &inputProjections);
        });
        records.push_back(analyzeRepresentation(model, filter, filterData, raw.projections, background));

        logStage("Projecting PCA-reduced " + model.name + " data (filter " + filter + ")...");
        projections::ProjectionResult reduced = runStage("Projection", [&] {
            return projections::generateProjections(raw.reduced, params);
        });
        ProjectionData pcaRecord = analyzeRepresentation(model, filter, raw.reduced, reduced.projections, background);
        pcaRecord.genes = filterData.geneNames;
        pcaRecord.loadings = raw.reduced.loadings.leftCols(
            std::min<Eigen::Index>(NUM_LOADINGS, raw.reduced.loadings.cols()));
        records.push_back(pcaRecord);
    }
    return records;
}

void AnalysisPipeline::reorderGenesStage(std::vector<Model>& models) const {
    for (auto& model : models) {
        if (model.kind != ModelKind::EXPRESSION) {
            continue;
        }
        logStage("Reordering genes by hierarchical clustering...");
        clustering::HierarchicalClustering linkage;
        model.data = model.data.subsetGenes(linkage.leafOrder(model.data.values));
    }
}

AnalysisResult AnalysisPipeline::run() {
    validateParameters(params);
    warnings.clear();

    if (expression.numGenes() == 0 || expression.numSamples() == 0) {
        throw ProcessingError("Expression matrix is empty");
    }
    int totalSamples = expression.numSamples();

    subsample::SampleSplit split = runStage("Subsample", [&] {
        if (!params.subsampleSize) {
            return subsample::SampleSplit{expression.subsetSamples(std::vector<std::string>{}), expression};
        }
        logStage("Sub-sampling " + std::to_string(*params.subsampleSize) + " of " +
                 std::to_string(totalSamples) + " samples...");
        return subsample::splitSamples(expression, *params.subsampleSize, rng);
    });

    DataMatrix filtered = runStage("Filter", [&] { return filterStage(split.working); });

    QCStageResult qc = runStage("QC", [&] { return qualityControlStage(filtered); });
    std::vector<Model> models = qc.models;

    BackgroundScores background = runStage("Score", [&] { return scoringStage(models, qc.report); });

    for (auto& model : models) {
        model.projectionData = projectionStage(model, background[model.name]);
        background.erase(model.name);
    }

    logStage("Pruning signatures...");
    pruning::PruneOptions pruneOptions;
    pruneOptions.keepAll = params.allSigs;
    pruneOptions.totalSamples = totalSamples;
    for (auto& model : models) {
        model = runStage("Prune", [&] { return pruning::pruneModel(model, pruneOptions); });
    }

    AnalysisResult result;
    result.qc = qc.report;

    if (split.holdout.numSamples() > 0) {
        logStage("Merging " + std::to_string(split.holdout.numSamples()) + " held-out samples...");
        subsample::MergeResult merged = runStage("MergeHoldouts", [&] {
            DataMatrix holdout = split.holdout;
            holdout.filters = filtered.filters;
            return subsample::mergeSamples(holdout, models, signatures, precomputed, qc.fit, params);
        });
        models = merged.models;

        const QCReport& extra = merged.holdoutQC;
        result.qc.sampleLabels.insert(result.qc.sampleLabels.end(), extra.sampleLabels.begin(), extra.sampleLabels.end());
        result.qc.scores.insert(result.qc.scores.end(), extra.scores.begin(), extra.scores.end());
        result.qc.passes.insert(result.qc.passes.end(), extra.passes.begin(), extra.passes.end());
    }

    if (params.reorderGenes) {
        runStage("ReorderGenes", [&] { reorderGenesStage(models); });
    }

    for (const auto& model : models) {
        pruning::checkConsistency(model);
    }

    result.models = models;
    result.warnings = warnings;
    logStage("Analysis complete");
    return result;
}

} // namespace sigproj
