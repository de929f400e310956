#include "AnalysisPipeline.hpp"
#include "DataLoader.hpp"
#include "Normalization.hpp"
#include "Pruning.hpp"
#include "SignatureScoring.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iomanip>
#include <map>

using namespace sigproj;

void printProgress(const std::string& stage, int progress, int total) {
    int barWidth = 50;
    float ratio = total > 0 ? static_cast<float>(progress) / total : 1.0f;
    int filled = static_cast<int>(barWidth * ratio);

    std::cout << "\r" << stage << " [";
    for (int i = 0; i < barWidth; ++i) {
        if (i < filled) std::cout << "=";
        else std::cout << " ";
    }
    std::cout << "] " << int(ratio * 100.0) << "%" << std::flush;
    if (progress >= total) {
        std::cout << "\n";
    }
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <expression_file> <signature_file>...\n"
              << "\nInputs:\n"
              << "  -k, --housekeeping FILE     Housekeeping genes, one per line\n"
              << "  -p, --precomputed FILE      Precomputed signature scores\n"
              << "  -w, --weights FILE          Per-entry weights (genes x samples)\n"
              << "\nOptions:\n"
              << "  --threshold N               Minimum samples a gene must be detected in\n"
              << "  --subsample N               Run on N samples and merge the rest afterwards\n"
              << "  --nofilter                  Use all genes\n"
              << "  --lean                      Skip the HDT filter and costlier projections\n"
              << "  --nomodel                   Skip the false-negative model and QC\n"
              << "  --qc                        Remove samples failing QC\n"
              << "  --all-sigs                  Do not prune signatures\n"
              << "  --probability-model         Also analyze the probability-of-expression data\n"
              << "  --sig-norm METHOD           none, znorm_columns, znorm_rows (default),\n"
              << "                              znorm_rows_then_columns, rank_norm_columns\n"
              << "  --sig-score METHOD          naive, weighted_avg (default), imputed, only_nonzero\n"
              << "  --min-signature-genes N     Minimum overlapping genes to score a signature\n"
              << "  --background-reps N         Background signatures per size\n"
              << "  --clusters METHOD           kmeans (default) or hierarchical\n"
              << "  --seed N                    Seed for every random step\n"
              << "  --no-reorder                Keep the input gene order\n"
              << "  -v, --verbose               Print stage messages\n";
}

int parseInt(const std::string& option, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError("Option " + option + " expects an integer, got '" + value + "'");
    }
}

void printSummary(const AnalysisResult& result) {
    std::cout << "\nAnalysis complete!\n";
    std::cout << "Samples passing QC: " << result.qc.numPassing() << " of " << result.qc.size() << "\n";
    if (result.qc.mixture) {
        const MixtureSummary& mixture = *result.qc.mixture;
        std::cout << "Mixture fit: mu_high " << mixture.muHigh << ", mu_low " << mixture.muLow
                  << ", sigma_high " << mixture.sigmaHigh << ", weight " << mixture.mixtureWeight << "\n";
    }

    for (const auto& model : result.models) {
        std::cout << "\n" << model.name << " model: "
                  << model.data.numGenes() << " genes x " << model.data.numSamples() << " samples, "
                  << model.signatureScores.size() << " signature scores\n";

        for (const auto& projData : model.projectionData) {
            std::cout << "  Filter " << projData.filter << (projData.pca ? " (PCA)" : "")
                      << ": " << projData.genes.size() << " genes, "
                      << projData.projections.size() << " projections, "
                      << projData.signatureKeys.size() << " signatures\n";
        }

        // Best p-value per retained signature
        std::map<std::string, double> significance = pruning::minimumSignificance(model);
        std::vector<std::pair<double, std::string>> ranking;
        for (const auto& entry : significance) {
            ranking.push_back({entry.second, entry.first});
        }
        std::sort(ranking.begin(), ranking.end());

        size_t shown = std::min<size_t>(10, ranking.size());
        if (shown > 0) {
            std::cout << "  Top signatures (log10 p):\n";
        }
        for (size_t i = 0; i < shown; ++i) {
            std::cout << "    " << std::left << std::setw(40) << ranking[i].second
                      << std::right << std::fixed << std::setprecision(3) << ranking[i].first << "\n";
        }
    }

    if (!result.warnings.empty()) {
        std::cout << "\nWarnings:\n";
        for (const auto& warning : result.warnings) {
            std::cout << "  " << warning << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        AnalysisParameters params;
        std::string housekeepingFile;
        std::string precomputedFile;
        std::string weightsFile;
        std::vector<std::string> positional;
        bool clustersSet = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw ConfigurationError("Option " + arg + " expects a value");
                }
                return argv[++i];
            };

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "-k" || arg == "--housekeeping") {
                housekeepingFile = next();
            } else if (arg == "-p" || arg == "--precomputed") {
                precomputedFile = next();
            } else if (arg == "-w" || arg == "--weights") {
                weightsFile = next();
            } else if (arg == "--threshold") {
                params.threshold = parseInt(arg, next());
            } else if (arg == "--subsample") {
                params.subsampleSize = parseInt(arg, next());
            } else if (arg == "--nofilter") {
                params.noFilter = true;
            } else if (arg == "--lean") {
                params.lean = true;
            } else if (arg == "--nomodel") {
                params.noModel = true;
            } else if (arg == "--qc") {
                params.qcFilter = true;
            } else if (arg == "--all-sigs") {
                params.allSigs = true;
            } else if (arg == "--probability-model") {
                params.probabilityModel = true;
            } else if (arg == "--sig-norm") {
                params.sigNormMethod = normalization::parseMethod(next());
            } else if (arg == "--sig-score") {
                params.sigScoreMethod = scoring::parseMethod(next());
            } else if (arg == "--min-signature-genes") {
                params.minSignatureGenes = parseInt(arg, next());
            } else if (arg == "--background-reps") {
                params.backgroundRepetitions = parseInt(arg, next());
            } else if (arg == "--clusters") {
                if (!clustersSet) {
                    params.clusterMethods.clear();
                    clustersSet = true;
                }
                params.clusterMethods.push_back(next());
            } else if (arg == "--seed") {
                params.randomSeed = static_cast<uint32_t>(parseInt(arg, next()));
            } else if (arg == "--no-reorder") {
                params.reorderGenes = false;
            } else if (arg == "-v" || arg == "--verbose") {
                params.verbose = true;
            } else if (!arg.empty() && arg[0] == '-') {
                throw ConfigurationError("Unknown option: " + arg);
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.size() < 2) {
            printUsage(argv[0]);
            return 1;
        }
        AnalysisPipeline::validateParameters(params);

        std::cout << "Loading data...\n";
        DataMatrix expression = loading::loadExpressionMatrix(positional[0]);
        std::vector<Signature> signatures;
        for (size_t i = 1; i < positional.size(); ++i) {
            std::vector<Signature> loaded = loading::loadSignatures(positional[i]);
            signatures.insert(signatures.end(), loaded.begin(), loaded.end());
        }
        std::cout << "Loaded " << expression.numGenes() << " genes x " << expression.numSamples()
                  << " samples and " << signatures.size() << " signatures\n";

        AnalysisPipeline pipeline(expression, signatures, params);
        if (!housekeepingFile.empty()) {
            pipeline.setHousekeepingGenes(loading::loadHousekeepingGenes(housekeepingFile));
        }
        if (!precomputedFile.empty()) {
            pipeline.setPrecomputedSignatures(loading::loadPrecomputedSignatures(precomputedFile));
        }
        if (!weightsFile.empty()) {
            pipeline.setInputWeights(loading::loadExpressionMatrix(weightsFile));
        }
        pipeline.setProgressCallback(printProgress);

        std::cout << "Running analysis...\n";
        AnalysisResult result = pipeline.run();

        printSummary(result);
        return 0;
    }
    catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
