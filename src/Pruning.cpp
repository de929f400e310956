#include "Pruning.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace sigproj {
namespace pruning {

void checkConsistency(const Model& model) {
    for (const auto& projData : model.projectionData) {
        auto rows = static_cast<Eigen::Index>(projData.signatureKeys.size());
        if (projData.sigProjMatrix.rows() != rows || projData.sigProjMatrixP.rows() != rows) {
            throw ConsistencyError("Model " + model.name + ", filter " + projData.filter +
                                   ": signature keys and sig-proj matrix rows differ");
        }
        auto cols = static_cast<Eigen::Index>(projData.projectionKeys.size());
        if (rows > 0 && (projData.sigProjMatrix.cols() != cols || projData.sigProjMatrixP.cols() != cols)) {
            throw ConsistencyError("Model " + model.name + ", filter " + projData.filter +
                                   ": projection keys and sig-proj matrix columns differ");
        }
        for (const auto& key : projData.signatureKeys) {
            if (model.signatureScores.find(key) == model.signatureScores.end()) {
                throw ConsistencyError("Model " + model.name + ", filter " + projData.filter +
                                       ": signature " + key + " has no score");
            }
        }
    }
}

std::map<std::string, double> minimumSignificance(const Model& model) {
    checkConsistency(model);

    std::map<std::string, double> significance;
    for (const auto& entry : model.signatureScores) {
        significance[entry.first] = 0.0;
    }

    std::map<std::string, bool> seen;
    for (const auto& projData : model.projectionData) {
        for (size_t r = 0; r < projData.signatureKeys.size(); ++r) {
            if (projData.sigProjMatrixP.cols() == 0) {
                continue;
            }
            const std::string& key = projData.signatureKeys[r];
            double rowMin = projData.sigProjMatrixP.row(r).minCoeff();
            if (!seen[key]) {
                significance[key] = rowMin;
                seen[key] = true;
            } else {
                significance[key] = std::min(significance[key], rowMin);
            }
        }
    }
    return significance;
}

std::set<std::string> selectSignatures(const Model& model, const PruneOptions& options) {
    std::set<std::string> keep;
    if (options.keepAll) {
        for (const auto& entry : model.signatureScores) {
            keep.insert(entry.first);
        }
        return keep;
    }

    std::map<std::string, double> significance = minimumSignificance(model);

    std::vector<std::pair<double, std::string>> ranking;
    for (const auto& entry : model.signatureScores) {
        if (entry.second.isPrecomputed) {
            keep.insert(entry.first);
        } else {
            ranking.push_back({significance[entry.first], entry.first});
        }
    }
    std::sort(ranking.begin(), ranking.end());

    int limit = std::min<int>(OUTPUT_SIGNATURE_LIMIT, ranking.size());
    int kept = limit;
    if (options.totalSamples <= LARGE_DATASET_SAMPLES) {
        int passing = 0;
        while (passing < static_cast<int>(ranking.size()) &&
               ranking[passing].first <= DEFAULT_LOG_P_THRESHOLD) {
            ++passing;
        }
        kept = std::max(passing, limit);
    }

    for (int i = 0; i < kept; ++i) {
        keep.insert(ranking[i].second);
    }
    return keep;
}

Model applySelection(const Model& model, const std::set<std::string>& keep) {
    checkConsistency(model);

    Model pruned = model;
    pruned.signatureScores.clear();
    for (const auto& entry : model.signatureScores) {
        if (keep.count(entry.first)) {
            pruned.signatureScores.insert(entry);
        }
    }

    for (auto& projData : pruned.projectionData) {
        std::vector<int> rows;
        std::vector<std::string> keys;
        for (size_t r = 0; r < projData.signatureKeys.size(); ++r) {
            if (keep.count(projData.signatureKeys[r])) {
                rows.push_back(static_cast<int>(r));
                keys.push_back(projData.signatureKeys[r]);
            }
        }

        Eigen::MatrixXd consistency(rows.size(), projData.sigProjMatrix.cols());
        Eigen::MatrixXd logP(rows.size(), projData.sigProjMatrixP.cols());
        for (size_t i = 0; i < rows.size(); ++i) {
            consistency.row(i) = projData.sigProjMatrix.row(rows[i]);
            logP.row(i) = projData.sigProjMatrixP.row(rows[i]);
        }
        projData.sigProjMatrix = consistency;
        projData.sigProjMatrixP = logP;
        projData.signatureKeys = keys;
    }

    checkConsistency(pruned);
    return pruned;
}

Model pruneModel(const Model& model, const PruneOptions& options) {
    return applySelection(model, selectSignatures(model, options));
}

} // namespace pruning
} // namespace sigproj
