#pragma once

#include <Eigen/Dense>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace sigproj {

using BoolMatrix = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>;

enum class DataKind {
    EXPRESSION,
    PROBABILITY,
    PRINCIPAL_COMPONENTS
};

// Genes x samples matrix with labels, optional weights and named gene filters
struct DataMatrix {
    Eigen::MatrixXd values;  // Rows are genes, columns are samples
    std::vector<std::string> geneNames;
    std::vector<std::string> sampleLabels;
    Eigen::MatrixXd weights; // Empty until attached after QC
    std::map<std::string, std::vector<std::string>> filters;
    DataKind kind = DataKind::EXPRESSION;

    // Only set for PRINCIPAL_COMPONENTS data: genes x components
    Eigen::MatrixXd loadings;

    DataMatrix() = default;
    DataMatrix(Eigen::MatrixXd matrix,
               std::vector<std::string> genes,
               std::vector<std::string> samples,
               DataKind dataKind = DataKind::EXPRESSION);

    int numGenes() const { return static_cast<int>(values.rows()); }
    int numSamples() const { return static_cast<int>(values.cols()); }
    bool hasWeights() const { return weights.size() > 0; }

    // -1 when the gene is not present
    int geneIndex(const std::string& gene) const;
    int sampleIndex(const std::string& sample) const;

    DataMatrix subsetSamples(const std::vector<bool>& keep) const;
    DataMatrix subsetSamples(const std::vector<std::string>& labels) const;
    DataMatrix subsetGenes(const std::vector<int>& rowOrder) const;

    // Rows restricted to the genes of one filter, filters dropped
    DataMatrix filtered(const std::string& filterName) const;
    const std::vector<std::string>& filteredGenes(const std::string& filterName) const;
    std::vector<std::string> filterNames() const;

    // Appends the samples of another matrix with identical gene rows
    DataMatrix concatenateSamples(const DataMatrix& other) const;

    // Boolean mask of entries equal to zero
    BoolMatrix zeroLocations() const;

private:
    std::unordered_map<std::string, int> geneLookup;
    std::unordered_map<std::string, int> sampleLookup;

    void rebuildIndex();
};

} // namespace sigproj
