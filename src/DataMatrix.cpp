#include "DataMatrix.hpp"
#include "Errors.hpp"
#include <algorithm>

namespace sigproj {

DataMatrix::DataMatrix(Eigen::MatrixXd matrix,
                       std::vector<std::string> genes,
                       std::vector<std::string> samples,
                       DataKind dataKind)
    : values(std::move(matrix)),
      geneNames(std::move(genes)),
      sampleLabels(std::move(samples)),
      kind(dataKind) {
    if (values.rows() != static_cast<Eigen::Index>(geneNames.size()) ||
        values.cols() != static_cast<Eigen::Index>(sampleLabels.size())) {
        throw ConsistencyError("Matrix shape does not match its labels");
    }
    rebuildIndex();
}

void DataMatrix::rebuildIndex() {
    geneLookup.clear();
    sampleLookup.clear();
    for (size_t i = 0; i < geneNames.size(); ++i) {
        geneLookup[geneNames[i]] = static_cast<int>(i);
    }
    for (size_t j = 0; j < sampleLabels.size(); ++j) {
        sampleLookup[sampleLabels[j]] = static_cast<int>(j);
    }
}

int DataMatrix::geneIndex(const std::string& gene) const {
    auto it = geneLookup.find(gene);
    return it == geneLookup.end() ? -1 : it->second;
}

int DataMatrix::sampleIndex(const std::string& sample) const {
    auto it = sampleLookup.find(sample);
    return it == sampleLookup.end() ? -1 : it->second;
}

DataMatrix DataMatrix::subsetSamples(const std::vector<bool>& keep) const {
    if (keep.size() != sampleLabels.size()) {
        throw ConsistencyError("Sample mask length does not match the number of samples");
    }
    std::vector<std::string> labels;
    for (size_t j = 0; j < keep.size(); ++j) {
        if (keep[j]) {
            labels.push_back(sampleLabels[j]);
        }
    }
    return subsetSamples(labels);
}

DataMatrix DataMatrix::subsetSamples(const std::vector<std::string>& labels) const {
    Eigen::MatrixXd subset(values.rows(), labels.size());
    Eigen::MatrixXd subsetWeights;
    if (hasWeights()) {
        subsetWeights.resize(weights.rows(), labels.size());
    }

    for (size_t j = 0; j < labels.size(); ++j) {
        int col = sampleIndex(labels[j]);
        if (col < 0) {
            throw ConsistencyError("Unknown sample label: " + labels[j]);
        }
        subset.col(j) = values.col(col);
        if (hasWeights()) {
            subsetWeights.col(j) = weights.col(col);
        }
    }

    DataMatrix result(subset, geneNames, labels, kind);
    result.weights = subsetWeights;
    result.filters = filters;
    result.loadings = loadings;
    return result;
}

DataMatrix DataMatrix::subsetGenes(const std::vector<int>& rowOrder) const {
    Eigen::MatrixXd subset(rowOrder.size(), values.cols());
    Eigen::MatrixXd subsetWeights;
    if (hasWeights()) {
        subsetWeights.resize(rowOrder.size(), weights.cols());
    }
    std::vector<std::string> genes;
    genes.reserve(rowOrder.size());

    for (size_t i = 0; i < rowOrder.size(); ++i) {
        int row = rowOrder[i];
        if (row < 0 || row >= numGenes()) {
            throw ConsistencyError("Gene index out of range");
        }
        subset.row(i) = values.row(row);
        if (hasWeights()) {
            subsetWeights.row(i) = weights.row(row);
        }
        genes.push_back(geneNames[row]);
    }

    DataMatrix result(subset, genes, sampleLabels, kind);
    result.weights = subsetWeights;

    // Filters only keep genes that are still present
    for (const auto& entry : filters) {
        std::vector<std::string> kept;
        for (const auto& gene : entry.second) {
            if (result.geneIndex(gene) >= 0) {
                kept.push_back(gene);
            }
        }
        result.filters[entry.first] = kept;
    }
    return result;
}

DataMatrix DataMatrix::filtered(const std::string& filterName) const {
    const auto& genes = filteredGenes(filterName);
    std::vector<int> rows;
    rows.reserve(genes.size());
    for (const auto& gene : genes) {
        int row = geneIndex(gene);
        if (row < 0) {
            throw ConsistencyError("Filter " + filterName + " names an unknown gene: " + gene);
        }
        rows.push_back(row);
    }
    DataMatrix result = subsetGenes(rows);
    result.filters.clear();
    return result;
}

const std::vector<std::string>& DataMatrix::filteredGenes(const std::string& filterName) const {
    auto it = filters.find(filterName);
    if (it == filters.end()) {
        throw ProcessingError("Unknown filter: " + filterName);
    }
    return it->second;
}

std::vector<std::string> DataMatrix::filterNames() const {
    std::vector<std::string> names;
    for (const auto& entry : filters) {
        names.push_back(entry.first);
    }
    return names;
}

DataMatrix DataMatrix::concatenateSamples(const DataMatrix& other) const {
    if (other.geneNames != geneNames) {
        throw ConsistencyError("Cannot concatenate matrices with different gene rows");
    }
    if (other.hasWeights() != hasWeights()) {
        throw ConsistencyError("Cannot concatenate weighted and unweighted matrices");
    }

    Eigen::MatrixXd merged(values.rows(), values.cols() + other.values.cols());
    merged << values, other.values;

    std::vector<std::string> labels = sampleLabels;
    labels.insert(labels.end(), other.sampleLabels.begin(), other.sampleLabels.end());

    DataMatrix result(merged, geneNames, labels, kind);
    if (hasWeights()) {
        result.weights.resize(weights.rows(), weights.cols() + other.weights.cols());
        result.weights << weights, other.weights;
    }
    result.filters = filters;
    result.loadings = loadings;
    return result;
}

BoolMatrix DataMatrix::zeroLocations() const {
    return (values.array() == 0.0).matrix();
}

} // namespace sigproj
