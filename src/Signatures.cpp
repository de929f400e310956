#include "Signatures.hpp"
#include "Errors.hpp"
#include <unordered_map>

namespace sigproj {

Signature::Signature(std::map<std::string, int> geneSigns,
                     bool isSigned,
                     std::string source,
                     std::string name)
    : geneSigns(std::move(geneSigns)),
      signedFlag(isSigned),
      sourceTag(std::move(source)),
      signatureName(std::move(name)) {
    for (const auto& entry : this->geneSigns) {
        if (entry.second != 1 && entry.second != -1) {
            throw SigProjError("Signature " + signatureName +
                               " has an invalid sign for gene " + entry.first);
        }
    }
}

int Signature::signFor(const std::string& gene) const {
    auto it = geneSigns.find(gene);
    if (it == geneSigns.end()) {
        return 0;
    }
    return signedFlag ? it->second : 1;
}

SignatureScore::SignatureScore(std::string scoreName,
                               std::vector<std::string> labels,
                               Eigen::VectorXd scores,
                               bool factor,
                               bool precomputed,
                               int genes)
    : name(std::move(scoreName)),
      sampleLabels(std::move(labels)),
      values(std::move(scores)),
      isFactor(factor),
      isPrecomputed(precomputed),
      numGenes(genes) {
    if (values.size() != static_cast<Eigen::Index>(sampleLabels.size())) {
        throw ConsistencyError("Score " + name + " has " + std::to_string(values.size()) +
                               " values for " + std::to_string(sampleLabels.size()) + " samples");
    }
}

SignatureScore SignatureScore::fromFactorLevels(const std::string& scoreName,
                                                const std::vector<std::string>& labels,
                                                const std::vector<std::string>& levels) {
    if (levels.size() != labels.size()) {
        throw ConsistencyError("Factor " + scoreName + " has a level count that does not match its samples");
    }

    std::vector<std::string> distinct;
    std::unordered_map<std::string, int> levelIndex;
    Eigen::VectorXd codes(levels.size());
    for (size_t i = 0; i < levels.size(); ++i) {
        auto it = levelIndex.find(levels[i]);
        if (it == levelIndex.end()) {
            it = levelIndex.emplace(levels[i], static_cast<int>(distinct.size())).first;
            distinct.push_back(levels[i]);
        }
        codes(i) = it->second;
    }

    SignatureScore score(scoreName, labels, codes, true, true, 0);
    score.factorLevels = distinct;
    return score;
}

Eigen::VectorXd SignatureScore::valuesFor(const std::vector<std::string>& labels) const {
    if (labels == sampleLabels) {
        return values;
    }

    std::unordered_map<std::string, Eigen::Index> position;
    for (size_t i = 0; i < sampleLabels.size(); ++i) {
        position[sampleLabels[i]] = static_cast<Eigen::Index>(i);
    }

    Eigen::VectorXd aligned(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        auto it = position.find(labels[i]);
        if (it == position.end()) {
            throw ConsistencyError("Score " + name + " has no value for sample " + labels[i]);
        }
        aligned(i) = values(it->second);
    }
    return aligned;
}

SignatureScore SignatureScore::subset(const std::vector<std::string>& labels) const {
    SignatureScore result = *this;
    result.values = valuesFor(labels);
    result.sampleLabels = labels;
    return result;
}

SignatureScore SignatureScore::extended(const std::vector<std::string>& labels,
                                        const Eigen::VectorXd& extra) const {
    if (extra.size() != static_cast<Eigen::Index>(labels.size())) {
        throw ConsistencyError("Extension of score " + name + " has mismatched lengths");
    }
    SignatureScore result = *this;
    result.sampleLabels.insert(result.sampleLabels.end(), labels.begin(), labels.end());
    result.values.resize(values.size() + extra.size());
    result.values << values, extra;
    return result;
}

} // namespace sigproj
