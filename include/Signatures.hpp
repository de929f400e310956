#pragma once

#include <Eigen/Dense>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace sigproj {

// Named gene set with a +1/-1 sign per gene. Immutable once constructed.
class Signature {
public:
    Signature(std::map<std::string, int> geneSigns,
              bool isSigned,
              std::string source,
              std::string name);

    const std::map<std::string, int>& genes() const { return geneSigns; }
    bool isSigned() const { return signedFlag; }
    const std::string& source() const { return sourceTag; }
    const std::string& name() const { return signatureName; }
    size_t size() const { return geneSigns.size(); }

    // Sign used in scoring; unsigned signatures score every gene as +1
    int signFor(const std::string& gene) const;

private:
    std::map<std::string, int> geneSigns;
    bool signedFlag;
    std::string sourceTag;
    std::string signatureName;
};

// One value per sample, ordered like sampleLabels
struct SignatureScore {
    std::string name;
    std::vector<std::string> sampleLabels;
    Eigen::VectorXd values;

    // Factor scores store level indices into factorLevels
    bool isFactor = false;
    std::vector<std::string> factorLevels;

    // Precomputed scores bypass re-scoring and significance pruning
    bool isPrecomputed = false;
    int numGenes = 0;

    SignatureScore() = default;
    SignatureScore(std::string scoreName,
                   std::vector<std::string> labels,
                   Eigen::VectorXd scores,
                   bool factor = false,
                   bool precomputed = false,
                   int genes = 0);

    // Builds a precomputed factor score from one level string per sample
    static SignatureScore fromFactorLevels(const std::string& scoreName,
                                           const std::vector<std::string>& labels,
                                           const std::vector<std::string>& levels);

    // Values reordered to the given labels; throws ConsistencyError on a missing label
    Eigen::VectorXd valuesFor(const std::vector<std::string>& labels) const;

    // Keeps only the given labels, in their order
    SignatureScore subset(const std::vector<std::string>& labels) const;

    // Appends values for additional samples
    SignatureScore extended(const std::vector<std::string>& labels,
                            const Eigen::VectorXd& extra) const;
};

// Signature overlapped the data with fewer genes than required
struct CoverageSkip {
    std::string signatureName;
    int overlappingGenes = 0;
    int requiredGenes = 0;
};

using ScoreOutcome = std::variant<SignatureScore, CoverageSkip>;

} // namespace sigproj
