#include "Errors.hpp"
#include "SignatureScoring.hpp"
#include "TestData.hpp"
#include <gtest/gtest.h>

using namespace sigproj;

namespace {

DataMatrix scoringMatrix() {
    Eigen::MatrixXd values(3, 4);
    values << 1, 0, 3, 4,
              2, 2, 0, 2,
              5, 5, 5, 5;
    return DataMatrix(values, {"A", "B", "C"}, {"s0", "s1", "s2", "s3"});
}

Signature signedSignature() {
    return Signature({{"A", 1}, {"B", -1}}, true, "test", "A_up_B_down");
}

SignatureScore scoreOf(const ScoreOutcome& outcome) {
    EXPECT_TRUE(std::holds_alternative<SignatureScore>(outcome));
    return std::get<SignatureScore>(outcome);
}

} // namespace

TEST(SignatureScoringTest, NaiveUsesSigns) {
    DataMatrix data = scoringMatrix();
    SignatureScore score = scoreOf(
        scoring::scoreSignature(data, signedSignature(), data.zeroLocations(), 1, ScoreMethod::NAIVE));

    EXPECT_EQ(score.numGenes, 2);
    EXPECT_EQ(score.sampleLabels, data.sampleLabels);
    EXPECT_DOUBLE_EQ(score.values(0), -0.5);
    EXPECT_DOUBLE_EQ(score.values(1), -1.0);
    EXPECT_DOUBLE_EQ(score.values(2), 1.5);
    EXPECT_DOUBLE_EQ(score.values(3), 1.0);
    EXPECT_FALSE(score.isPrecomputed);
}

TEST(SignatureScoringTest, UnsignedSignaturesAddEveryGene) {
    DataMatrix data = scoringMatrix();
    Signature sig = testdata::unsignedSignature("A_and_B", {"A", "B"});
    SignatureScore score = scoreOf(
        scoring::scoreSignature(data, sig, data.zeroLocations(), 1, ScoreMethod::NAIVE));
    EXPECT_DOUBLE_EQ(score.values(0), 1.5);
    EXPECT_DOUBLE_EQ(score.values(3), 3.0);
}

TEST(SignatureScoringTest, WeightedAverageFallsBackWithoutWeights) {
    DataMatrix data = scoringMatrix();
    BoolMatrix zeros = data.zeroLocations();
    SignatureScore naive = scoreOf(scoring::scoreSignature(data, signedSignature(), zeros, 1, ScoreMethod::NAIVE));
    SignatureScore weighted = scoreOf(
        scoring::scoreSignature(data, signedSignature(), zeros, 1, ScoreMethod::WEIGHTED_AVG));
    EXPECT_TRUE(weighted.values.isApprox(naive.values));

    data.weights = Eigen::MatrixXd::Ones(3, 4);
    data.weights(0, 1) = 0.0;
    weighted = scoreOf(scoring::scoreSignature(data, signedSignature(), zeros, 1, ScoreMethod::WEIGHTED_AVG));
    EXPECT_DOUBLE_EQ(weighted.values(1), -2.0);
    EXPECT_DOUBLE_EQ(weighted.values(0), -0.5);
}

TEST(SignatureScoringTest, ImputedReplacesZerosWithDetectedMean) {
    DataMatrix data = scoringMatrix();
    SignatureScore score = scoreOf(
        scoring::scoreSignature(data, signedSignature(), data.zeroLocations(), 1, ScoreMethod::IMPUTED));
    EXPECT_NEAR(score.values(1), (8.0 / 3.0 - 2.0) / 2.0, 1e-12);
    EXPECT_NEAR(score.values(2), 0.5, 1e-12);
    EXPECT_NEAR(score.values(0), -0.5, 1e-12);
}

TEST(SignatureScoringTest, OnlyNonzeroSkipsDropouts) {
    DataMatrix data = scoringMatrix();
    SignatureScore score = scoreOf(
        scoring::scoreSignature(data, signedSignature(), data.zeroLocations(), 1, ScoreMethod::ONLY_NONZERO));
    EXPECT_DOUBLE_EQ(score.values(0), -0.5);
    EXPECT_DOUBLE_EQ(score.values(1), -2.0);
    EXPECT_DOUBLE_EQ(score.values(2), 3.0);
}

TEST(SignatureScoringTest, LowCoverageIsSkipped) {
    DataMatrix data = scoringMatrix();
    Signature partial = testdata::unsignedSignature("partial", {"A", "X", "Y"});
    ScoreOutcome outcome = scoring::scoreSignature(data, partial, data.zeroLocations(), 2, ScoreMethod::NAIVE);
    ASSERT_TRUE(std::holds_alternative<CoverageSkip>(outcome));
    EXPECT_EQ(std::get<CoverageSkip>(outcome).overlappingGenes, 1);
    EXPECT_EQ(std::get<CoverageSkip>(outcome).requiredGenes, 2);

    Signature absent = testdata::unsignedSignature("absent", {"X"});
    EXPECT_TRUE(std::holds_alternative<CoverageSkip>(
        scoring::scoreSignature(data, absent, data.zeroLocations(), 0, ScoreMethod::NAIVE)));
}

TEST(SignatureScoringTest, ZeroMaskMustMatchData) {
    DataMatrix data = scoringMatrix();
    BoolMatrix wrong = BoolMatrix::Constant(2, 4, false);
    EXPECT_THROW(scoring::scoreSignature(data, signedSignature(), wrong, 1, ScoreMethod::NAIVE), ConsistencyError);
    EXPECT_THROW(scoring::scoreSignatures(data, {signedSignature()}, wrong, 1, ScoreMethod::NAIVE),
                 ConsistencyError);
}

TEST(SignatureScoringTest, BatchCollectsSkipsAndReportsProgress) {
    DataMatrix data = scoringMatrix();
    std::vector<Signature> signatures = {signedSignature(), testdata::unsignedSignature("absent", {"X", "Y"})};

    int calls = 0;
    int lastProgress = 0;
    ProgressCallback progress = [&](const std::string&, int done, int total) {
        ++calls;
        lastProgress = done;
        EXPECT_EQ(total, 2);
    };

    scoring::BatchResult batch =
        scoring::scoreSignatures(data, signatures, data.zeroLocations(), 1, ScoreMethod::NAIVE, progress);
    ASSERT_EQ(batch.scores.size(), 1u);
    EXPECT_EQ(batch.scores.count("A_up_B_down"), 1u);
    ASSERT_EQ(batch.skipped.size(), 1u);
    EXPECT_EQ(batch.skipped[0].signatureName, "absent");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(lastProgress, 2);
}

TEST(SignatureScoringTest, MatrixBatchSharesLabelsAndDropsUncovered) {
    DataMatrix data = scoringMatrix();
    BoolMatrix zeros = data.zeroLocations();
    std::vector<Signature> signatures = {
        testdata::unsignedSignature("absent", {"X", "Y"}),
        signedSignature(),
        testdata::unsignedSignature("C_only", {"C"}),
    };

    int calls = 0;
    ProgressCallback progress = [&](const std::string& stage, int done, int total) {
        ++calls;
        EXPECT_EQ(stage, "Scoring background signatures");
        EXPECT_EQ(done, 3);
        EXPECT_EQ(total, 3);
    };

    scoring::ScoreMatrix matrix = scoring::scoreSignatureMatrix(data, signatures, zeros, 1, ScoreMethod::NAIVE,
                                                               progress, "Scoring background signatures");
    EXPECT_EQ(calls, 1);
    ASSERT_EQ(matrix.size(), 2);
    EXPECT_EQ(matrix.names, (std::vector<std::string>{"A_up_B_down", "C_only"}));
    EXPECT_EQ(matrix.numGenes, (std::vector<int>{2, 1}));
    EXPECT_EQ(matrix.sampleLabels, data.sampleLabels);
    ASSERT_EQ(matrix.values.rows(), 4);
    ASSERT_EQ(matrix.values.cols(), 2);

    SignatureScore single = scoreOf(scoring::scoreSignature(data, signedSignature(), zeros, 1, ScoreMethod::NAIVE));
    EXPECT_TRUE(matrix.values.col(0).isApprox(single.values));
    EXPECT_TRUE(matrix.values.col(1).isApprox(Eigen::VectorXd::Constant(4, 5.0)));

    // Minimum coverage of two leaves only the signed signature
    EXPECT_EQ(scoring::scoreSignatureMatrix(data, signatures, zeros, 2, ScoreMethod::NAIVE).names,
              (std::vector<std::string>{"A_up_B_down"}));

    BoolMatrix wrong = BoolMatrix::Constant(2, 4, false);
    EXPECT_THROW(scoring::scoreSignatureMatrix(data, signatures, wrong, 1, ScoreMethod::NAIVE), ConsistencyError);
}

TEST(SignatureScoringTest, ZeroProportionPerSample) {
    Eigen::VectorXd proportion = scoring::zeroProportion(scoringMatrix().values);
    EXPECT_DOUBLE_EQ(proportion(0), 0.0);
    EXPECT_DOUBLE_EQ(proportion(1), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(proportion(2), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(proportion(3), 0.0);
}

TEST(SignatureScoringTest, ProbabilityModelsScoreNaively) {
    AnalysisParameters params;
    params.sigNormMethod = NormalizationMethod::RANK_NORM_COLUMNS;
    params.sigScoreMethod = ScoreMethod::IMPUTED;

    scoring::KindScoringConfig expression = scoring::scoringConfigFor(ModelKind::EXPRESSION, params);
    EXPECT_EQ(expression.normalization, NormalizationMethod::RANK_NORM_COLUMNS);
    EXPECT_EQ(expression.method, ScoreMethod::IMPUTED);

    scoring::KindScoringConfig probability = scoring::scoringConfigFor(ModelKind::PROBABILITY, params);
    EXPECT_EQ(probability.normalization, NormalizationMethod::NONE);
    EXPECT_EQ(probability.method, ScoreMethod::NAIVE);
}

TEST(SignatureScoringTest, ParsesMethodNames) {
    for (const auto& name : scoring::availableMethods()) {
        EXPECT_EQ(scoring::methodName(scoring::parseMethod(name)), name);
    }
    EXPECT_THROW(scoring::parseMethod("median"), ConfigurationError);
}
