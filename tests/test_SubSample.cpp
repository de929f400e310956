#include "Errors.hpp"
#include "Normalization.hpp"
#include "SignatureScoring.hpp"
#include "SubSample.hpp"
#include "TestData.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <set>

using namespace sigproj;
using namespace sigproj::subsample;

namespace {

std::vector<std::string> labelsIn(const std::vector<int>& indices) {
    std::vector<std::string> labels;
    for (int i : indices) {
        labels.push_back("S" + std::to_string(i));
    }
    return labels;
}

// Working set S0-S9 and S15-S24 of the grouped data; S10-S14 and S25-S29 are held out
struct MergeFixture {
    DataMatrix expression = testdata::groupedExpression();
    DataMatrix working;
    DataMatrix holdout;
    Signature up = testdata::unsignedSignature("Group_1_up", testdata::numberedLabels("G", 10));
    std::map<std::string, SignatureScore> precomputed;
    AnalysisParameters params;
    Model model;

    MergeFixture() {
        std::vector<int> workingIdx;
        std::vector<int> holdoutIdx;
        for (int s = 0; s < 30; ++s) {
            bool held = (s >= 10 && s < 15) || s >= 25;
            (held ? holdoutIdx : workingIdx).push_back(s);
        }
        working = expression.subsetSamples(labelsIn(workingIdx));
        holdout = expression.subsetSamples(labelsIn(holdoutIdx));
        working.filters["No_Filter"] = working.geneNames;
        params.sigScoreMethod = ScoreMethod::NAIVE;

        std::vector<std::string> batches;
        for (int s = 0; s < 30; ++s) {
            batches.push_back(s % 3 == 0 ? "a" : "b");
        }
        SignatureScore batch = SignatureScore::fromFactorLevels("Batch", expression.sampleLabels, batches);
        precomputed.emplace("Batch", batch);

        model.name = "Expression";
        model.kind = ModelKind::EXPRESSION;
        model.data = working;
        model.sampleLabels = working.sampleLabels;

        DataMatrix sigData = working;
        sigData.values = normalization::normalize(working.values, NormalizationMethod::ZNORM_ROWS);
        ScoreOutcome outcome = scoring::scoreSignature(sigData, up, working.zeroLocations(), 5, ScoreMethod::NAIVE);
        model.signatureScores.emplace(up.name(), std::get<SignatureScore>(outcome));
        model.signatureScores.emplace("Batch", batch.subset(working.sampleLabels));
        model.signatureScores.emplace(ZERO_PROPORTION_NAME,
                                      SignatureScore(ZERO_PROPORTION_NAME, working.sampleLabels,
                                                     scoring::zeroProportion(working.values), false, true));

        // The first ten working samples belong to the first group
        ProjectionData projData;
        projData.filter = "No_Filter";
        projData.genes = working.geneNames;
        Eigen::MatrixXd coordinates = Eigen::MatrixXd::Zero(20, 2);
        std::vector<int> clusters(20);
        for (int i = 0; i < 20; ++i) {
            coordinates(i, 0) = i < 10 ? 1.0 : -1.0;
            clusters[i] = i < 10 ? 0 : 1;
        }
        projData.projections["PCA"] = coordinates;
        projData.clusters["PCA"]["KMeans_2"] = clusters;
        projData.projectionKeys = {"PCA"};
        projData.signatureKeys = {up.name()};
        projData.sigProjMatrix = Eigen::MatrixXd::Constant(1, 1, 0.8);
        projData.sigProjMatrixP = Eigen::MatrixXd::Constant(1, 1, -3.0);
        model.projectionData.push_back(projData);
    }

    MergeResult merge() const {
        return mergeSamples(holdout, {model}, {up}, precomputed, WorkingSetFit(), params);
    }
};

} // namespace

TEST(SubSampleTest, SplitPartitionsSamplesInOrder) {
    DataMatrix data = testdata::groupedExpression();
    std::mt19937 rng(5);
    SampleSplit split = splitSamples(data, 20, rng);

    ASSERT_EQ(split.working.numSamples(), 20);
    ASSERT_EQ(split.holdout.numSamples(), 10);

    std::set<std::string> all(split.working.sampleLabels.begin(), split.working.sampleLabels.end());
    all.insert(split.holdout.sampleLabels.begin(), split.holdout.sampleLabels.end());
    EXPECT_EQ(all.size(), 30u);

    for (const DataMatrix* part : {&split.working, &split.holdout}) {
        for (int i = 1; i < part->numSamples(); ++i) {
            EXPECT_LT(data.sampleIndex(part->sampleLabels[i - 1]), data.sampleIndex(part->sampleLabels[i]));
        }
    }
}

TEST(SubSampleTest, SplitCoveringEverySampleHoldsNothingOut) {
    DataMatrix data = testdata::groupedExpression();
    std::mt19937 rng(5);
    SampleSplit split = splitSamples(data, 30, rng);
    EXPECT_EQ(split.holdout.numSamples(), 0);
    EXPECT_EQ(split.working.sampleLabels, data.sampleLabels);
    EXPECT_THROW(splitSamples(data, 0, rng), ConfigurationError);
}

TEST(SubSampleTest, SeededSplitsAgree) {
    DataMatrix data = testdata::groupedExpression();
    std::mt19937 first(8);
    std::mt19937 second(8);
    EXPECT_EQ(splitSamples(data, 12, first).working.sampleLabels,
              splitSamples(data, 12, second).working.sampleLabels);
}

TEST(SubSampleTest, NearestSamplesSortedByDistance) {
    Eigen::MatrixXd working(1, 10);
    for (int i = 0; i < 10; ++i) {
        working(0, i) = i;
    }
    Eigen::MatrixXd holdout(1, 2);
    holdout << 2.2, 8.9;

    auto neighbors = nearestSamples(working, holdout, 3);
    ASSERT_EQ(neighbors.size(), 2u);
    ASSERT_EQ(neighbors[0].size(), 3u);
    EXPECT_EQ(neighbors[0][0].first, 2);
    EXPECT_NEAR(neighbors[0][0].second, 0.2, 1e-6);
    EXPECT_EQ(neighbors[0][1].first, 3);
    EXPECT_EQ(neighbors[0][2].first, 1);
    EXPECT_EQ(neighbors[1][0].first, 9);

    EXPECT_EQ(nearestSamples(working, holdout, 50)[0].size(), 10u);
    EXPECT_THROW(nearestSamples(working, Eigen::MatrixXd::Zero(2, 1), 3), ConsistencyError);
    EXPECT_THROW(nearestSamples(Eigen::MatrixXd(1, 0), holdout, 3), ProcessingError);
}

TEST(SubSampleTest, PlacementIsKernelWeighted) {
    Eigen::MatrixXd coordinates(2, 2);
    coordinates << 0, 0,
                   2, 0;

    std::vector<std::vector<std::pair<int, double>>> neighbors = {
        {{0, 1.0}, {1, 1.0}},
        {{0, 0.0}, {1, 2.0}},
    };
    Eigen::MatrixXd placed = placeHoldouts(coordinates, neighbors);
    EXPECT_NEAR(placed(0, 0), 1.0, 1e-12);
    EXPECT_NEAR(placed(0, 1), 0.0, 1e-12);

    double far = std::exp(-1.0);
    EXPECT_NEAR(placed(1, 0), 2.0 * far / (1.0 + far), 1e-12);
}

TEST(SubSampleTest, ClusterVoteBreaksTiesLow) {
    std::vector<int> labels = {0, 1, 1, 2};
    std::vector<std::vector<std::pair<int, double>>> neighbors = {
        {{1, 0.1}, {2, 0.2}, {0, 0.3}},
        {{3, 0.1}, {0, 0.2}},
    };
    EXPECT_EQ(assignHoldoutClusters(labels, neighbors), (std::vector<int>{1, 0}));
}

TEST(SubSampleTest, MergeExtendsEveryScoreAndProjection) {
    MergeFixture fixture;
    MergeResult merged = fixture.merge();

    ASSERT_EQ(merged.models.size(), 1u);
    const Model& model = merged.models.front();
    ASSERT_EQ(model.sampleLabels.size(), 30u);
    EXPECT_EQ(model.data.numSamples(), 30);
    EXPECT_EQ(model.sampleLabels[20], "S10");
    EXPECT_EQ(model.sampleLabels[29], "S29");

    EXPECT_EQ(merged.holdoutQC.size(), 10u);
    EXPECT_EQ(std::count(merged.holdoutQC.passes.begin(), merged.holdoutQC.passes.end(), true), 10);

    for (const auto& entry : model.signatureScores) {
        EXPECT_EQ(entry.second.sampleLabels, model.sampleLabels) << entry.first;
    }

    // Hold-outs from the first group score high, those from the second low
    const SignatureScore& up = model.signatureScores.at("Group_1_up");
    for (int i = 20; i < 25; ++i) {
        EXPECT_GT(up.values(i), 0.0);
    }
    for (int i = 25; i < 30; ++i) {
        EXPECT_LT(up.values(i), 0.0);
    }

    const SignatureScore& batch = model.signatureScores.at("Batch");
    EXPECT_TRUE(batch.isFactor);
    EXPECT_EQ(batch.values, fixture.precomputed.at("Batch").valuesFor(model.sampleLabels));

    Eigen::VectorXd zeros = scoring::zeroProportion(fixture.holdout.values);
    EXPECT_DOUBLE_EQ(model.signatureScores.at(ZERO_PROPORTION_NAME).values(20), zeros(0));

    const ProjectionData& projData = model.projectionData.front();
    const Eigen::MatrixXd& pca = projData.projections.at("PCA");
    ASSERT_EQ(pca.rows(), 30);
    const std::vector<int>& clusters = projData.clusters.at("PCA").at("KMeans_2");
    ASSERT_EQ(clusters.size(), 30u);
    for (int i = 20; i < 25; ++i) {
        EXPECT_NEAR(pca(i, 0), 1.0, 1e-9);
        EXPECT_EQ(clusters[i], 0);
    }
    for (int i = 25; i < 30; ++i) {
        EXPECT_NEAR(pca(i, 0), -1.0, 1e-9);
        EXPECT_EQ(clusters[i], 1);
    }

    EXPECT_DOUBLE_EQ(projData.sigProjMatrixP(0, 0), -3.0);
}

TEST(SubSampleTest, EmptyHoldoutLeavesModelsUntouched) {
    MergeFixture fixture;
    DataMatrix none = fixture.holdout.subsetSamples(std::vector<std::string>{});
    MergeResult merged = mergeSamples(none, {fixture.model}, {fixture.up}, fixture.precomputed,
                                      WorkingSetFit(), fixture.params);
    EXPECT_EQ(merged.models.front().sampleLabels.size(), 20u);
    EXPECT_EQ(merged.holdoutQC.size(), 0u);
}

TEST(SubSampleTest, MergeRejectsMismatchedInputs) {
    MergeFixture fixture;

    DataMatrix fewerGenes = fixture.holdout.subsetGenes({0, 1, 2});
    EXPECT_THROW(mergeSamples(fewerGenes, {fixture.model}, {fixture.up}, fixture.precomputed,
                              WorkingSetFit(), fixture.params),
                 ConsistencyError);

    EXPECT_THROW(mergeSamples(fixture.holdout, {fixture.model}, {}, fixture.precomputed,
                              WorkingSetFit(), fixture.params),
                 ConsistencyError);

    EXPECT_THROW(mergeSamples(fixture.holdout, {fixture.model}, {fixture.up}, {},
                              WorkingSetFit(), fixture.params),
                 ConsistencyError);
}
