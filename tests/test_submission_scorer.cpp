#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include "../src/common/TractoScoreExceptions.h"
#include "../src/scoring/SubmissionScorer.h"
#include "ScoringTestData.h"

using namespace tractoscore;
using namespace tractoscore::scoring;

class SubmissionScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "tractoscore_scorer_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);

        ground_truth = testing_data::MakeGroundTruth();
        submission = testing_data::MakeScenarioSubmission();
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    /// Ground-truth directory equivalent to the in-memory ground truth
    std::string WriteGroundTruthDirectory() const {
        GroundTruthLayout layout = GroundTruthLayout::FromDirectory((test_dir / "gt").string());
        std::filesystem::create_directories(layout.rois_dir);
        std::filesystem::create_directories(layout.bundle_masks_dir);
        std::filesystem::create_directories(layout.bundles_dir);

        const auto &space = ground_truth.reference;
        io::WriteMask(space.CreateEmptyMask(), layout.reference_anatomy);
        for (const auto &roi : ground_truth.rois) {
            io::WriteMask(roi.mask, layout.rois_dir + "/" + roi.name + ".nii.gz");
        }

        io::Tractogram cst;
        for (const auto &s : testing_data::CstReferenceStreamlines())
            cst.AddStreamline(s);
        io::StreamlineUtils::SaveTractogram(cst, layout.bundles_dir + "/CST_L.trk", space);
        io::WriteMask(testing_data::CstMask(space), layout.bundle_masks_dir + "/CST_L.nii.gz");

        return layout.base_dir;
    }

    std::filesystem::path test_dir;
    GroundTruth ground_truth;
    io::Tractogram submission;
};

TEST_F(SubmissionScorerTest, ScenarioScorecard) {
    ScoringResult result = SubmissionScorer().ScoreSubmission(submission, ground_truth);
    const Scorecard &scores = result.scorecard;

    EXPECT_EQ(scores.total_streamlines_count, 100u);
    EXPECT_DOUBLE_EQ(scores.vc, 0.60);
    EXPECT_DOUBLE_EQ(scores.ic, 0.15);
    EXPECT_DOUBLE_EQ(scores.nc, 0.25);
    EXPECT_DOUBLE_EQ(scores.vcwp, 0.0);
    EXPECT_EQ(scores.vb, 1u);
    EXPECT_EQ(scores.ib, 1u);
    EXPECT_EQ(scores.streamlines_per_bundle, (std::map<std::string, size_t>{{"CST_L", 60}}));

    EXPECT_DOUBLE_EQ(scores.overlap_per_bundle.at("CST_L"), 46.0 / 736.0);
    EXPECT_DOUBLE_EQ(scores.mean_ol, scores.overlap_per_bundle.at("CST_L"));
    EXPECT_DOUBLE_EQ(scores.mean_f1, scores.f1_score_per_bundle.at("CST_L"));

    ASSERT_EQ(result.invalid_bundles.size(), 1u);
    EXPECT_EQ(result.invalid_bundles[0].PairId(), "0_1");
    EXPECT_EQ(result.invalid_bundles[0].indices.size(), 15u);
}

TEST_F(SubmissionScorerTest, PartitionCoversEveryStreamline) {
    ScoringResult result = SubmissionScorer().ScoreSubmission(submission, ground_truth);
    const ClassificationResult &labels = result.classification;

    EXPECT_EQ(labels.CountValid() + labels.CountInvalid() + labels.CountNoConnection(), 100u);
    EXPECT_NO_THROW(labels.Validate());
    EXPECT_NEAR(result.scorecard.vc + result.scorecard.ic + result.scorecard.nc, 1.0, 1e-12);

    EXPECT_EQ(labels.CountReason(NoConnectionReason::TooShort), 20u);
    EXPECT_EQ(labels.CountReason(NoConnectionReason::TooShort) +
                  labels.CountReason(NoConnectionReason::IsolatedCluster) +
                  labels.CountReason(NoConnectionReason::SingletonRoiPair) +
                  labels.CountReason(NoConnectionReason::NoEndpointRoi),
              25u);

    // Index 3 is a short streamline, index 0 a valid one
    EXPECT_TRUE(std::holds_alternative<NoConnection>(labels.Get(3)));
    ASSERT_TRUE(std::holds_alternative<ValidConnection>(labels.Get(0)));
    EXPECT_EQ(std::get<ValidConnection>(labels.Get(0)).bundle_index, 0u);
    EXPECT_TRUE(std::holds_alternative<InvalidConnection>(labels.Get(4)));
}

TEST_F(SubmissionScorerTest, ShortValidConnectionStaysValid) {
    // 20 voxels along the bundle: shorter than the threshold, still a VC
    GroundTruth short_gt = testing_data::MakeGroundTruth(ScoringConfig{}, 15.0);
    io::Tractogram tractogram;
    tractogram.AddStreamline(testing_data::MakeLine({10.0f, 10.0f, 5.0f}, {10.0f, 10.0f, 25.0f}));
    tractogram.AddStreamline(testing_data::ShortStreamline(0));

    ScoringResult result = SubmissionScorer().ScoreSubmission(tractogram, short_gt);
    EXPECT_TRUE(std::holds_alternative<ValidConnection>(result.classification.Get(0)));
    ASSERT_TRUE(std::holds_alternative<NoConnection>(result.classification.Get(1)));
    EXPECT_EQ(std::get<NoConnection>(result.classification.Get(1)).reason,
              NoConnectionReason::TooShort);
}

TEST_F(SubmissionScorerTest, IdenticalAcrossRunsAndThreadCounts) {
    ScoringConfig parallel;
    parallel.num_threads = 4;

    std::string first = SubmissionScorer().ScoreSubmission(submission, ground_truth).scorecard.ToString();
    std::string second = SubmissionScorer().ScoreSubmission(submission, ground_truth).scorecard.ToString();
    std::string threaded = SubmissionScorer(parallel).ScoreSubmission(submission, ground_truth).scorecard.ToString();

    EXPECT_EQ(first, second);
    EXPECT_EQ(first, threaded);
}

TEST_F(SubmissionScorerTest, NoValidBundlesGiveNullMeans) {
    io::Tractogram tractogram;
    for (size_t k = 0; k < 4; ++k)
        tractogram.AddStreamline(testing_data::ShortStreamline(k));

    ScoringResult result = SubmissionScorer().ScoreSubmission(tractogram, ground_truth);
    EXPECT_DOUBLE_EQ(result.scorecard.nc, 1.0);
    EXPECT_EQ(result.scorecard.vb, 0u);
    EXPECT_TRUE(result.scorecard.streamlines_per_bundle.empty());
    EXPECT_TRUE(std::isnan(result.scorecard.mean_f1));

    nlohmann::json j = result.scorecard.ToJson();
    EXPECT_TRUE(j["mean_OL"].is_null());
    EXPECT_TRUE(j["mean_F1"].is_null());
    EXPECT_TRUE(j["overlap_per_bundle"].empty());
}

TEST_F(SubmissionScorerTest, ScorecardJsonKeys) {
    ScoringResult result = SubmissionScorer().ScoreSubmission(submission, ground_truth);
    nlohmann::json j = result.scorecard.ToJson();

    for (const char *key : {"version", "algo_version", "VC", "IC", "NC", "VCWP", "VB", "IB",
                            "streamlines_per_bundle", "total_streamlines_count",
                            "overlap_per_bundle", "overreach_per_bundle",
                            "overreach_norm_gt_per_bundle", "f1_score_per_bundle",
                            "mean_OL", "mean_OR", "mean_ORn", "mean_F1"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["version"], 2);
    EXPECT_EQ(j["algo_version"], 5);
    EXPECT_EQ(j["streamlines_per_bundle"]["CST_L"], 60);

    std::string scores_file = (test_dir / "scores.json").string();
    result.scorecard.SaveToJSON(scores_file);
    std::ifstream file(scores_file);
    nlohmann::json reloaded = nlohmann::json::parse(file);
    EXPECT_EQ(reloaded["VB"], 1);
}

TEST_F(SubmissionScorerTest, PersistsClassifiedSubsets) {
    PersistenceOptions persistence;
    persistence.save_full_vc = true;
    persistence.save_full_ic = true;
    persistence.save_full_nc = true;
    persistence.save_ibs = true;
    persistence.save_vbs = true;
    persistence.out_dir = (test_dir / "out").string();
    persistence.base_name = "team";
    persistence.out_tract_type = "trk";

    ScoringResult result =
        SubmissionScorer(ScoringConfig{}, persistence).ScoreSubmission(submission, ground_truth);

    EXPECT_EQ(result.written_files.size(), 5u);
    for (const char *name : {"team_VB_CST_L.trk", "team_VC.trk", "team_IB_0_1.trk",
                             "team_IC.trk", "team_NC.trk"}) {
        EXPECT_TRUE(std::filesystem::exists(test_dir / "out" / name)) << name;
    }

    io::Tractogram nc = io::StreamlineUtils::LoadTractogram(
        (test_dir / "out" / "team_NC.trk").string(), ground_truth.reference);
    EXPECT_EQ(nc.Size(), 25u);
    io::Tractogram ib = io::StreamlineUtils::LoadTractogram(
        (test_dir / "out" / "team_IB_0_1.trk").string(), ground_truth.reference);
    EXPECT_EQ(ib.Size(), 15u);
}

TEST_F(SubmissionScorerTest, NothingPersistedByDefault) {
    ScoringResult result = SubmissionScorer().ScoreSubmission(submission, ground_truth);
    EXPECT_TRUE(result.written_files.empty());
}

TEST_F(SubmissionScorerTest, EmptySubmissionIsRejected) {
    EXPECT_THROW(SubmissionScorer().ScoreSubmission(io::Tractogram{}, ground_truth), ScoringException);
}

TEST_F(SubmissionScorerTest, ScoresFilesOnDisk) {
    std::string gt_dir = WriteGroundTruthDirectory();
    std::string submission_file = (test_dir / "submission.tck").string();
    io::StreamlineUtils::SaveTractogram(submission, submission_file, ground_truth.reference);

    BundleAttributesMap attributes;
    attributes["CST_L.trk"].cluster_threshold = 3.0;

    ScoringResult from_files = SubmissionScorer().ScoreSubmission(
        submission_file, io::SubmissionAttributes{}, gt_dir, attributes);
    ScoringResult in_memory = SubmissionScorer().ScoreSubmission(submission, ground_truth);

    EXPECT_EQ(from_files.scorecard.ToString(), in_memory.scorecard.ToString());
}

TEST_F(SubmissionScorerTest, MissingAttributesStopBeforeClassification) {
    std::string gt_dir = WriteGroundTruthDirectory();
    std::string submission_file = (test_dir / "submission.tck").string();
    io::StreamlineUtils::SaveTractogram(submission, submission_file, ground_truth.reference);

    EXPECT_THROW(SubmissionScorer().ScoreSubmission(submission_file, io::SubmissionAttributes{},
                                                    gt_dir, BundleAttributesMap{}),
                 MissingAttributeException);
}

TEST_F(SubmissionScorerTest, StageNames) {
    EXPECT_EQ(ScoringStageToString(ScoringStage::ExtractValidConnections), "EXTRACT_VC");
    EXPECT_EQ(ScoringStageToString(ScoringStage::ValidatePartition), "VALIDATE_PARTITION");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
