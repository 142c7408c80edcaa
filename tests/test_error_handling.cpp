/**
 * @file test_error_handling.cpp
 * @brief Exception hierarchy, parameter validation and partition checks
 */

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>
#include "../src/common/ThreadPool.h"
#include "../src/common/TractoScoreExceptions.h"
#include "../src/scoring/Classification.h"
#include "../src/scoring/ScoringConfig.h"
#include "../src/scoring/SubsetWriter.h"

using namespace tractoscore;
using namespace tractoscore::scoring;

TEST(ExceptionHierarchyTest, CategoriesAndSeverities) {
    std::vector<std::unique_ptr<TractoScoreException>> exceptions;
    exceptions.push_back(std::make_unique<CorruptedFileException>("sub.trk", "short read"));
    exceptions.push_back(std::make_unique<VolumeIOException>("wm.nii.gz", "ReadMask"));
    exceptions.push_back(std::make_unique<ConfigurationException>("num_threads", "-1", ">= 0"));
    exceptions.push_back(std::make_unique<MissingAttributeException>("CST_L.trk"));
    exceptions.push_back(std::make_unique<PartitionConsistencyException>("2 unclassified", 10));
    exceptions.push_back(std::make_unique<ScoringException>("LOAD_SUBMISSION", "empty"));

    EXPECT_EQ(exceptions[0]->GetCategory(), TractoScoreException::Category::InputOutput);
    EXPECT_EQ(exceptions[1]->GetCategory(), TractoScoreException::Category::InputOutput);
    EXPECT_EQ(exceptions[2]->GetCategory(), TractoScoreException::Category::Configuration);
    EXPECT_EQ(exceptions[3]->GetCategory(), TractoScoreException::Category::Configuration);
    EXPECT_EQ(exceptions[4]->GetCategory(), TractoScoreException::Category::Validation);
    EXPECT_EQ(exceptions[5]->GetCategory(), TractoScoreException::Category::Scoring);

    EXPECT_EQ(exceptions[3]->GetSeverity(), TractoScoreException::Severity::Fatal);
    EXPECT_EQ(exceptions[4]->GetSeverity(), TractoScoreException::Severity::Fatal);

    for (const auto &e : exceptions) {
        EXPECT_FALSE(e->GetRecoverySuggestions().empty());
        EXPECT_FALSE(std::string(e->what()).empty());
    }
}

TEST(ExceptionHierarchyTest, StreamlineIOFamilyIsCatchableAsBase) {
    try {
        throw UnsupportedFormatException("sub.xyz");
    } catch (const StreamlineIOException &e) {
        EXPECT_EQ(e.GetFilename(), "sub.xyz");
        EXPECT_NE(e.GetMessage().find("unsupported format"), std::string::npos);
    }

    EXPECT_THROW(throw FileNotFoundException("a.tck"), TractoScoreException);
    EXPECT_THROW(throw CorruptedFileException("a.tck", "bad"), std::exception);
}

TEST(ExceptionHierarchyTest, FormattedReport) {
    PartitionConsistencyException e("streamline 3 classified twice", 100);
    e.AddRecoverySuggestion("Rerun with --verbose");

    std::string report = e.GetFormattedReport();
    EXPECT_NE(report.find("=== TractoScore Error Report ==="), std::string::npos);
    EXPECT_NE(report.find("Severity: FATAL"), std::string::npos);
    EXPECT_NE(report.find("Category: VALIDATION"), std::string::npos);
    EXPECT_NE(report.find("Some streamlines were not correctly assigned to NC"), std::string::npos);
    EXPECT_NE(report.find("Total streamlines: 100"), std::string::npos);
    EXPECT_NE(report.find("Rerun with --verbose"), std::string::npos);
}

TEST(ScoringConfigTest, DefaultsAreValid) {
    ScoringConfig config;
    EXPECT_NO_THROW(config.Validate());
    EXPECT_EQ(config.nb_points_resample, 12u);
    EXPECT_DOUBLE_EQ(config.length_threshold, 35.0);
    EXPECT_EQ(config.min_streamlines_per_ib, 2u);
    EXPECT_EQ(config.endpoint_policy, EndpointRoiPolicy::Nearest);
    EXPECT_EQ(config.ResolvedThreadCount(), 1u);

    config.num_threads = 0;
    EXPECT_GE(config.ResolvedThreadCount(), 1u);
}

TEST(ScoringConfigTest, RejectsOutOfRangeValues) {
    ScoringConfig config;
    config.nb_points_resample = 1;
    EXPECT_THROW(config.Validate(), ConfigurationException);

    config = ScoringConfig{};
    config.length_threshold = -1.0;
    EXPECT_THROW(config.Validate(), ConfigurationException);

    config = ScoringConfig{};
    config.gt_cluster_threshold = 0.0;
    EXPECT_THROW(config.Validate(), ConfigurationException);

    config = ScoringConfig{};
    config.ic_cluster_threshold = -3.0;
    EXPECT_THROW(config.Validate(), ConfigurationException);

    config = ScoringConfig{};
    config.min_streamlines_per_ib = 1;
    EXPECT_THROW(config.Validate(), ConfigurationException);
}

TEST(ScoringConfigTest, EndpointPolicyNames) {
    EXPECT_EQ(ParseEndpointRoiPolicy("Nearest"), EndpointRoiPolicy::Nearest);
    EXPECT_EQ(ParseEndpointRoiPolicy("containing"), EndpointRoiPolicy::Containing);
    EXPECT_EQ(EndpointRoiPolicyToString(EndpointRoiPolicy::Containing), "containing");
    EXPECT_THROW(ParseEndpointRoiPolicy("closest"), ConfigurationException);
}

TEST(ScoringConfigTest, PersistenceOptions) {
    PersistenceOptions options;
    EXPECT_FALSE(options.AnyEnabled());
    EXPECT_NO_THROW(options.Validate());

    options.save_ibs = true;
    EXPECT_TRUE(options.AnyEnabled());

    options.out_tract_type = "TRK";
    EXPECT_NO_THROW(options.Validate());

    options.out_tract_type = "nii";
    EXPECT_THROW(options.Validate(), ConfigurationException);

    options.out_tract_type = "tck";
    options.base_name.clear();
    EXPECT_THROW(options.Validate(), ConfigurationException);
}

TEST(ScoringConfigTest, SubsetPaths) {
    io::Tractogram tractogram;
    io::ReferenceSpace space;
    PersistenceOptions options;
    options.out_dir = "results";
    options.base_name = "team";
    options.out_tract_type = "VTK";

    SubsetWriter writer(tractogram, space, options);
    EXPECT_EQ(writer.PathFor("IB_0_3"), (std::filesystem::path("results") / "team_IB_0_3.vtk").string());
    EXPECT_EQ(writer.WriteSubset("VC", {}), "");
}

TEST(ClassificationTest, DoubleAssignmentIsAPartitionError) {
    ClassificationResult result(3);
    result.Assign(0, ValidConnection{0});
    EXPECT_THROW(result.Assign(0, NoConnection{NoConnectionReason::TooShort}),
                 PartitionConsistencyException);
    EXPECT_THROW(result.Assign(7, NoConnection{}), PartitionConsistencyException);
}

TEST(ClassificationTest, UnassignedStreamlinesFailValidation) {
    ClassificationResult result(3);
    result.Assign(0, ValidConnection{0});
    result.Assign(2, InvalidConnection{RoiPair(1, 0)});
    EXPECT_FALSE(result.IsAssigned(1));
    EXPECT_THROW(result.Validate(), PartitionConsistencyException);
    EXPECT_THROW(result.Get(1), std::out_of_range);

    result.Assign(1, NoConnection{NoConnectionReason::SingletonRoiPair});
    EXPECT_NO_THROW(result.Validate());
    EXPECT_EQ(result.CountValid(), 1u);
    EXPECT_EQ(result.CountInvalid(), 1u);
    EXPECT_EQ(result.CountNoConnection(), 1u);
    EXPECT_EQ(result.CountReason(NoConnectionReason::SingletonRoiPair), 1u);
    EXPECT_EQ(std::get<InvalidConnection>(result.Get(2)).pair.Id(), "0_1");
    EXPECT_EQ(NoConnectionReasonToString(NoConnectionReason::NoEndpointRoi), "NoEndpointRoi");
}

TEST(ParallelForTest, CoversEveryIndexOnce) {
    std::vector<int> hits(1000, 0);
    ParallelFor(hits.size(), 4, [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i)
            ++hits[i];
    });
    for (int h : hits)
        EXPECT_EQ(h, 1);
}

TEST(ParallelForTest, RethrowsWorkerException) {
    std::atomic<size_t> completed{0};
    EXPECT_THROW(ParallelFor(8, 4,
                             [&](size_t begin, size_t end) {
                                 if (begin == 0)
                                     throw std::runtime_error("chunk failed");
                                 completed += end - begin;
                             }),
                 std::runtime_error);
    EXPECT_EQ(completed.load(), 6u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
