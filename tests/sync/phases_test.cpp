#include "tsync/sync/phases.hpp"

#include <gtest/gtest.h>

using tsync::ErrorKind;
using tsync::sync::CyclePhase;
using tsync::sync::CyclePhases;

TEST(CyclePhasesTest, FullCycleOrder) {
    CyclePhases phases;
    EXPECT_EQ(phases.phase(), CyclePhase::Idle);

    ASSERT_TRUE(phases.transition_to(CyclePhase::ReconcilingDeletions).is_ok());
    ASSERT_TRUE(phases.transition_to(CyclePhase::Uploading).is_ok());
    ASSERT_TRUE(phases.transition_to(CyclePhase::Downloading).is_ok());
    ASSERT_TRUE(phases.transition_to(CyclePhase::Complete).is_ok());
    EXPECT_TRUE(phases.finished());
}

TEST(CyclePhasesTest, UploadOnlyPass) {
    CyclePhases phases;
    ASSERT_TRUE(phases.transition_to(CyclePhase::Uploading).is_ok());
    ASSERT_TRUE(phases.transition_to(CyclePhase::Complete).is_ok());
}

TEST(CyclePhasesTest, RejectsSkippingAndGoingBack) {
    CyclePhases phases;
    auto skipped = phases.transition_to(CyclePhase::Downloading);
    ASSERT_TRUE(skipped.is_error());
    EXPECT_EQ(skipped.error().kind, ErrorKind::Invalid);

    ASSERT_TRUE(phases.transition_to(CyclePhase::ReconcilingDeletions).is_ok());
    ASSERT_TRUE(phases.transition_to(CyclePhase::Uploading).is_ok());
    EXPECT_TRUE(phases.transition_to(CyclePhase::ReconcilingDeletions).is_error());
    EXPECT_EQ(phases.phase(), CyclePhase::Uploading);
}

TEST(CyclePhasesTest, FailedIsTerminal) {
    CyclePhases phases;
    ASSERT_TRUE(phases.transition_to(CyclePhase::Uploading).is_ok());
    ASSERT_TRUE(phases.mark_failed("connection reset").is_ok());

    EXPECT_EQ(phases.phase(), CyclePhase::Failed);
    EXPECT_EQ(phases.last_error(), "connection reset");
    EXPECT_TRUE(phases.finished());
    EXPECT_TRUE(phases.transition_to(CyclePhase::Complete).is_error());
}

TEST(CyclePhasesTest, CompleteCannotFail) {
    CyclePhases phases;
    ASSERT_TRUE(phases.transition_to(CyclePhase::Uploading).is_ok());
    ASSERT_TRUE(phases.transition_to(CyclePhase::Complete).is_ok());
    EXPECT_TRUE(phases.mark_failed("late").is_error());
    EXPECT_EQ(phases.phase(), CyclePhase::Complete);
}

TEST(CyclePhasesTest, PhaseNames) {
    EXPECT_STREQ(tsync::sync::to_string(CyclePhase::ReconcilingDeletions), "reconciling-deletions");
    EXPECT_STREQ(tsync::sync::to_string(CyclePhase::Failed), "failed");
}
