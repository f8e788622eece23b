#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "CompletenessEvaluator.hpp"

namespace {

std::vector<RowResolution> makeResolutions(const std::vector<ClaimOutcome>& outcomes) {
    std::vector<RowResolution> resolutions;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        RowResolution resolution;
        resolution.entry.fileName = "file" + std::to_string(i);
        resolution.entry.rowIndex = i;
        resolution.outcome = outcomes[i];
        resolutions.push_back(resolution);
    }
    return resolutions;
}

constexpr ClaimOutcome kHit = ClaimOutcome::Assigned;
constexpr ClaimOutcome kMiss = ClaimOutcome::NotFound;
constexpr ClaimOutcome kTaken = ClaimOutcome::ClaimedByOther;

} // namespace

TEST(PatternTest, WildcardsAreCaseInsensitive) {
    EXPECT_TRUE(matchesPattern("Arcade*", "arcade_2019.csv"));
    EXPECT_TRUE(matchesPattern("set?.csv", "SET7.CSV"));
    EXPECT_TRUE(matchesPattern("*", ""));
    EXPECT_FALSE(matchesPattern("set?.csv", "set10.csv"));
    EXPECT_FALSE(matchesPattern("Arcade", "Arcade.csv"));
}

TEST(OverridePolicyTest, MatchesFileNameOrStem) {
    OverridePolicy policy;
    policy.forcedComplete = {"Arcade"};
    EXPECT_TRUE(policy.isForcedComplete("Arcade.csv"));
    EXPECT_FALSE(policy.isForcedComplete("Console.csv"));
}

TEST(OverridePolicyTest, RejectsManifestInBothLists) {
    OverridePolicy policy;
    policy.forcedComplete = {"Arcade*"};
    policy.forceMoveOnly = {"arcade*"};
    std::string error;
    EXPECT_FALSE(policy.validate(error));
    EXPECT_FALSE(error.empty());

    policy.forceMoveOnly = {"*.csv"};
    EXPECT_TRUE(policy.validate(error));
    EXPECT_FALSE(policy.validateFor("Arcade.csv", error));
    EXPECT_TRUE(policy.validateFor("Console.csv", error));
}

TEST(CompletenessEvaluatorTest, AllMatchedIsComplete) {
    CompletenessEvaluator evaluator{OverridePolicy{}};
    const ManifestOutcome outcome = evaluator.evaluate("A.csv", makeResolutions({kHit, kHit}), {});
    EXPECT_EQ(outcome.status, ManifestStatus::Complete);
    EXPECT_EQ(outcome.action, ManifestAction::MoveAll);
    EXPECT_EQ(outcome.matchedCount, 2u);
    EXPECT_TRUE(outcome.missingEntries.empty());
    EXPECT_FALSE(outcome.forced);
}

TEST(CompletenessEvaluatorTest, AlreadyPresentCountsTowardsComplete) {
    CompletenessEvaluator evaluator{OverridePolicy{}};
    const ManifestOutcome outcome =
        evaluator.evaluate("A.csv", makeResolutions({kHit, kMiss, kTaken}), {false, true, true});
    EXPECT_EQ(outcome.status, ManifestStatus::Complete);
    EXPECT_EQ(outcome.matchedCount + outcome.alreadyPresentCount, outcome.totalEntries);
    EXPECT_EQ(outcome.alreadyPresentCount, 2u);
}

TEST(CompletenessEvaluatorTest, PartialListsMissingRows) {
    CompletenessEvaluator evaluator{OverridePolicy{}};
    const ManifestOutcome outcome = evaluator.evaluate("C.csv", makeResolutions({kHit, kMiss, kHit, kTaken}), {});
    EXPECT_EQ(outcome.status, ManifestStatus::Partial);
    EXPECT_EQ(outcome.action, ManifestAction::None);
    ASSERT_EQ(outcome.missingEntries.size(), 2u);
    EXPECT_EQ(outcome.missingEntries[0].rowIndex, 1u);
    EXPECT_EQ(outcome.missingEntries[1].rowIndex, 3u);
}

TEST(CompletenessEvaluatorTest, NothingResolvedIsZero) {
    CompletenessEvaluator evaluator{OverridePolicy{}};
    EXPECT_EQ(evaluator.evaluate("Z.csv", makeResolutions({kMiss, kTaken}), {}).status, ManifestStatus::Zero);
    EXPECT_EQ(evaluator.evaluate("E.csv", {}, {}).status, ManifestStatus::Zero);
}

TEST(CompletenessEvaluatorTest, ForcedCompleteNeedsAMatch) {
    OverridePolicy policy;
    policy.forcedComplete = {"Forced*"};
    CompletenessEvaluator evaluator(policy);

    const ManifestOutcome partial = evaluator.evaluate("Forced.csv", makeResolutions({kHit, kMiss}), {});
    EXPECT_EQ(partial.status, ManifestStatus::Complete);
    EXPECT_TRUE(partial.forced);
    EXPECT_EQ(partial.action, ManifestAction::MoveAll);
    EXPECT_EQ(partial.missingEntries.size(), 1u);

    const ManifestOutcome zero = evaluator.evaluate("Forced.csv", makeResolutions({kMiss}), {});
    EXPECT_EQ(zero.status, ManifestStatus::Zero);
    EXPECT_FALSE(zero.forced);
}

TEST(CompletenessEvaluatorTest, AllowEmptyForceCompletesZero) {
    OverridePolicy policy;
    policy.forcedComplete = {"Forced.csv"};
    policy.allowEmptyForce = true;
    CompletenessEvaluator evaluator(policy);

    const ManifestOutcome outcome = evaluator.evaluate("Forced.csv", makeResolutions({kMiss}), {});
    EXPECT_EQ(outcome.status, ManifestStatus::Complete);
    EXPECT_TRUE(outcome.forced);
}

TEST(CompletenessEvaluatorTest, ForceMoveOnlyKeepsPartialStatus) {
    OverridePolicy policy;
    policy.forceMoveOnly = {"Loose"};
    CompletenessEvaluator evaluator(policy);

    const ManifestOutcome outcome = evaluator.evaluate("Loose.csv", makeResolutions({kHit, kMiss}), {});
    EXPECT_EQ(outcome.status, ManifestStatus::Partial);
    EXPECT_EQ(outcome.action, ManifestAction::MoveMatchedOnly);

    const ManifestOutcome none = evaluator.evaluate("Loose.csv", makeResolutions({kMiss}), {});
    EXPECT_EQ(none.action, ManifestAction::None);
}

TEST(CompletenessEvaluatorTest, ForceMoveOnlyNeverMovesTheManifest) {
    OverridePolicy policy;
    policy.forceMoveOnly = {"Loose"};
    CompletenessEvaluator evaluator(policy);

    const ManifestOutcome complete = evaluator.evaluate("Loose.csv", makeResolutions({kHit, kHit}), {});
    EXPECT_EQ(complete.status, ManifestStatus::Complete);
    EXPECT_EQ(complete.action, ManifestAction::MoveMatchedOnly);

    const ManifestOutcome present = evaluator.evaluate("Loose.csv", makeResolutions({kMiss}), {true});
    EXPECT_EQ(present.status, ManifestStatus::Complete);
    EXPECT_EQ(present.action, ManifestAction::None);
}
