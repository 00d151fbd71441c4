#include <idphoto/core/validation_report.hpp>
#include "support/fake_validators.hpp"
#include <gtest/gtest.h>

namespace ic = idphoto::core;
namespace it = idphoto::test;

TEST(ValidationReport, OverallPassedIsAndOfRequiredOutcomes) {
  auto all_pass = it::make_report(ic::Timestamp{0}, {{"A", true}, {"B", true}});
  EXPECT_TRUE(all_pass.overall_passed());

  auto one_fails = it::make_report(ic::Timestamp{0},
                                   {{"A", true}, {"B", false, ic::OutcomeCode::Blurry}});
  EXPECT_FALSE(one_fails.overall_passed());
}

TEST(ValidationReport, AdvisoryFailureDoesNotAffectOverall) {
  auto r = it::make_report(ic::Timestamp{0},
                           {{"A", true}, {"Headwear", false, ic::OutcomeCode::HeadwearDetected, false}});
  EXPECT_TRUE(r.overall_passed());
  EXPECT_TRUE(r.required_failures().empty());
}

TEST(ValidationReport, NoRequiredOutcomesIsNotPassing) {
  ic::ValidationReport empty(ic::Timestamp{0}, {}, true);
  EXPECT_FALSE(empty.overall_passed());

  auto advisory_only = it::make_report(ic::Timestamp{0}, {{"Background", true, ic::OutcomeCode::Ok, false}});
  EXPECT_FALSE(advisory_only.overall_passed());
}

TEST(ValidationReport, FindAndRequiredFailuresKeepOrder) {
  auto r = it::make_report(ic::Timestamp{42},
                           {{"A", false, ic::OutcomeCode::TooDark},
                            {"B", true},
                            {"C", false, ic::OutcomeCode::Blurry}});
  EXPECT_EQ(r.timestamp(), ic::Timestamp{42});
  ASSERT_NE(r.find("B"), nullptr);
  EXPECT_TRUE(r.find("B")->passed);
  EXPECT_EQ(r.find("Z"), nullptr);

  auto failures = r.required_failures();
  ASSERT_EQ(failures.size(), 2u);
  EXPECT_EQ(failures[0]->validator_name, "A");
  EXPECT_EQ(failures[1]->validator_name, "C");
}

TEST(ValidationReport, MeanScoreCoversEveryOutcome) {
  // make_report scores passes 1.0 and failures 0.2.
  auto r = it::make_report(ic::Timestamp{0},
                           {{"A", true},
                            {"B", false, ic::OutcomeCode::Blurry},
                            {"Headwear", false, ic::OutcomeCode::HeadwearDetected, false},
                            {"C", true}});
  EXPECT_NEAR(r.mean_score(), 0.6f, 1e-6f);
  EXPECT_FLOAT_EQ(ic::ValidationReport{}.mean_score(), 0.f);
}
