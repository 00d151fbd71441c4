#include <idphoto/core/feedback.hpp>
#include <idphoto/core/report_format.hpp>
#include "support/fake_validators.hpp"
#include <gtest/gtest.h>
#include <string>

namespace ic = idphoto::core;
namespace it = idphoto::test;

TEST(ReportFormat, HeaderThenOneLinePerOutcome) {
  auto report = it::make_report(ic::Timestamp{1234},
                                {{"Brightness", false, ic::OutcomeCode::TooDark},
                                 {"Headwear", true, ic::OutcomeCode::Ok, false}});
  const std::string text = ic::format_report(report);
  EXPECT_EQ(text,
            "timestamp_ms=1234 overall_passed=false face_detected=true mean_score=0.600\n"
            "  validator=Brightness passed=false score=0.200 code=TOO_DARK severity=ERROR "
            "required=true\n"
            "  validator=Headwear passed=true score=1.000 code=OK severity=INFO required=false\n");
}

TEST(ReportFormat, GuidanceLines) {
  auto report = it::make_report(ic::Timestamp{0},
                                {{"FacePosition", false, ic::OutcomeCode::FaceTooSmall}});
  ic::FeedbackTranslator translator;
  const std::string text = ic::format_guidance(translator.translate(report));
  EXPECT_EQ(text, std::to_string(translator.priority_of(ic::OutcomeCode::FaceTooSmall)) +
                      " FACE_TOO_SMALL guidance.face_too_small: Move closer to the camera.\n");
}

TEST(ReportFormat, EmptyGuidanceIsEmptyText) {
  EXPECT_TRUE(ic::format_guidance({}).empty());
}
