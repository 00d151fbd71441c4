#include <idphoto/app/booth_factory.hpp>
#include <idphoto/app/config.hpp>
#include <idphoto/vision/mock_perception_adapter.hpp>
#include "support/synthetic_face.hpp"
#include <memory>
#include <gtest/gtest.h>

namespace ia = idphoto::app;
namespace ic = idphoto::core;
namespace iv = idphoto::vision;
namespace it = idphoto::test;

TEST(BoothFactory, DefaultRegistryHasAllBuiltins) {
  auto registry = ia::make_registry(ia::default_config());
  ASSERT_TRUE(registry.has_value());
  ASSERT_EQ(registry->size(), 9u);
  EXPECT_EQ(registry->active_validators().front().validator->name(), "Brightness");
  EXPECT_TRUE(registry->find("FacePosition")->required);
  EXPECT_FALSE(registry->find("Headwear")->required);
  EXPECT_FALSE(registry->find("Background")->required);
}

TEST(BoothFactory, DisabledValidatorsAreNotRegistered) {
  auto config = ia::default_config();
  config.disabled_validators = {"Shadow", "Background"};
  config.advisory_validators = {"Reflection"};
  auto registry = ia::make_registry(config);
  ASSERT_TRUE(registry.has_value());
  EXPECT_EQ(registry->size(), 7u);
  EXPECT_FALSE(registry->contains("Shadow"));
  EXPECT_FALSE(registry->find("Reflection")->required);
  EXPECT_TRUE(registry->find("Headwear")->required);
}

TEST(BoothFactory, UnknownValidatorName) {
  auto config = ia::default_config();
  config.advisory_validators = {"Glasses"};
  auto registry = ia::make_registry(config);
  ASSERT_FALSE(registry.has_value());
  EXPECT_EQ(registry.error(), ic::BoothError::UnknownValidator);

  auto orchestrator =
      ia::make_orchestrator(config, std::make_unique<iv::MockPerceptionAdapter>());
  ASSERT_FALSE(orchestrator.has_value());
  EXPECT_EQ(orchestrator.error(), ic::BoothError::UnknownValidator);
}

TEST(BoothFactory, InconsistentThresholdsRejected) {
  auto config = ia::default_config();
  config.validators.face_position.size_ratio_min = 0.9f;
  auto orchestrator =
      ia::make_orchestrator(config, std::make_unique<iv::MockPerceptionAdapter>());
  ASSERT_FALSE(orchestrator.has_value());
  EXPECT_EQ(orchestrator.error(), ic::BoothError::ValidatorConfig);
}

TEST(BoothFactory, MockBackendByDefault) {
  auto adapter = ia::make_perception_adapter(ia::default_config());
  ASSERT_NE(adapter, nullptr);
  EXPECT_NE(dynamic_cast<iv::MockPerceptionAdapter*>(adapter.get()), nullptr);
}

TEST(BoothFactory, OnnxBackendWithMissingModelThrows) {
  auto config = ia::default_config();
  config.backend_type = ia::PerceptionBackendType::Onnx;
  config.landmark_model_path = "/nonexistent/landmarks.onnx";
  EXPECT_ANY_THROW((void)ia::make_perception_adapter(config));
}

TEST(BoothFactory, OrchestratorRunsBuiltinsOnPortrait) {
  auto adapter = std::make_unique<iv::MockPerceptionAdapter>(it::portrait_face());
  auto orchestrator = ia::make_orchestrator(ia::default_config(), std::move(adapter));
  ASSERT_TRUE(orchestrator.has_value());
  auto report = (*orchestrator)->run(it::portrait_frame());
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->size(), 9u);
  for (const auto& o : report->outcomes()) {
    if (o.required) EXPECT_TRUE(o.passed) << o.validator_name << " " << ic::to_string(o.code);
  }
  EXPECT_TRUE(report->overall_passed());
}
