#include <idphoto/app/storage.hpp>
#include <idphoto/vision/load_image.hpp>
#include "support/fake_validators.hpp"
#include "support/synthetic_face.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <gtest/gtest.h>

namespace ia = idphoto::app;
namespace ic = idphoto::core;
namespace iv = idphoto::vision;
namespace it = idphoto::test;
namespace fs = std::filesystem;

namespace {

class ImageDirectoryStorageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("idphoto_storage_" +
            std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
  }
  void TearDown() override { fs::remove_all(dir_); }

  fs::path dir_;
};

}  // namespace

TEST_F(ImageDirectoryStorageTest, WritesImageAndReport) {
  ia::ImageDirectoryStorage storage((dir_ / "nested").string(), "booth");
  const auto frame = it::uniform_gray_frame(90, 32, 24, ic::Timestamp{1234});
  auto record = storage.persist(frame, it::passing_report(ic::Timestamp{1234}));
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(fs::path(record->value).filename(), "booth_1234.png");
  EXPECT_EQ(storage.persisted_count(), 1u);

  auto loaded = iv::load_frame_from_image(record->value);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->width(), 32u);
  EXPECT_EQ(loaded->height(), 24u);

  std::ifstream txt(dir_ / "nested" / "booth_1234.txt");
  ASSERT_TRUE(txt.good());
  std::stringstream contents;
  contents << txt.rdbuf();
  EXPECT_NE(contents.str().find("overall_passed=true"), std::string::npos);
}

TEST_F(ImageDirectoryStorageTest, UnusableDirectoryIsStorageError) {
  // A regular file where the directory should be.
  fs::create_directories(dir_);
  const fs::path blocker = dir_ / "file";
  std::ofstream(blocker) << "x";

  ia::ImageDirectoryStorage storage(blocker.string());
  auto record = storage.persist(it::uniform_gray_frame(90, 8, 8), it::passing_report(ic::Timestamp{1}));
  ASSERT_FALSE(record.has_value());
  EXPECT_EQ(record.error(), ic::BoothError::Storage);
  EXPECT_EQ(storage.persisted_count(), 0u);
}

TEST_F(ImageDirectoryStorageTest, UnencodableFrameIsStorageError) {
  ia::ImageDirectoryStorage storage(dir_.string());
  std::vector<std::byte> buf(12, std::byte{0});
  ic::Frame f(1, 1, ic::PixelFormat::Float32Planar, std::move(buf));
  auto record = storage.persist(f, it::passing_report(ic::Timestamp{1}));
  ASSERT_FALSE(record.has_value());
  EXPECT_EQ(record.error(), ic::BoothError::Storage);
}
