#include <idphoto/app/storage.hpp>
#include <idphoto/core/report_format.hpp>
#include <idphoto/vision/load_image.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace idphoto::app {

namespace ic = idphoto::core;

ImageDirectoryStorage::ImageDirectoryStorage(std::string directory, std::string prefix)
    : directory_(std::move(directory)), prefix_(std::move(prefix)) {}

std::expected<RecordId, ic::BoothError> ImageDirectoryStorage::persist(
    const ic::Frame& frame, const ic::ValidationReport& report) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) return std::unexpected(ic::BoothError::Storage);

  const std::filesystem::path base =
      std::filesystem::path(directory_) /
      (prefix_ + "_" + std::to_string(report.timestamp().count()));
  const std::string image_path = base.string() + ".png";

  auto saved = vision::save_frame_to_image(frame, image_path);
  if (!saved) return std::unexpected(ic::BoothError::Storage);

  std::ofstream out(base.string() + ".txt");
  if (!out) return std::unexpected(ic::BoothError::Storage);
  out << ic::format_report(report);
  if (!out) return std::unexpected(ic::BoothError::Storage);

  ++persisted_;
  return RecordId{image_path};
}

}  // namespace idphoto::app
