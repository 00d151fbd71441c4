#pragma once

#include <idphoto/core/error.hpp>
#include <idphoto/core/frame.hpp>
#include <idphoto/core/validation_report.hpp>
#include <cstddef>
#include <expected>
#include <string>

namespace idphoto::app {

/// Identifier of a persisted capture.
struct RecordId {
  std::string value;

  bool operator==(const RecordId&) const = default;
};

/// Persists the captured frame together with the report that passed it.
/// Implementations return BoothError::Storage on failure; the capture loop retries.
class IStorageCollaborator {
 public:
  virtual ~IStorageCollaborator() = default;

  [[nodiscard]] virtual std::expected<RecordId, idphoto::core::BoothError> persist(
      const idphoto::core::Frame& frame,
      const idphoto::core::ValidationReport& report) = 0;
};

/// Writes "<prefix>_<timestamp_ms>.png" and a matching ".txt" report into a
/// directory (created on first use). The record id is the image path.
class ImageDirectoryStorage : public IStorageCollaborator {
 public:
  explicit ImageDirectoryStorage(std::string directory, std::string prefix = "capture");

  [[nodiscard]] std::expected<RecordId, idphoto::core::BoothError> persist(
      const idphoto::core::Frame& frame,
      const idphoto::core::ValidationReport& report) override;

  [[nodiscard]] std::size_t persisted_count() const noexcept { return persisted_; }

 private:
  std::string directory_;
  std::string prefix_;
  std::size_t persisted_{0};
};

}  // namespace idphoto::app
