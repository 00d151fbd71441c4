// In-memory storage that can be told to fail, for capture loop tests.
#pragma once

#include <idphoto/app/storage.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace idphoto::test {

class FakeStorage : public app::IStorageCollaborator {
 public:
  /// The next `n` persist() calls fail with BoothError::Storage.
  void fail_next(std::size_t n) noexcept { failures_left_ = n; }

  std::expected<app::RecordId, core::BoothError> persist(
      const core::Frame& frame, const core::ValidationReport& report) override {
    ++attempts_;
    if (failures_left_ > 0) {
      --failures_left_;
      return std::unexpected(core::BoothError::Storage);
    }
    reports_.push_back(report);
    return app::RecordId{"record-" + std::to_string(frame.timestamp().count())};
  }

  std::size_t attempts() const noexcept { return attempts_; }
  const std::vector<core::ValidationReport>& stored() const noexcept { return reports_; }

 private:
  std::size_t failures_left_{0};
  std::size_t attempts_{0};
  std::vector<core::ValidationReport> reports_;
};

}  // namespace idphoto::test
