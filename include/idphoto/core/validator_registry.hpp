#pragma once

#include <idphoto/core/error.hpp>
#include <idphoto/core/validator.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace idphoto::core {

/// A registered validator and whether it takes part in overall_passed.
struct RegisteredValidator {
  std::unique_ptr<IValidator> validator;
  bool required{true};
};

/// Ordered set of uniquely-named validators. Order only decides report and
/// guidance tie-break order; aggregation does not depend on it.
class ValidatorRegistry {
 public:
  ValidatorRegistry() = default;

  ValidatorRegistry(ValidatorRegistry&&) noexcept = default;
  ValidatorRegistry& operator=(ValidatorRegistry&&) noexcept = default;
  ValidatorRegistry(const ValidatorRegistry&) = delete;
  ValidatorRegistry& operator=(const ValidatorRegistry&) = delete;

  /// Append a validator. Fails with DuplicateValidator if the name is taken
  /// (registry unchanged) or InvalidConfig for a null validator.
  [[nodiscard]] std::expected<void, BoothError> add(std::unique_ptr<IValidator> validator,
                                                    bool required = true);

  /// Remove by name; returns false if no such validator.
  bool remove(std::string_view name);

  /// Mark a validator required or advisory. UnknownValidator if absent.
  [[nodiscard]] std::expected<void, BoothError> set_required(std::string_view name,
                                                             bool required);

  [[nodiscard]] std::span<const RegisteredValidator> active_validators() const noexcept {
    return entries_;
  }

  [[nodiscard]] const RegisteredValidator* find(std::string_view name) const noexcept;
  [[nodiscard]] bool contains(std::string_view name) const noexcept {
    return find(name) != nullptr;
  }
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

 private:
  std::vector<RegisteredValidator> entries_;
};

}  // namespace idphoto::core
