#include <idphoto/core/validator_registry.hpp>
#include <algorithm>

namespace idphoto::core {

std::expected<void, BoothError> ValidatorRegistry::add(std::unique_ptr<IValidator> validator,
                                                       bool required) {
  if (!validator) {
    return std::unexpected(BoothError::InvalidConfig);
  }
  if (contains(validator->name())) {
    return std::unexpected(BoothError::DuplicateValidator);
  }
  entries_.push_back(RegisteredValidator{std::move(validator), required});
  return {};
}

bool ValidatorRegistry::remove(std::string_view name) {
  const auto it = std::find_if(entries_.begin(), entries_.end(),
                               [name](const RegisteredValidator& e) {
                                 return e.validator->name() == name;
                               });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

std::expected<void, BoothError> ValidatorRegistry::set_required(std::string_view name,
                                                                bool required) {
  for (auto& e : entries_) {
    if (e.validator->name() == name) {
      e.required = required;
      return {};
    }
  }
  return std::unexpected(BoothError::UnknownValidator);
}

const RegisteredValidator* ValidatorRegistry::find(std::string_view name) const noexcept {
  for (const auto& e : entries_) {
    if (e.validator->name() == name) return &e;
  }
  return nullptr;
}

}  // namespace idphoto::core
