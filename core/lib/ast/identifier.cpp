#include "hcl/ast/identifier.hpp"

#include <utility>

namespace hcl
{

InvalidIdentifier::InvalidIdentifier(std::string_view name)
: std::invalid_argument("invalid identifier: '" + std::string(name) + "'"), name_(name)
{
}

Identifier::Identifier(std::string name) : name_(std::move(name))
{
  if (!is_valid(name_)) {
    throw InvalidIdentifier(name_);
  }
}

bool Identifier::is_valid(std::string_view name) noexcept
{
  if (name.empty()) {
    return false;
  }
  for (size_t i = 0; i < name.size();) {
    const size_t len = identifier_char_length(name.substr(i), i == 0);
    if (len == 0) {
      return false;
    }
    i += len;
  }
  return true;
}

}  // namespace hcl
