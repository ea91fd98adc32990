#include "hcl/ast/structure.hpp"

namespace hcl
{

const std::string & BlockLabel::as_str() const noexcept
{
  if (const auto * id = std::get_if<Identifier>(&value_)) {
    return id->as_str();
  }
  return std::get<std::string>(value_);
}

std::string BlockLabel::into_string() &&
{
  if (auto * id = std::get_if<Identifier>(&value_)) {
    return std::move(*id).into_string();
  }
  return std::move(std::get<std::string>(value_));
}

bool Attribute::operator==(const Attribute & other) const
{
  return key == other.key && value == other.value;
}

Body::Body(std::vector<Structure> structures) : structures_(std::move(structures)) {}

gsl::span<const Structure> Body::structures() const noexcept
{
  return {structures_.data(), structures_.size()};
}

size_t Body::size() const noexcept { return structures_.size(); }

bool Body::empty() const noexcept { return structures_.empty(); }

std::vector<Structure>::const_iterator Body::begin() const noexcept
{
  return structures_.begin();
}

std::vector<Structure>::const_iterator Body::end() const noexcept { return structures_.end(); }

std::vector<const Attribute *> Body::attributes() const
{
  std::vector<const Attribute *> out;
  for (const auto & s : structures_) {
    if (const auto * attr = std::get_if<Attribute>(&s)) {
      out.push_back(attr);
    }
  }
  return out;
}

std::vector<const Block *> Body::blocks() const
{
  std::vector<const Block *> out;
  for (const auto & s : structures_) {
    if (const auto * block = std::get_if<Block>(&s)) {
      out.push_back(block);
    }
  }
  return out;
}

void Body::push_back(Structure structure) { structures_.push_back(std::move(structure)); }

std::vector<Structure> Body::into_inner() && { return std::move(structures_); }

bool Body::operator==(const Body & other) const { return structures_ == other.structures_; }

bool Block::operator==(const Block & other) const
{
  return identifier == other.identifier && labels == other.labels && body == other.body;
}

}  // namespace hcl
