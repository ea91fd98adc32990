#include "hcl/ast/builder.hpp"

#include <iterator>

namespace hcl
{

// ============================================================================
// BodyBuilder
// ============================================================================

BodyBuilder & BodyBuilder::add_attribute(Identifier key, Expression value) &
{
  structures_.emplace_back(Attribute{std::move(key), std::move(value)});
  return *this;
}

BodyBuilder && BodyBuilder::add_attribute(Identifier key, Expression value) &&
{
  return std::move(add_attribute(std::move(key), std::move(value)));
}

BodyBuilder & BodyBuilder::add_attribute(Attribute attr) &
{
  structures_.emplace_back(std::move(attr));
  return *this;
}

BodyBuilder && BodyBuilder::add_attribute(Attribute attr) &&
{
  return std::move(add_attribute(std::move(attr)));
}

BodyBuilder & BodyBuilder::add_block(Block block) &
{
  structures_.emplace_back(std::move(block));
  return *this;
}

BodyBuilder && BodyBuilder::add_block(Block block) &&
{
  return std::move(add_block(std::move(block)));
}

BodyBuilder & BodyBuilder::add_structure(Structure structure) &
{
  structures_.push_back(std::move(structure));
  return *this;
}

BodyBuilder && BodyBuilder::add_structure(Structure structure) &&
{
  return std::move(add_structure(std::move(structure)));
}

BodyBuilder & BodyBuilder::add_structures(std::vector<Structure> structures) &
{
  structures_.insert(
    structures_.end(), std::make_move_iterator(structures.begin()),
    std::make_move_iterator(structures.end()));
  return *this;
}

BodyBuilder && BodyBuilder::add_structures(std::vector<Structure> structures) &&
{
  return std::move(add_structures(std::move(structures)));
}

Body BodyBuilder::build() && { return Body(std::move(structures_)); }

// ============================================================================
// BlockBuilder
// ============================================================================

BlockBuilder & BlockBuilder::add_label(BlockLabel label) &
{
  labels_.push_back(std::move(label));
  return *this;
}

BlockBuilder && BlockBuilder::add_label(BlockLabel label) &&
{
  return std::move(add_label(std::move(label)));
}

BlockBuilder & BlockBuilder::add_labels(std::vector<BlockLabel> labels) &
{
  labels_.insert(
    labels_.end(), std::make_move_iterator(labels.begin()), std::make_move_iterator(labels.end()));
  return *this;
}

BlockBuilder && BlockBuilder::add_labels(std::vector<BlockLabel> labels) &&
{
  return std::move(add_labels(std::move(labels)));
}

BlockBuilder & BlockBuilder::add_attribute(Identifier key, Expression value) &
{
  body_.add_attribute(std::move(key), std::move(value));
  return *this;
}

BlockBuilder && BlockBuilder::add_attribute(Identifier key, Expression value) &&
{
  return std::move(add_attribute(std::move(key), std::move(value)));
}

BlockBuilder & BlockBuilder::add_block(Block block) &
{
  body_.add_block(std::move(block));
  return *this;
}

BlockBuilder && BlockBuilder::add_block(Block block) &&
{
  return std::move(add_block(std::move(block)));
}

BlockBuilder & BlockBuilder::add_structure(Structure structure) &
{
  body_.add_structure(std::move(structure));
  return *this;
}

BlockBuilder && BlockBuilder::add_structure(Structure structure) &&
{
  return std::move(add_structure(std::move(structure)));
}

Block BlockBuilder::build() &&
{
  return Block{std::move(identifier_), std::move(labels_), std::move(body_).build()};
}

// ============================================================================
// FuncCallBuilder
// ============================================================================

FuncCallBuilder & FuncCallBuilder::arg(Expression expr) &
{
  args_.push_back(std::move(expr));
  return *this;
}

FuncCallBuilder && FuncCallBuilder::arg(Expression expr) &&
{
  return std::move(arg(std::move(expr)));
}

FuncCallBuilder & FuncCallBuilder::expand_final(bool yes) &
{
  expand_final_ = yes;
  return *this;
}

FuncCallBuilder && FuncCallBuilder::expand_final(bool yes) &&
{
  return std::move(expand_final(yes));
}

FuncCall FuncCallBuilder::build() &&
{
  return FuncCall{std::move(name_), std::move(args_), expand_final_};
}

}  // namespace hcl
