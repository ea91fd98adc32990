// hcl/ast/builder.hpp - Fluent construction of bodies, blocks and calls
//
// Builders are plain accumulators over the model types. They do not validate
// beyond what the model constructors already enforce.
//
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "hcl/ast/expr.hpp"
#include "hcl/ast/structure.hpp"

namespace hcl
{

class BodyBuilder
{
public:
  BodyBuilder & add_attribute(Identifier key, Expression value) &;
  BodyBuilder && add_attribute(Identifier key, Expression value) &&;
  BodyBuilder & add_attribute(Attribute attr) &;
  BodyBuilder && add_attribute(Attribute attr) &&;
  BodyBuilder & add_block(Block block) &;
  BodyBuilder && add_block(Block block) &&;
  BodyBuilder & add_structure(Structure structure) &;
  BodyBuilder && add_structure(Structure structure) &&;
  BodyBuilder & add_structures(std::vector<Structure> structures) &;
  BodyBuilder && add_structures(std::vector<Structure> structures) &&;

  [[nodiscard]] Body build() &&;

private:
  std::vector<Structure> structures_;
};

class BlockBuilder
{
public:
  explicit BlockBuilder(Identifier identifier) : identifier_(std::move(identifier)) {}

  BlockBuilder & add_label(BlockLabel label) &;
  BlockBuilder && add_label(BlockLabel label) &&;
  BlockBuilder & add_labels(std::vector<BlockLabel> labels) &;
  BlockBuilder && add_labels(std::vector<BlockLabel> labels) &&;
  BlockBuilder & add_attribute(Identifier key, Expression value) &;
  BlockBuilder && add_attribute(Identifier key, Expression value) &&;
  BlockBuilder & add_block(Block block) &;
  BlockBuilder && add_block(Block block) &&;
  BlockBuilder & add_structure(Structure structure) &;
  BlockBuilder && add_structure(Structure structure) &&;

  [[nodiscard]] Block build() &&;

private:
  Identifier identifier_;
  std::vector<BlockLabel> labels_;
  BodyBuilder body_;
};

class FuncCallBuilder
{
public:
  explicit FuncCallBuilder(FuncName name) : name_(std::move(name)) {}

  FuncCallBuilder & arg(Expression expr) &;
  FuncCallBuilder && arg(Expression expr) &&;
  FuncCallBuilder & expand_final(bool yes = true) &;
  FuncCallBuilder && expand_final(bool yes = true) &&;

  [[nodiscard]] FuncCall build() &&;

private:
  FuncName name_;
  std::vector<Expression> args_;
  bool expand_final_ = false;
};

}  // namespace hcl
