// hcl/ast/structure.hpp - Body, attributes and blocks
//
#pragma once

#include <gsl/span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "hcl/ast/expr.hpp"
#include "hcl/ast/identifier.hpp"

namespace hcl
{

/**
 * A block label: either a bare identifier or a quoted string.
 *
 * The kind is kept so that formatting reproduces the original spelling.
 * Converting to a plain string (as_str/into_string) discards the kind.
 */
class BlockLabel
{
public:
  BlockLabel(Identifier id) : value_(std::move(id)) {}
  BlockLabel(std::string str) : value_(std::move(str)) {}
  BlockLabel(const char * str) : value_(std::string(str)) {}

  [[nodiscard]] bool is_identifier() const noexcept
  {
    return std::holds_alternative<Identifier>(value_);
  }
  [[nodiscard]] bool is_string() const noexcept
  {
    return std::holds_alternative<std::string>(value_);
  }

  [[nodiscard]] const std::variant<Identifier, std::string> & value() const noexcept
  {
    return value_;
  }

  /// Label text regardless of kind.
  [[nodiscard]] const std::string & as_str() const noexcept;
  [[nodiscard]] std::string into_string() &&;

  bool operator==(const BlockLabel &) const = default;

private:
  std::variant<Identifier, std::string> value_;
};

/// `key = value`
struct Attribute
{
  Identifier key;
  Expression value;

  bool operator==(const Attribute & other) const;
};

struct Block;

/// Attribute or Block.
using Structure = std::variant<Attribute, Block>;

/**
 * Ordered sequence of structures.
 *
 * Order is significant: repeated attribute keys and repeated block
 * identifiers are kept positionally.
 */
class Body
{
public:
  Body() = default;
  explicit Body(std::vector<Structure> structures);

  [[nodiscard]] gsl::span<const Structure> structures() const noexcept;
  [[nodiscard]] size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] std::vector<Structure>::const_iterator begin() const noexcept;
  [[nodiscard]] std::vector<Structure>::const_iterator end() const noexcept;

  /// Attributes in order of appearance.
  [[nodiscard]] std::vector<const Attribute *> attributes() const;
  /// Blocks in order of appearance.
  [[nodiscard]] std::vector<const Block *> blocks() const;

  void push_back(Structure structure);

  [[nodiscard]] std::vector<Structure> into_inner() &&;

  bool operator==(const Body & other) const;

private:
  std::vector<Structure> structures_;
};

/// `identifier label... { body }`
struct Block
{
  Identifier identifier;
  std::vector<BlockLabel> labels;
  Body body;

  bool operator==(const Block & other) const;
};

}  // namespace hcl
