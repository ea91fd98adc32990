// hcl/syntax/parser_scopes.hpp - RAII helpers shared by the parser sources
//
#pragma once

#include "hcl/syntax/parser.hpp"

namespace hcl::syntax
{

// ============================================================================
// Scopes
// ============================================================================

/// Sets whether newlines are skipped by cur() for the lifetime of the scope.
class Parser::NewlineScope
{
public:
  NewlineScope(Parser & p, bool ignore) : p_(p), saved_(p.ignore_newlines_)
  {
    p_.ignore_newlines_ = ignore;
  }
  ~NewlineScope() { p_.ignore_newlines_ = saved_; }

  NewlineScope(const NewlineScope &) = delete;
  NewlineScope & operator=(const NewlineScope &) = delete;

private:
  Parser & p_;
  bool saved_;
};

/// Counts one level of nesting; fails the parse past the configured maximum.
class Parser::DepthGuard
{
public:
  explicit DepthGuard(Parser & p) : p_(p)
  {
    if (++p_.depth_ > p_.options_.max_nesting_depth) {
      p_.fail_nesting();
    }
  }
  ~DepthGuard() { --p_.depth_; }

  DepthGuard(const DepthGuard &) = delete;
  DepthGuard & operator=(const DepthGuard &) = delete;

private:
  Parser & p_;
};

}  // namespace hcl::syntax
