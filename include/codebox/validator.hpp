#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "codebox/policy.hpp"
#include "codebox/types.hpp"

namespace codebox {

struct ValidationVerdict {
  bool                       allowed_ = true;
  std::optional<std::string> violating_symbol_;
  std::optional<std::string> reason_;

  [[nodiscard]] static auto allow() -> ValidationVerdict;
  [[nodiscard]] static auto reject(std::string symbol, std::string reason) -> ValidationVerdict;
};

// Module names referenced by `import a, b` and `from a.b import c` lines,
// reduced to their top-level component, in source order.
auto extract_imports(std::string_view code) -> std::vector<std::string>;

// Static, best-effort gate over the source text and requested packages.
// Pattern matching is not sound; it only screens out the obvious cases.
// Stops at the first violation: imports, then dangerous calls, then packages.
auto validate(
    std::string_view             code,
    std::set<std::string> const& packages,
    PolicySet const&             policy,
    Language                     language = Language::Python
) -> ValidationVerdict;

} // namespace codebox
