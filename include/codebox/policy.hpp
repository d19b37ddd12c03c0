#pragma once

#include <set>
#include <string>

namespace codebox {

// Denied and permitted capability names. An empty allowlist permits every
// name that is not denied. Instances are built once and never mutated.
class PolicySet {
  std::set<std::string> denylist_;
  std::set<std::string> allowlist_;

public:
  PolicySet() = default;
  PolicySet(std::set<std::string> denylist, std::set<std::string> allowlist);

  [[nodiscard]] auto denylist() const noexcept -> std::set<std::string> const&;
  [[nodiscard]] auto allowlist() const noexcept -> std::set<std::string> const&;

  [[nodiscard]] auto is_denied(std::string const& name) const -> bool;
  [[nodiscard]] auto is_permitted(std::string const& name) const -> bool;

  // Built-in denylist, optionally extended, with an optional allowlist.
  [[nodiscard]] static auto with_defaults(std::set<std::string> extra_denied = {}, std::set<std::string> allowlist = {})
      -> PolicySet;
};

auto default_denylist() -> std::set<std::string> const&;

} // namespace codebox
