#include "codebox/policy.hpp"

#include <set>
#include <string>
#include <utility>

namespace codebox {

PolicySet::PolicySet(std::set<std::string> denylist, std::set<std::string> allowlist)
    : denylist_{std::move(denylist)}, allowlist_{std::move(allowlist)} {}

auto PolicySet::denylist() const noexcept -> std::set<std::string> const& {
  return denylist_;
}

auto PolicySet::allowlist() const noexcept -> std::set<std::string> const& {
  return allowlist_;
}

auto PolicySet::is_denied(std::string const& name) const -> bool {
  return denylist_.contains(name);
}

auto PolicySet::is_permitted(std::string const& name) const -> bool {
  if (is_denied(name)) {
    return false;
  }
  return allowlist_.empty() || allowlist_.contains(name);
}

auto PolicySet::with_defaults(std::set<std::string> extra_denied, std::set<std::string> allowlist) -> PolicySet {
  auto denied = default_denylist();
  denied.merge(extra_denied);
  return PolicySet{std::move(denied), std::move(allowlist)};
}

auto default_denylist() -> std::set<std::string> const& {
  // clang-format off
  static std::set<std::string> const denylist = {
    "os", "sys", "subprocess", "shutil", "socket", "urllib", "requests", "http",
    "ftplib", "smtplib", "telnetlib", "pickle", "marshal", "eval", "exec", "compile",
    "importlib", "__import__", "open", "file", "input", "raw_input",
  };
  // clang-format on
  return denylist;
}

} // namespace codebox
