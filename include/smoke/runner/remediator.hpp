#pragma once

namespace smoke::runner {

// Repairs the runner environment (dependencies, browser binaries). Invoked at
// most once per run, before the single retry.
class Remediator {
 public:
  Remediator() = default;
  virtual ~Remediator() = default;
  Remediator(const Remediator&) = delete;
  auto operator=(const Remediator&) -> Remediator& = delete;
  Remediator(Remediator&&) = delete;
  auto operator=(Remediator&&) -> Remediator& = delete;

  // Returns false when a required step failed.
  virtual auto Remediate() -> bool = 0;
};

}  // namespace smoke::runner
