#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace smoke::suite {

// Answers what the site under test supports. Implementations may throw;
// the registry treats a throw as "not detected" for that suite only.
class FeatureDetector {
 public:
  FeatureDetector() = default;
  virtual ~FeatureDetector() = default;
  FeatureDetector(const FeatureDetector&) = delete;
  auto operator=(const FeatureDetector&) -> FeatureDetector& = delete;
  FeatureDetector(FeatureDetector&&) = delete;
  auto operator=(FeatureDetector&&) -> FeatureDetector& = delete;

  [[nodiscard]] virtual auto HasCapability(std::string_view capability) const
      -> bool = 0;

  // Suite-specific fields for the bridge file (a JSON object, possibly
  // empty).
  [[nodiscard]] virtual auto SuiteMetadata(std::string_view suite_id) const
      -> nlohmann::json = 0;
};

// Detector backed by the [site] capabilities and [suites.metadata] tables of
// smoke.toml.
class ConfiguredFeatureDetector final : public FeatureDetector {
 public:
  ConfiguredFeatureDetector(
      const std::vector<std::string>& capabilities, nlohmann::json metadata);

  [[nodiscard]] auto HasCapability(std::string_view capability) const
      -> bool override;
  [[nodiscard]] auto SuiteMetadata(std::string_view suite_id) const
      -> nlohmann::json override;

 private:
  std::set<std::string, std::less<>> capabilities_;
  nlohmann::json metadata_;
};

}  // namespace smoke::suite
