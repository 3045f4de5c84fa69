#include "smoke/suite/feature_detector.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace smoke::suite {

ConfiguredFeatureDetector::ConfiguredFeatureDetector(
    const std::vector<std::string>& capabilities, nlohmann::json metadata)
    : capabilities_(capabilities.begin(), capabilities.end()),
      metadata_(std::move(metadata)) {
}

auto ConfiguredFeatureDetector::HasCapability(std::string_view capability) const
    -> bool {
  return capabilities_.contains(capability);
}

auto ConfiguredFeatureDetector::SuiteMetadata(std::string_view suite_id) const
    -> nlohmann::json {
  if (!metadata_.is_object()) {
    return nlohmann::json::object();
  }
  auto it = metadata_.find(std::string(suite_id));
  if (it == metadata_.end() || !it->is_object()) {
    return nlohmann::json::object();
  }
  return *it;
}

}  // namespace smoke::suite
