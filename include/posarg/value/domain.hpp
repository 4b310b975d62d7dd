#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace posarg {

// Domain payloads carried through argument lists. The decoding layer never
// looks inside them; it only checks which of these a slot holds and hands
// back the same shared object.

// Probability distribution over named vectors.
class Distribution {
 public:
  Distribution() = default;
  virtual ~Distribution() = default;

  Distribution(const Distribution&) = delete;
  auto operator=(const Distribution&) -> Distribution& = delete;
  Distribution(Distribution&&) = delete;
  auto operator=(Distribution&&) -> Distribution& = delete;

  [[nodiscard]] virtual auto GetName() const -> std::string = 0;
  [[nodiscard]] virtual auto GetVectors() const
      -> std::vector<std::vector<double>> = 0;
};

// A recurring sequence together with the positions it was observed at.
class Feature {
 public:
  Feature() = default;
  virtual ~Feature() = default;

  Feature(const Feature&) = delete;
  auto operator=(const Feature&) -> Feature& = delete;
  Feature(Feature&&) = delete;
  auto operator=(Feature&&) -> Feature& = delete;

  [[nodiscard]] virtual auto GetSequence() const -> std::string = 0;
  [[nodiscard]] virtual auto GetPositions() const
      -> std::vector<std::vector<double>> = 0;
  [[nodiscard]] virtual auto GetCount() const -> std::size_t = 0;
};

// Collection of features detected over one input.
class FeatureSet {
 public:
  FeatureSet() = default;
  virtual ~FeatureSet() = default;

  FeatureSet(const FeatureSet&) = delete;
  auto operator=(const FeatureSet&) -> FeatureSet& = delete;
  FeatureSet(FeatureSet&&) = delete;
  auto operator=(FeatureSet&&) -> FeatureSet& = delete;

  [[nodiscard]] virtual auto GetFeatures() const
      -> std::vector<std::shared_ptr<Feature>> = 0;
};

using DistributionPtr = std::shared_ptr<Distribution>;
using FeaturePtr = std::shared_ptr<Feature>;
using FeatureSetPtr = std::shared_ptr<FeatureSet>;

}  // namespace posarg
