// purets/lint/allow_features.hpp - Opt-in feature grants (`@allow <feature>`)
//
// A file may opt into otherwise gated APIs from its first documentation
// block:
//
//   /**
//    * @allow console
//    * @allow timers
//    */
//
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include <gsl/span>

#include "purets/ast/ast.hpp"

namespace purets::lint
{

enum class Feature : uint8_t {
  Timers,
  Console,
  Net,
  Dom,
  Throws,
};

inline constexpr std::array<Feature, 5> k_all_features = {
  Feature::Timers, Feature::Console, Feature::Net, Feature::Dom, Feature::Throws};

[[nodiscard]] constexpr std::string_view to_string(Feature f) noexcept
{
  switch (f) {
    case Feature::Timers:
      return "timers";
    case Feature::Console:
      return "console";
    case Feature::Net:
      return "net";
    case Feature::Dom:
      return "dom";
    case Feature::Throws:
      return "throws";
  }
  return "";
}

[[nodiscard]] std::optional<Feature> parse_feature(std::string_view name) noexcept;

/**
 * A set of features. Used both for the grants a file declares and for the
 * grants the linter saw exercised.
 */
class FeatureSet
{
public:
  [[nodiscard]] bool has(Feature f) const noexcept { return bits_[static_cast<size_t>(f)]; }
  void set(Feature f) noexcept { bits_[static_cast<size_t>(f)] = true; }

  [[nodiscard]] bool none() const noexcept
  {
    for (bool b : bits_) {
      if (b) return false;
    }
    return true;
  }

private:
  std::array<bool, k_all_features.size()> bits_{};
};

/**
 * Parse the `@allow` grants of the first documentation block.
 *
 * Unknown features are ignored. A file without a documentation block
 * grants nothing.
 *
 * @param source   File content
 * @param comments Comments of the parsed program, in source order
 */
[[nodiscard]] FeatureSet parse_allowed_features(
  std::string_view source, gsl::span<const Comment> comments);

}  // namespace purets::lint
