#pragma once
#include <optional>
#include <string>
#include <vector>

namespace pacecalc {

inline constexpr double kMarathonKm     = 42.195;
inline constexpr double kHalfMarathonKm = 21.0975;
inline constexpr double kMileKm         = 1.609344;

enum class TokenKind : int {
  Preset = 0, // exact match only: "marathon", "5k", ...
  Suffix = 1, // multiplier unit: "<number>km", "<number>mi", ...
};

struct DistanceToken {
  std::string token;  // lowercase
  double km;          // preset value, or kilometers per unit for suffixes
  TokenKind kind;
};

struct TrainingZone {
  std::string name;
  double min_mult; // multiplier of threshold pace
  double max_mult;
};

struct Checkpoint {
  std::string label; // e.g. "21.0975km"
  double km;
};

// Built-in distance catalog, in table order.
const std::vector<DistanceToken>& distance_catalog();

// Suffix units only, longest token first (ties keep table order).
const std::vector<DistanceToken>& suffix_units_by_length();

// Exact preset lookup; `token` must already be lowercased and trimmed.
std::optional<double> preset_km(const std::string& token);

// Lookup within a specific catalog.
std::optional<DistanceToken> token_by_name_in(const std::vector<DistanceToken>& cat,
                                              const std::string& token);

// Easy, Threshold, Tempo, VO2 Max, Speed.
const std::vector<TrainingZone>& training_zones();

// 1, 5, 10, 21.0975, 42.195 km
const std::vector<Checkpoint>& split_checkpoints();

// 5, 10, 21.0975, 42.195 km
const std::vector<Checkpoint>& projection_checkpoints();

} // namespace pacecalc
