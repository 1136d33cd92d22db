#include <pacecalc/units.hpp>
#include <algorithm>

namespace pacecalc {

static std::vector<DistanceToken> make_catalog_builtin() {
  return {
    {"marathon",      kMarathonKm,     TokenKind::Preset},
    {"half-marathon", kHalfMarathonKm, TokenKind::Preset},
    {"hm",            kHalfMarathonKm, TokenKind::Preset},
    {"10k",           10.0,            TokenKind::Preset},
    {"5k",            5.0,             TokenKind::Preset},
    {"1k",            1.0,             TokenKind::Preset},
    {"1mi",           kMileKm,         TokenKind::Preset},
    {"800m",          0.8,             TokenKind::Preset},
    {"400m",          0.4,             TokenKind::Preset},
    {"km",            1.0,             TokenKind::Suffix},
    {"mi",            kMileKm,         TokenKind::Suffix},
    {"k",             1.0,             TokenKind::Suffix},
    {"m",             kMarathonKm,     TokenKind::Suffix}, // marathons
  };
}

const std::vector<DistanceToken>& distance_catalog() {
  static const std::vector<DistanceToken> cat = make_catalog_builtin();
  return cat;
}

static std::vector<DistanceToken> make_suffix_order() {
  std::vector<DistanceToken> out;
  for (const auto& t : distance_catalog()) {
    if (t.kind == TokenKind::Suffix) out.push_back(t);
  }
  // "km" must win over "k" and "m" for inputs like "10km".
  std::stable_sort(out.begin(), out.end(), [](const DistanceToken& a, const DistanceToken& b) {
    return a.token.size() > b.token.size();
  });
  return out;
}

const std::vector<DistanceToken>& suffix_units_by_length() {
  static const std::vector<DistanceToken> order = make_suffix_order();
  return order;
}

std::optional<DistanceToken> token_by_name_in(const std::vector<DistanceToken>& cat,
                                              const std::string& token) {
  auto it = std::find_if(cat.begin(), cat.end(),
                         [&](const DistanceToken& t){ return t.token == token; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::optional<double> preset_km(const std::string& token) {
  auto t = token_by_name_in(distance_catalog(), token);
  if (!t.has_value() || t->kind != TokenKind::Preset) return std::nullopt;
  return t->km;
}

const std::vector<TrainingZone>& training_zones() {
  static const std::vector<TrainingZone> zones = {
    {"Easy",      1.15, 1.25},
    {"Threshold", 1.05, 1.15},
    {"Tempo",     1.00, 1.05},
    {"VO2 Max",   0.90, 1.00},
    {"Speed",     0.80, 0.90},
  };
  return zones;
}

const std::vector<Checkpoint>& split_checkpoints() {
  static const std::vector<Checkpoint> cps = {
    {"1km",       1.0},
    {"5km",       5.0},
    {"10km",      10.0},
    {"21.0975km", kHalfMarathonKm},
    {"42.195km",  kMarathonKm},
  };
  return cps;
}

const std::vector<Checkpoint>& projection_checkpoints() {
  static const std::vector<Checkpoint> cps = {
    {"5km",       5.0},
    {"10km",      10.0},
    {"21.0975km", kHalfMarathonKm},
    {"42.195km",  kMarathonKm},
  };
  return cps;
}

} // namespace pacecalc
