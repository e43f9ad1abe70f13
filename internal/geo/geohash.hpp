#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "geo_math.hpp"

namespace dispatch::geo {

/*
  Interleaved-bit geohash.

  A point encodes to a 52-bit score (26 bits latitude, 26 bits longitude,
  interleaved). Every cell at a coarser step covers one contiguous score
  range, so a radius query becomes a handful of range scans over a sorted
  container: the cell holding the center plus its eight neighbours, at a
  step where that 3x3 block covers the query's bounding box.
*/

inline constexpr uint8_t kGeoHashStepMax = 26;

struct GeoHashBits {
  uint64_t bits = 0;
  uint8_t  step = 0;
};

struct GeoHashArea {
  GeoHashBits hash;
  double      min_lat = 0;
  double      max_lat = 0;
  double      min_lng = 0;
  double      max_lng = 0;
};

// False when the point is outside the encodable range or step is invalid.
bool Encode(const Coordinates& point, uint8_t step, GeoHashBits& out);

GeoHashArea Decode(const GeoHashBits& hash);

// Full precision score. The point must be valid.
uint64_t Score(const Coordinates& point);

// Half-open [min, max) score range covered by a cell.
std::pair<uint64_t, uint64_t> ScoreRange(const GeoHashBits& cell);

// Deduplicated cells whose union covers the circle around center.
std::vector<GeoHashBits> CoveringCells(const Coordinates& center, double radius_km);

} // namespace dispatch::geo
