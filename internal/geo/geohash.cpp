#include "geohash.hpp"

#include <algorithm>
#include <cmath>

namespace dispatch::geo {

namespace {

constexpr double kLatMin      = -90.0;
constexpr double kLatMax      = 90.0;
constexpr double kLngMin      = -180.0;
constexpr double kLngMax      = 180.0;
constexpr double kMercatorMax = 20037726.37;

uint64_t Interleave64(uint32_t xlo, uint32_t ylo) {
  static const uint64_t     B[] = {0x5555555555555555ULL, 0x3333333333333333ULL, 0x0F0F0F0F0F0F0F0FULL, 0x00FF00FF00FF00FFULL,
                                   0x0000FFFF0000FFFFULL};
  static const unsigned int S[] = {1, 2, 4, 8, 16};

  uint64_t x = xlo;
  uint64_t y = ylo;

  for (int i = 4; i >= 0; --i) {
    x = (x | (x << S[i])) & B[i];
    y = (y | (y << S[i])) & B[i];
  }

  return x | (y << 1);
}

uint64_t Deinterleave64(uint64_t interleaved) {
  static const uint64_t     B[] = {0x5555555555555555ULL, 0x3333333333333333ULL, 0x0F0F0F0F0F0F0F0FULL,
                                   0x00FF00FF00FF00FFULL, 0x0000FFFF0000FFFFULL, 0x00000000FFFFFFFFULL};
  static const unsigned int S[] = {0, 1, 2, 4, 8, 16};

  uint64_t x = interleaved;
  uint64_t y = interleaved >> 1;

  for (int i = 0; i < 6; ++i) {
    x = (x | (x >> S[i])) & B[i];
    y = (y | (y >> S[i])) & B[i];
  }

  return x | (y << 32);
}

uint32_t CellOffset(double value, double min, double max, uint8_t step) {
  const uint64_t cells  = 1ULL << step;
  const double   offset = (value - min) / (max - min) * static_cast<double>(cells);
  return static_cast<uint32_t>(std::min<uint64_t>(static_cast<uint64_t>(offset), cells - 1));
}

// Longitude lives in the odd bits.
void MoveX(GeoHashBits& hash, int d) {
  if (d == 0) return;

  uint64_t       x  = hash.bits & 0xaaaaaaaaaaaaaaaaULL;
  const uint64_t y  = hash.bits & 0x5555555555555555ULL;
  const uint64_t zz = 0x5555555555555555ULL >> (64 - hash.step * 2);

  if (d > 0) {
    x = x + (zz + 1);
  } else {
    x = x | zz;
    x = x - (zz + 1);
  }

  x &= (0xaaaaaaaaaaaaaaaaULL >> (64 - hash.step * 2));
  hash.bits = x | y;
}

void MoveY(GeoHashBits& hash, int d) {
  if (d == 0) return;

  const uint64_t x  = hash.bits & 0xaaaaaaaaaaaaaaaaULL;
  uint64_t       y  = hash.bits & 0x5555555555555555ULL;
  const uint64_t zz = 0xaaaaaaaaaaaaaaaaULL >> (64 - hash.step * 2);

  if (d > 0) {
    y = y + (zz + 1);
  } else {
    y = y | zz;
    y = y - (zz + 1);
  }

  y &= (0x5555555555555555ULL >> (64 - hash.step * 2));
  hash.bits = x | y;
}

uint8_t EstimateStepsByRadius(double range_m, double lat) {
  if (range_m <= 0) return kGeoHashStepMax;

  int step = 1;
  while (range_m < kMercatorMax) {
    range_m *= 2;
    step++;
  }
  step -= 2;
  if (lat > 67 || lat < -67) step--;
  if (lat > 80 || lat < -80) step--;

  return static_cast<uint8_t>(std::clamp(step, 1, static_cast<int>(kGeoHashStepMax)));
}

} // namespace

bool Encode(const Coordinates& point, uint8_t step, GeoHashBits& out) {
  if (step == 0 || step > kGeoHashStepMax || !IsValidCoordinate(point)) {
    return false;
  }

  out.step = step;
  out.bits = Interleave64(CellOffset(point.latitude, kLatMin, kLatMax, step), CellOffset(point.longitude, kLngMin, kLngMax, step));
  return true;
}

GeoHashArea Decode(const GeoHashBits& hash) {
  GeoHashArea area;
  area.hash = hash;

  const uint64_t separated = Deinterleave64(hash.bits);
  const auto     ilat      = static_cast<uint32_t>(separated);
  const auto     ilng      = static_cast<uint32_t>(separated >> 32);
  const double   cells     = static_cast<double>(1ULL << hash.step);

  area.min_lat = kLatMin + (ilat / cells) * (kLatMax - kLatMin);
  area.max_lat = kLatMin + ((ilat + 1) / cells) * (kLatMax - kLatMin);
  area.min_lng = kLngMin + (ilng / cells) * (kLngMax - kLngMin);
  area.max_lng = kLngMin + ((ilng + 1) / cells) * (kLngMax - kLngMin);
  return area;
}

uint64_t Score(const Coordinates& point) {
  GeoHashBits hash;
  Encode(point, kGeoHashStepMax, hash);
  return hash.bits;
}

std::pair<uint64_t, uint64_t> ScoreRange(const GeoHashBits& cell) {
  const int shift = (kGeoHashStepMax - cell.step) * 2;
  return {cell.bits << shift, (cell.bits + 1) << shift};
}

std::vector<GeoHashBits> CoveringCells(const Coordinates& center, double radius_km) {
  const BoundingBox box = BoundingBoxAround(center, radius_km);

  GeoHashBits hash;
  uint8_t     step = EstimateStepsByRadius(radius_km * 1000.0, center.latitude);
  for (;;) {
    if (!Encode(center, step, hash)) return {};

    // the 3x3 block around the center cell must contain the whole box
    const auto   area   = Decode(hash);
    const double cell_h = area.max_lat - area.min_lat;
    const double cell_w = area.max_lng - area.min_lng;
    const bool   covers = area.min_lat - cell_h <= box.min_lat && area.max_lat + cell_h >= box.max_lat && area.min_lng - cell_w <= box.min_lng &&
                        area.max_lng + cell_w >= box.max_lng;
    if (covers || step == 1) break;
    --step;
  }

  std::vector<GeoHashBits> cells;
  cells.reserve(9);
  for (int dx = -1; dx <= 1; ++dx) {
    for (int dy = -1; dy <= 1; ++dy) {
      GeoHashBits neighbour = hash;
      MoveX(neighbour, dx);
      MoveY(neighbour, dy);

      const bool seen = std::any_of(cells.begin(), cells.end(), [&](const GeoHashBits& c) { return c.bits == neighbour.bits; });
      if (!seen) cells.push_back(neighbour);
    }
  }
  return cells;
}

} // namespace dispatch::geo
