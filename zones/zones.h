/*******************************************************************************
The MIT License (MIT)

Copyright (c) 2026 The Cordon Authors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*******************************************************************************/


// The congestion zone builder: which zone ids form the congestion zone, and which lie on its border.

#ifndef CORDON_ZONES_ZONES_H
#define CORDON_ZONES_ZONES_H

#include "../port.h"

#include <set>
#include <string>
#include <vector>

#include "../bricks/log/log.h"
#include "../bricks/strings/util.h"
#include "../fetcher/fetcher.h"
#include "../pipeline/session.h"
#include "../schema/source.h"
#include "../schema/tables.h"
#include "../storage/exceptions.h"

namespace cordon {

typedef std::set<int32_t> ZoneSet;

namespace zones {

constexpr char kCongestionBorough[] = "Manhattan";

// The northern neighborhoods of the borough lie above the tolled area.
constexpr const char* kExcludedNeighborhoods[] = {"Harlem", "Inwood", "Washington Heights"};

inline bool IsInCongestionZone(const ZoneLookupEntry& entry) {
  if (entry.borough != kCongestionBorough) {
    return false;
  }
  for (const char* neighborhood : kExcludedNeighborhoods) {
    if (entry.zone.find(neighborhood) != std::string::npos) {
      return false;
    }
  }
  return true;
}

struct ZoneSets {
  ZoneSet congestion;
  ZoneSet border;
};

// The border zones are the zones of the same borough outside the congestion zone.
inline ZoneSets BuildZoneSets(const std::vector<ZoneLookupEntry>& entries) {
  ZoneSets result;
  for (const ZoneLookupEntry& entry : entries) {
    if (IsInCongestionZone(entry)) {
      result.congestion.insert(entry.location_id);
    }
  }
  for (const ZoneLookupEntry& entry : entries) {
    if (entry.borough == kCongestionBorough && !result.congestion.count(entry.location_id)) {
      result.border.insert(entry.location_id);
    }
  }
  return result;
}

inline std::vector<ZoneId> AsRows(const ZoneSet& zones) {
  std::vector<ZoneId> rows;
  for (const int32_t id : zones) {
    rows.emplace_back(id);
  }
  return rows;
}

}  // namespace zones

// Reads `congestion_zone` or `border_zones` back.
inline ZoneSet ReadZoneSet(const TableStore& store, const std::string& name) {
  ZoneSet result;
  store.ForEach<ZoneId>(name, [&result](ZoneId&& zone) { result.insert(zone.location_id); });
  return result;
}

inline zones::ZoneSets RunZoneBuilder(const Session& session) {
  std::string lookup_file_name;
  try {
    lookup_file_name = session.Fetcher().FetchZoneLookup();
  } catch (const SourceNotPublishedException& e) {
    CORDON_THROW(MissingDependencyException("The zone lookup is required: " + e.OriginalDescription()));
  }
  const zones::ZoneSets sets = zones::BuildZoneSets(ReadZoneLookup(lookup_file_name));
  session.Output().Write(tables::kCongestionZone, zones::AsRows(sets.congestion));
  session.Output().Write(tables::kBorderZones, zones::AsRows(sets.border));
  Log().Info("Zones: " + strings::ToString(sets.congestion.size()) + " in the congestion zone, " +
             strings::ToString(sets.border.size()) + " on its border.");
  return sets;
}

}  // namespace cordon

#endif  // CORDON_ZONES_ZONES_H
