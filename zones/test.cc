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


#include <string>
#include <vector>

#include "zones.h"

#include "../pipeline/testing.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(zones_test_tmpdir, ".cordon_zones_test", "Local path for the test to create temporary files in.");

using cordon::ZoneLookupEntry;
using cordon::ZoneSet;
using cordon::test_helpers::ScopedTestSession;

namespace zones_test {

const char kLookup[] =
    "\"LocationID\",\"Borough\",\"Zone\",\"service_zone\"\n"
    "1,\"EWR\",\"Newark Airport\",\"EWR\"\n"
    "4,\"Manhattan\",\"Alphabet City\",\"Yellow Zone\"\n"
    "41,\"Manhattan\",\"Central Harlem\",\"Boro Zone\"\n"
    "74,\"Manhattan\",\"East Harlem North\",\"Boro Zone\"\n"
    "127,\"Manhattan\",\"Inwood\",\"Boro Zone\"\n"
    "161,\"Manhattan\",\"Midtown Center\",\"Yellow Zone\"\n"
    "166,\"Manhattan\",\"Morningside Heights\",\"Boro Zone\"\n"
    "243,\"Manhattan\",\"Washington Heights North\",\"Boro Zone\"\n"
    "7,\"Queens\",\"Astoria\",\"Boro Zone\"\n"
    "236,\"Manhattan\",\"Upper East Side North\",\"Yellow Zone\"\n";

inline ZoneLookupEntry Entry(int32_t id, const std::string& borough, const std::string& zone) {
  ZoneLookupEntry entry;
  entry.location_id = id;
  entry.borough = borough;
  entry.zone = zone;
  return entry;
}

}  // namespace zones_test

TEST(Zones, Membership) {
  using cordon::zones::IsInCongestionZone;
  EXPECT_TRUE(IsInCongestionZone(zones_test::Entry(161, "Manhattan", "Midtown Center")));
  EXPECT_FALSE(IsInCongestionZone(zones_test::Entry(41, "Manhattan", "Central Harlem")));
  EXPECT_FALSE(IsInCongestionZone(zones_test::Entry(7, "Queens", "Astoria")));
  // The match is case-sensitive.
  EXPECT_TRUE(IsInCongestionZone(zones_test::Entry(999, "Manhattan", "harlem river view")));
  EXPECT_FALSE(IsInCongestionZone(zones_test::Entry(999, "manhattan", "Midtown Center")));
}

TEST(Zones, BuildsDisjointSetsWithinTheBorough) {
  const ScopedTestSession session(FLAGS_zones_test_tmpdir);
  session.AddMirrorFile(cordon::kZoneLookupFileName, zones_test::kLookup);

  const cordon::zones::ZoneSets sets = cordon::RunZoneBuilder(*session);
  EXPECT_EQ(ZoneSet({4, 161, 166, 236}), sets.congestion);
  EXPECT_EQ(ZoneSet({41, 74, 127, 243}), sets.border);
  for (const int32_t id : sets.congestion) {
    EXPECT_EQ(0u, sets.border.count(id));
  }

  EXPECT_EQ(sets.congestion, cordon::ReadZoneSet(session->Output(), cordon::tables::kCongestionZone));
  EXPECT_EQ(sets.border, cordon::ReadZoneSet(session->Output(), cordon::tables::kBorderZones));
  EXPECT_EQ(
      "#table {\"name\":\"congestion_zone\",\"columns\":[\"LocationID\"]}\n"
      "{\"LocationID\":4}\n"
      "{\"LocationID\":161}\n"
      "{\"LocationID\":166}\n"
      "{\"LocationID\":236}\n",
      cordon::FileSystem::ReadFileAsString(session->Output().TablePath(cordon::tables::kCongestionZone)));
}

TEST(Zones, MissingLookupIsAMissingDependency) {
  const ScopedTestSession session(FLAGS_zones_test_tmpdir);
  ASSERT_THROW(cordon::RunZoneBuilder(*session), cordon::MissingDependencyException);
  ASSERT_THROW(cordon::ReadZoneSet(session->Output(), cordon::tables::kCongestionZone),
               cordon::MissingDependencyException);
}
