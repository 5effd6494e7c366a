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


// The schema unifier: the raw Yellow and Green files, in one canonical `unified_trips` table.

#ifndef CORDON_UNIFY_UNIFY_H
#define CORDON_UNIFY_UNIFY_H

#include "../port.h"

#include <string>
#include <vector>

#include "../bricks/file/file.h"
#include "../bricks/log/log.h"
#include "../bricks/strings/util.h"
#include "../pipeline/session.h"
#include "../schema/source.h"
#include "../schema/tables.h"

namespace cordon {
namespace unify {

// The raw trip files of the fleet in the data directory, in file name order.
inline std::vector<std::string> TripFilesOfFleet(const std::string& data_dir, FleetType fleet) {
  std::vector<std::string> result;
  for (const std::string& name : FileSystem::ListFilesSorted(data_dir)) {
    TripFilePeriod period;
    if (ParseTripFileName(name, period) && period.fleet == fleet) {
      result.push_back(name);
    }
  }
  return result;
}

}  // namespace unify

// All Yellow files, then all Green files. No deduplication, no filtering.
inline size_t RunSchemaUnifier(const Session& session) {
  const auto unified = session.Output().OpenWriter<TripRecord>(tables::kUnifiedTrips);
  for (const FleetType fleet : kAllFleets) {
    for (const std::string& name : unify::TripFilesOfFleet(session.DataDir(), fleet)) {
      const size_t rows = ForEachSourceTrip(FileSystem::JoinPath(session.DataDir(), name),
                                            fleet,
                                            [&unified](TripRecord&& trip) { unified->Add(trip); });
      Log().Info("Unified " + strings::ToString(rows) + " trips from " + name + '.');
    }
  }
  unified->Commit();
  return unified->Rows();
}

}  // namespace cordon

#endif  // CORDON_UNIFY_UNIFY_H
