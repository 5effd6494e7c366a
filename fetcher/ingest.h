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


// The ingestion stage: makes every published month of the configured years local, for both fleets.

#ifndef CORDON_FETCHER_INGEST_H
#define CORDON_FETCHER_INGEST_H

#include "../port.h"

#include <string>

#include "fetcher.h"

#include "../bricks/log/log.h"
#include "../bricks/strings/util.h"
#include "../pipeline/session.h"

namespace cordon {

struct IngestionSummary {
  size_t available = 0u;
  size_t not_published = 0u;
};

inline IngestionSummary RunIngestion(const Session& session) {
  IngestionSummary summary;
  for (const int year : session.Config().ingest_years) {
    for (int month = 1; month <= 12; ++month) {
      for (const FleetType fleet : kAllFleets) {
        try {
          session.Fetcher().FetchTripFile(fleet, year, month);
          ++summary.available;
        } catch (const SourceNotPublishedException& e) {
          // A month not published yet is how a missing December surfaces. The imputer deals with it.
          Log().Info("Skipping " + TripFileName(fleet, year, month) + ": " + e.OriginalDescription());
          ++summary.not_published;
        }
      }
    }
  }
  Log().Info("Ingestion: " + strings::ToString(summary.available) + " trip files available, " +
             strings::ToString(summary.not_published) + " not published.");
  return summary;
}

}  // namespace cordon

#endif  // CORDON_FETCHER_INGEST_H
