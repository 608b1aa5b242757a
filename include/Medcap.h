#ifndef MEDCAP_LIBRARY_H
#define MEDCAP_LIBRARY_H

#include "../src/core.hpp"
#include "../src/common/config.hpp"
#include "../src/data/collate.hpp"
#include "../src/data/load/load.hpp"
#include "../src/caption/cache.hpp"
#include "../src/text/report.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the dataset facade plus the stages it is built from (catalog
//    join, report processing, caption cache, image squaring, collation) so
//    callers can drive any of them on their own.
//  - Header-only: everything lives under src/ and is composed at compile time.

#endif // MEDCAP_LIBRARY_H
