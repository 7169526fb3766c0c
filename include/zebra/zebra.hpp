#pragma once
// Zebra: label-indexed resource inventory core
//
// - Resources: typed entities with key/value labels (resource.hpp)
// - ResourceMap: key -> shared resource lists (resource_map.hpp)
// - Factory: type tag -> zero-value constructor (factory.hpp)
// - Queries: MatchEqual / MatchNotEqual / MatchIn / MatchNotIn (query.hpp)
// - LabelStore: concurrent identity + label index (label_store.hpp)
// - Filter: label matching without an index (filter.hpp)

#include "version.hpp"
#include "status.hpp"
#include "log.hpp"
#include "config.hpp"
#include "resource.hpp"
#include "resource_map.hpp"
#include "factory.hpp"
#include "query.hpp"
#include "posting.hpp"
#include "label_store.hpp"
#include "filter.hpp"
