#pragma once

#include "store.hpp"

namespace catalog {

// The catalog every process starts with; nothing is persisted between runs.
Store make_seed_store();

}  // namespace catalog
