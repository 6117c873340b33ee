#pragma once

// Umbrella header for StrataCore.

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include "config.hpp"
#include "db.hpp"
#include "name_mapping_store.hpp"
#include "name_codec.hpp"
#include "flattener.hpp"
#include "schema_manager.hpp"
#include "condition.hpp"
#include "document_store.hpp"
