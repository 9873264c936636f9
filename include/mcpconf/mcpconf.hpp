#pragma once

/// Umbrella header for the mcpconf registry library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "codec.hpp"
#include "atomic_file.hpp"
#include "file_lock.hpp"
#include "registry.hpp"
#include "backup_store.hpp"
#include "mutation_engine.hpp"
#include "process.hpp"
#include "installer.hpp"
#include "probes.hpp"
#include "diagnostics.hpp"
#include "settings.hpp"
#include "logging.hpp"
