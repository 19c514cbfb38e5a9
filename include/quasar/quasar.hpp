//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/quasar/quasar.hpp
// Purpose: Public entry point that pulls in the whole IPC core.
// Key invariants: Forwards to the headers under src/; declares nothing itself.
// Ownership/Lifetime: Header-only convenience; no state or allocation.
// Links: src/portal/portal.hpp, src/ipc/kernel.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/config.hpp"
#include "support/error.hpp"
#include "support/log.hpp"
#include "support/result.hpp"

#include "state/atomic_state.hpp"
#include "state/state_table.hpp"

#include "sched/cancel.hpp"
#include "sched/executor.hpp"
#include "sched/task.hpp"

#include "ipc/kernel.hpp"
#include "ipc/sync_bridge.hpp"
#include "ipc/sync_mode.hpp"
#include "ipc/types.hpp"

#include "portal/portal.hpp"
#include "portal/schema.hpp"
#include "portal/type.hpp"
#include "portal/value.hpp"
#include "portal/wire.hpp"
