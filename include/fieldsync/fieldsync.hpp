#pragma once

// Main include file for fieldsync

#define FIELDSYNC_VERSION_MAJOR 1
#define FIELDSYNC_VERSION_MINOR 0
#define FIELDSYNC_VERSION_PATCH 0

// Utilities
#include "fieldsync/util/expected.hpp"
#include "fieldsync/util/json.hpp"
#include "fieldsync/util/time.hpp"

// Core
#include "fieldsync/core/config.hpp"
#include "fieldsync/core/error.hpp"
#include "fieldsync/core/logging.hpp"
#include "fieldsync/core/metrics.hpp"

// Model
#include "fieldsync/model/actor.hpp"
#include "fieldsync/model/assignment.hpp"
#include "fieldsync/model/metadata.hpp"
#include "fieldsync/model/note.hpp"
#include "fieldsync/model/task.hpp"
#include "fieldsync/model/task_status.hpp"

// Lifecycle
#include "fieldsync/lifecycle/assignment_registry.hpp"
#include "fieldsync/lifecycle/state_machine.hpp"

// Storage
#include "fieldsync/store/memory_repository.hpp"
#include "fieldsync/store/repository.hpp"
#include "fieldsync/store/task_locks.hpp"

// Sync
#include "fieldsync/sync/broadcaster.hpp"
#include "fieldsync/sync/conflict.hpp"
#include "fieldsync/sync/conflict_resolver.hpp"
#include "fieldsync/sync/resolution_policy.hpp"
#include "fieldsync/sync/sync_orchestrator.hpp"

// Services
#include "fieldsync/service/activity_service.hpp"
