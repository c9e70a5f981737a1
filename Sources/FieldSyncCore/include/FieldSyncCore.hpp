#pragma once

// Umbrella header for the FieldSync offline sync core.

#include "fieldsync/log.hpp"
#include "fieldsync/types.hpp"
#include "fieldsync/db.hpp"
#include "fieldsync/entities.hpp"
#include "fieldsync/mutation.hpp"
#include "fieldsync/session.hpp"
#include "fieldsync/local_store.hpp"
#include "fieldsync/scheduler.hpp"
#include "fieldsync/network.hpp"
#include "fieldsync/remote.hpp"
#include "fieldsync/http_remote.hpp"
#include "fieldsync/connectivity.hpp"
#include "fieldsync/auth_cache.hpp"
#include "fieldsync/conflict.hpp"
#include "fieldsync/sync_processor.hpp"
#include "fieldsync/coordinator.hpp"
#include "fieldsync/config.hpp"
#include "fieldsync/engine.hpp"
