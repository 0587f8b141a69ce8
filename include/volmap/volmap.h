#pragma once

/// @file volmap.h
/// Umbrella header for the full volmap C++ API.

#include "error.h"
#include "types.h"
#include "config.h"
#include "log.h"
#include "privilege.h"
#include "template_sync.h"
#include "link_reconciler.h"
#include "group_access.h"
#include "mount_plan.h"
#include "stages.h"
#include "cli.h"
