// swarmflow/swarmflow.h
#ifndef SWARMFLOW_SWARMFLOW_H
#define SWARMFLOW_SWARMFLOW_H

#include "swarmflow/core/orchestrator.h"
#include "common/log/logger.h"

#endif // SWARMFLOW_SWARMFLOW_H
