#pragma once
#include "core/CancellationToken.h"
#include "core/ConfigManager.h"
#include "model/CodeModel.h"

// Everything one query needs; lives on the caller's stack for the query's duration.
struct QueryContext {
    const ICodeModel& model;
    const QueryLimits& limits;
    const CancellationToken& cancel;
};
