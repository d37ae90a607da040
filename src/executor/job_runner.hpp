#pragma once

#include <core/types.hpp>
#include "cancel_token.hpp"
#include "job.hpp"

// Executes one job to a terminal JobResult. Implementations must be safe to
// call from several worker threads at once.
class JobRunner {
public:
    virtual ~JobRunner() = default;

    // Readiness probe, called once before any job is dispatched.
    virtual Result<void> preflight() = 0;

    // Always returns a result in a terminal state.
    virtual JobResult run(Job job, const CancelToken& cancel) = 0;
};
