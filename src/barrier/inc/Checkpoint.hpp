#pragma once

// Synchronization point for code running inside a worker.
namespace Checkpoint {

// Waits until every live worker of the run has reached this point or failed.
// Returns the caller's arrival order, or -1 when the calling thread is not a
// worker or its run has no barrier (serial execution).
int sync();

// Same, but a worker that has not arrived `timeout_ms` after this caller
// started waiting is failed. 0 returns -1 without waiting.
int sync(long timeout_ms);

}
