#include "Checkpoint.hpp"
#include "FlexibleBarrier.hpp"
#include "WorkerContext.hpp"

namespace Checkpoint {

int sync() {
    return sync(FlexibleBarrier::WAIT_FOREVER);
}

int sync(long timeout_ms) {
    WorkerContext* worker = WorkerContext::current();
    if (worker == nullptr || worker->barrier() == nullptr) {
        return FlexibleBarrier::NO_POSITION;
    }
    return worker->barrier()->await(timeout_ms);
}

}
