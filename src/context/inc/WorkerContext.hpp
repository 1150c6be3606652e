#pragma once
#include <string>
#include <unordered_map>
#include "CancellationToken.hpp"

class FlexibleBarrier;

// One concurrent participant of a run. The object's address is the worker's
// identity, so a context is never copied or moved once created.
class WorkerContext {
public:
    using Properties = std::unordered_map<std::string, std::string>;

    explicit WorkerContext(std::string name, Properties properties = {}, bool can_kill = true);

    WorkerContext(const WorkerContext&) = delete;
    WorkerContext& operator=(const WorkerContext&) = delete;

    const std::string& name() const { return name_; }
    const Properties& properties() const { return properties_; }
    std::string property(const std::string& key, const std::string& fallback = "") const;

    // Replaces each {key} in `text` with that property, {name} with the
    // worker name. Placeholders with no matching property stay as written.
    std::string expand(const std::string& text) const;

    // Whether force-failing this worker also cancels its execution
    bool can_kill() const { return can_kill_; }

    CancellationToken& token() { return token_; }
    const CancellationToken& token() const { return token_; }

    // Null when the worker runs without synchronization (serial mode)
    FlexibleBarrier* barrier() const { return barrier_; }
    void attach_barrier(FlexibleBarrier* barrier) { barrier_ = barrier; }

    // Thread-local lookup of the worker the calling thread runs for
    static WorkerContext* current();
    static void set_current(WorkerContext* context);
    static void remove_current();

    // Makes `context` current and tags the thread's log lines with its name
    class Scope {
    public:
        explicit Scope(WorkerContext& context);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
    };

private:
    const std::string name_;
    const Properties properties_;
    const bool can_kill_;
    CancellationToken token_;
    FlexibleBarrier* barrier_ = nullptr;
};
