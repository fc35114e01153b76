#pragma once

namespace arbx {

// Venue state owned by one attempt. A chain-backed venue is reverted with
// the enclosing transaction and keeps these as no-ops; an in-process venue
// snapshots on begin and puts the snapshot back on revert.
class AtomicSequence {
public:
    virtual ~AtomicSequence() = default;

    virtual void begin_sequence() {}
    virtual void commit_sequence() {}
    virtual void revert_sequence() {}
};

} // namespace arbx
