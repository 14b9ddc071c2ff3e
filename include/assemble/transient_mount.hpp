//! # Transient Mount
//!
//! RAII guard over an attached volume. The volume is detached exactly once:
//! by an explicit `release()` or, on any early return, by the destructor. A
//! failed plain detach is retried with force.

#ifndef RELPACK_ASSEMBLE_TRANSIENT_MOUNT_HPP
#define RELPACK_ASSEMBLE_TRANSIENT_MOUNT_HPP

#include "assemble/image_backend.hpp"
#include "common.hpp"

namespace relpack::assemble {

class TransientMount {
public:
    TransientMount(ImageBackend& backend, MountHandle handle);
    ~TransientMount();

    TransientMount(const TransientMount&) = delete;
    TransientMount& operator=(const TransientMount&) = delete;

    const MountHandle& handle() const {
        return handle_;
    }

    /// Detaches now. Later calls (and the destructor) do nothing. Returns the
    /// forced detach's error if both attempts failed.
    Result<Unit> release();

    bool released() const {
        return released_;
    }

private:
    ImageBackend& backend_;
    MountHandle handle_;
    bool released_ = false;
};

} // namespace relpack::assemble

#endif // RELPACK_ASSEMBLE_TRANSIENT_MOUNT_HPP
