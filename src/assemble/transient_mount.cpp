#include "assemble/transient_mount.hpp"

#include "log/log.hpp"

namespace relpack::assemble {

TransientMount::TransientMount(ImageBackend& backend, MountHandle handle)
    : backend_(backend), handle_(std::move(handle)) {}

TransientMount::~TransientMount() {
    if (!released_) {
        auto result = release();
        if (is_err(result)) {
            RELPACK_LOG_ERROR("assemble", "Volume " << handle_.device
                                                    << " is still attached: "
                                                    << unwrap_err(result).message);
        }
    }
}

Result<Unit> TransientMount::release() {
    if (released_)
        return Unit{};
    released_ = true;

    auto plain = backend_.detach(handle_, false);
    if (is_ok(plain)) {
        RELPACK_LOG_DEBUG("assemble", "Detached " << handle_.device);
        return Unit{};
    }

    RELPACK_LOG_WARN("assemble", "Detach of " << handle_.device << " failed ("
                                              << unwrap_err(plain).message
                                              << "), retrying with force");
    auto forced = backend_.detach(handle_, true);
    if (is_err(forced))
        return unwrap_err(forced);
    return Unit{};
}

} // namespace relpack::assemble
