#include "common.hpp"

namespace relpack {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConfigError:
        return "ConfigError";
    case ErrorKind::PrereqMissing:
        return "PrereqMissing";
    case ErrorKind::FetchError:
        return "FetchError";
    case ErrorKind::CompileError:
        return "CompileError";
    case ErrorKind::MergeError:
        return "MergeError";
    case ErrorKind::IconError:
        return "IconError";
    case ErrorKind::IconUnavailable:
        return "IconUnavailable";
    case ErrorKind::AssemblyError:
        return "AssemblyError";
    case ErrorKind::MountTimeout:
        return "MountTimeout";
    case ErrorKind::PresentationWarning:
        return "PresentationWarning";
    }
    return "UnknownError";
}

std::string PackError::to_string() const {
    return std::string(error_kind_name(kind)) + ": " + message;
}

} // namespace relpack
