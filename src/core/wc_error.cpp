#include "wc_error.hpp"

const char* wc_error_kind_name(WCErrorKind kind) {
    switch (kind) {
        case WCErrorKind::Inconsistent:          return "inconsistent";
        case WCErrorKind::NotAWorkingCopy:       return "not-a-working-copy";
        case WCErrorKind::NotFound:              return "not-found";
        case WCErrorKind::AlreadyAWorkingCopy:   return "already-a-working-copy";
        case WCErrorKind::InvalidExternalStore:  return "invalid-external-store";
        case WCErrorKind::InvalidPath:           return "invalid-path";
        case WCErrorKind::PermissionDenied:      return "permission-denied";
        case WCErrorKind::DoubleLock:            return "double-lock";
        case WCErrorKind::UnacquiredLockRelease: return "unacquired-lock-release";
    }
    return "unknown";
}
