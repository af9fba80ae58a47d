#include "capabilities.hpp"

const char* fetch_error_name(FetchError e) {
    switch (e) {
        case FetchError::None:             return "none";
        case FetchError::NotFound:         return "not found";
        case FetchError::RateLimited:      return "rate limited";
        case FetchError::Timeout:          return "timeout";
        case FetchError::Unsupported:      return "unsupported";
        case FetchError::TransportFailure: return "transport failure";
        case FetchError::Cancelled:        return "cancelled";
    }
    return "unknown";
}

const char* transfer_error_name(TransferError e) {
    switch (e) {
        case TransferError::None:             return "none";
        case TransferError::TooLarge:         return "too large";
        case TransferError::TransportFailure: return "transport failure";
        case TransferError::Cancelled:        return "cancelled";
    }
    return "unknown";
}

const char* error_class_name(ErrorClass c) {
    switch (c) {
        case ErrorClass::QuotaExceeded: return "QuotaExceeded";
        case ErrorClass::CapacityFull:  return "CapacityFull";
        case ErrorClass::FetchTimeout:  return "FetchTimeout";
        case ErrorClass::FetchFailed:   return "FetchFailed";
        case ErrorClass::UploadFailed:  return "UploadFailed";
        case ErrorClass::Cancelled:     return "Cancelled";
        case ErrorClass::InternalFault: return "InternalFault";
    }
    return "Unknown";
}
