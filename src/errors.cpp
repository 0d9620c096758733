#include "errors.h"

namespace meshshare {

const char* error_to_string(FileshareError error) {
    switch (error) {
        case FileshareError::None: return "ok";
        case FileshareError::TransferNotFound: return "transfer not found";
        case FileshareError::FileNotFound: return "file not found";
        case FileshareError::SizeLimitExceeded: return "transfer size exceeds the limit";
        case FileshareError::TransferAcceptOutgoing: return "outgoing transfers cannot be accepted";
        case FileshareError::TransferAlreadyAccepted: return "transfer was already accepted";
        case FileshareError::TransferNotCancelable: return "transfer can no longer be canceled";
        case FileshareError::TransferAlreadyExists: return "transfer already exists";
        default: return "unknown error";
    }
}

} // namespace meshshare
