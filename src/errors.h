#pragma once

namespace meshshare {

/**
 * Error kinds returned by the public transfer operations.
 * None means the operation succeeded.
 */
enum class FileshareError {
    None,
    TransferNotFound,
    FileNotFound,
    SizeLimitExceeded,
    TransferAcceptOutgoing,     // Only incoming transfers can be accepted
    TransferAlreadyAccepted,    // Transfer is no longer in Requested state
    TransferNotCancelable,      // Transfer or file already reached a final state
    TransferAlreadyExists
};

/**
 * Convert error kind to a user-facing string
 */
const char* error_to_string(FileshareError error);

} // namespace meshshare
