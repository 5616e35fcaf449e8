#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef uint64_t OsStatus;

enum OsStatusId {
    /// @brief The operation was successful.
    OsStatusSuccess = 0x0000,

    /// @brief The operation could not be completed due to a lack of memory.
    OsStatusOutOfMemory = 0x0001,

    /// @brief The requested resource could not be found.
    OsStatusNotFound = 0x0002,

    /// @brief The input to the operation was invalid.
    OsStatusInvalidInput = 0x0003,

    /// @brief The resource does not support the operation.
    OsStatusNotSupported = 0x0004,

    /// @brief The resource already exists.
    OsStatusAlreadyExists = 0x0005,

    /// @brief The data is invalid.
    ///
    /// Data required for the operation is invalid, distinct from @ref OsStatusInvalidInput.
    /// This status is used for when a resource is in an invalid state, rather than the input
    /// parameters being invalid.
    OsStatusInvalidData = 0x000c,

    /// @brief The memory address is not available.
    OsStatusInvalidAddress = 0x0013,

    OsStatusDeviceBusy = 0x0016,
};

#define OS_SUCCESS(status) ((status) == OsStatusSuccess)
#define OS_ERROR(status) ((status) != OsStatusSuccess)

#ifdef __cplusplus
}
#endif
