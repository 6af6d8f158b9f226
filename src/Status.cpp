/**
 * @file Status.cpp
 * @brief Реализация результата операций
 */

#include "Status.h"
#include <stdarg.h>
#include <stdio.h>

const char* errorName(Error error) {
    switch (error) {
        case Error::OK:                     return "OK";
        case Error::INVALID_PARAMETER:      return "InvalidParameter";
        case Error::INVALID_DIRECTION:      return "InvalidDirection";
        case Error::PERSISTENCE_FAILURE:    return "PersistenceFailure";
        case Error::SENSOR_UNAVAILABLE:     return "SensorUnavailable";
        case Error::ACTUATOR_WRITE_FAILURE: return "ActuatorWriteFailure";
    }
    return "Unknown";
}

Status Status::error(Error code, const char* fmt, ...) {
    Status status;
    status.code_ = code;

    va_list args;
    va_start(args, fmt);
    vsnprintf(status.message_, sizeof(status.message_), fmt, args);
    va_end(args);

    return status;
}
