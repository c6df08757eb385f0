#ifndef GT_ERROR_HPP
#define GT_ERROR_HPP

#include "gt/String.hpp"

#include <cstdint>

#define GT_ERROR_MESSAGE_SIZE 160

// Fill an optional Error::Record*.
#define GT_SET_ERROR(record, errorKind) \
    ::Geotime::Error::Set(record, errorKind, -1, nullptr)

#define GT_SET_ERROR_MSG(record, errorKind, ...) \
    do { \
        if ((record) != nullptr) { \
            char gtErrorMsg[GT_ERROR_MESSAGE_SIZE]; \
            ::Geotime::String::Format(gtErrorMsg, GT_ERROR_MESSAGE_SIZE, __VA_ARGS__); \
            ::Geotime::Error::Set(record, errorKind, -1, gtErrorMsg); \
        } \
    } while (0)

// Same as GT_SET_ERROR_MSG, also records the offending input offset.
#define GT_SET_ERROR_AT(record, errorKind, pos, ...) \
    do { \
        if ((record) != nullptr) { \
            char gtErrorMsg[GT_ERROR_MESSAGE_SIZE]; \
            ::Geotime::String::Format(gtErrorMsg, GT_ERROR_MESSAGE_SIZE, __VA_ARGS__); \
            ::Geotime::Error::Set(record, errorKind, static_cast<int32_t>(pos), gtErrorMsg); \
        } \
    } while (0)

namespace Geotime {
namespace Error {

// Types

enum Kind : int32_t {
    None       = 0,
    // A 128-bit value does not fit in 64-bit milliseconds.
    Range      = 1,
    // Milliseconds cannot be represented as a calendar instant.
    Conversion = 2,
    // Encoded text is not a well-formed 16-byte payload for its alphabet.
    Decode     = 3
};

class Record {
    public:
        Kind    kind;
        // Offset into the decoded text, or -1.
        int32_t position;
        char    message[GT_ERROR_MESSAGE_SIZE];

        Record();

        bool Ok() const;
        void Clear();
};

// Functions

const char* KindName(Kind kind);

void Set(Record* record, Kind kind, int32_t position, const char* message);

// Re-tag an error at a boundary, keeping its message and position.
void Convert(Record* record, Kind kind);

} // namespace Error
} // namespace Geotime

#endif
