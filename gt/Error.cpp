#include "gt/Error.hpp"

namespace Geotime {
namespace Error {

// Classes

Record::Record() {
    this->Clear();
}

bool Record::Ok() const {
    return this->kind == None;
}

void Record::Clear() {
    this->kind       = None;
    this->position   = -1;
    this->message[0] = '\0';
}

// Functions

const char* KindName(Kind kind) {
    switch (kind) {
    case None:
        return "none";
    case Range:
        return "range error";
    case Conversion:
        return "conversion error";
    case Decode:
        return "decode error";
    default:
        return "unknown error";
    }
}

void Set(Record* record, Kind kind, int32_t position, const char* message) {
    if (record == nullptr) {
        return;
    }

    record->kind     = kind;
    record->position = position;

    if (message == nullptr) {
        message = KindName(kind);
    }

    String::Copy(record->message, message, GT_ERROR_MESSAGE_SIZE);
}

void Convert(Record* record, Kind kind) {
    if (record == nullptr || record->kind == None) {
        return;
    }

    record->kind = kind;
}

} // namespace Error
} // namespace Geotime
