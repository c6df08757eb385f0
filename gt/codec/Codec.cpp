#include "gt/codec/Codec.hpp"
#include "gt/Debug.hpp"

namespace Geotime {
namespace Codec {

// Global variables

constexpr uint128_t signMask = static_cast<uint128_t>(1) << 127;

// Local functions

static void describeSymbol(char ch, char* dest, size_t capacity) {
    auto byte = static_cast<unsigned char>(ch);

    if (byte >= 0x20 && byte < 0x7F) {
        String::Format(dest, capacity, "'%c'", ch);
    } else {
        String::Format(dest, capacity, "0x%02x", static_cast<unsigned int>(byte));
    }
}

// Functions

uint128_t SignFlip(int128_t value) {
    return static_cast<uint128_t>(value) ^ signMask;
}

int128_t SignUnflip(uint128_t value) {
    return static_cast<int128_t>(value ^ signMask);
}

void ToBytes(uint128_t value, uint8_t (&bytes)[GT_CODEC_WIDTH]) {
    for (int32_t i = GT_CODEC_WIDTH - 1; i >= 0; i--) {
        bytes[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

uint128_t FromBytes(const uint8_t (&bytes)[GT_CODEC_WIDTH]) {
    uint128_t value = 0;

    for (int32_t i = 0; i < GT_CODEC_WIDTH; i++) {
        value = (value << 8) | bytes[i];
    }

    return value;
}

std::string EncodeBytes(const Alphabet& alphabet, const uint8_t* bytes, size_t count) {
    std::string result;
    result.reserve(alphabet.EncodedLength(count));

    auto     mask    = alphabet.Size() - 1;
    uint32_t buffer  = 0;
    uint32_t pending = 0; // bits held in buffer

    for (size_t i = 0; i < count; i++) {
        buffer = (buffer << 8) | bytes[i];
        pending += 8;

        while (pending >= alphabet.bits) {
            pending -= alphabet.bits;
            result += alphabet.symbols[(buffer >> pending) & mask];
        }

        buffer &= (1U << pending) - 1;
    }

    // Complete the final symbol with zero bits
    if (pending > 0) {
        result += alphabet.symbols[(buffer << (alphabet.bits - pending)) & mask];
    }

    GT_ASSERT(result.size() == alphabet.EncodedLength(count));
    return result;
}

bool DecodeBytes(const Alphabet& alphabet, const char* text, size_t length, std::vector<uint8_t>& bytes, Error::Record* error) {
    if (text == nullptr) {
        GT_SET_ERROR_MSG(error, Error::Decode, "%s: null input", alphabet.name);
        return false;
    }

    // A length is only reachable by EncodeBytes if its leftover bits are less than one symbol.
    if ((length * alphabet.bits) % 8 >= alphabet.bits) {
        GT_SET_ERROR_MSG(error, Error::Decode, "%s: invalid length %zu", alphabet.name, length);
        return false;
    }

    bytes.clear();
    bytes.reserve(length * alphabet.bits / 8);

    uint32_t buffer  = 0;
    uint32_t pending = 0;

    for (size_t i = 0; i < length; i++) {
        auto index = alphabet.Index(text[i]);
        if (index < 0) {
            char symbol[8];
            describeSymbol(text[i], symbol, sizeof(symbol));
            GT_SET_ERROR_AT(error, Error::Decode, i, "%s: invalid symbol %s at %zu", alphabet.name, symbol, i);
            return false;
        }

        buffer = (buffer << alphabet.bits) | static_cast<uint32_t>(index);
        pending += alphabet.bits;

        if (pending >= 8) {
            pending -= 8;
            bytes.push_back(static_cast<uint8_t>(buffer >> pending));
        }

        buffer &= (1U << pending) - 1;
    }

    // Trailing bits are padding and must be zero, otherwise two strings would decode alike.
    if (buffer != 0) {
        GT_SET_ERROR_AT(error, Error::Decode, length - 1, "%s: non-canonical trailing bits at %zu", alphabet.name, length - 1);
        return false;
    }

    return true;
}

std::string Encode(const Alphabet& alphabet, const WideTime& time) {
    uint8_t bytes[GT_CODEC_WIDTH];
    ToBytes(SignFlip(time.Value()), bytes);

    return EncodeBytes(alphabet, bytes, GT_CODEC_WIDTH);
}

bool Decode(const Alphabet& alphabet, const char* text, size_t length, WideTime& time, Error::Record* error) {
    std::vector<uint8_t> decoded;
    if (!DecodeBytes(alphabet, text, length, decoded, error)) {
        return false;
    }

    if (decoded.size() != GT_CODEC_WIDTH) {
        GT_SET_ERROR_MSG(error, Error::Decode, "%s: decoded %zu bytes, expected %d", alphabet.name, decoded.size(), GT_CODEC_WIDTH);
        return false;
    }

    uint8_t bytes[GT_CODEC_WIDTH];
    String::MemCopy(bytes, decoded.data(), GT_CODEC_WIDTH);

    time = WideTime(SignUnflip(FromBytes(bytes)));
    return true;
}

bool Decode(const Alphabet& alphabet, const std::string& text, WideTime& time, Error::Record* error) {
    return Decode(alphabet, text.data(), text.size(), time, error);
}

} // namespace Codec
} // namespace Geotime
