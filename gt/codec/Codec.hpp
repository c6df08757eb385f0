#ifndef GT_CODEC_CODEC_HPP
#define GT_CODEC_CODEC_HPP

#include "gt/Error.hpp"
#include "gt/Types.hpp"
#include "gt/codec/Alphabet.hpp"
#include "gt/time/WideTime.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Every encoded value is exactly this many bytes before symbol mapping.
#define GT_CODEC_WIDTH 16

namespace Geotime {
namespace Codec {

// Move the sign bit so that signed order becomes unsigned order.
uint128_t   SignFlip(int128_t value);

// Inverse of SignFlip.
int128_t    SignUnflip(uint128_t value);

// Big-endian, always GT_CODEC_WIDTH bytes.
void        ToBytes(uint128_t value, uint8_t (&bytes)[GT_CODEC_WIDTH]);

uint128_t   FromBytes(const uint8_t (&bytes)[GT_CODEC_WIDTH]);

// Pack bytes most significant bit first into alphabet symbols. Never pads.
std::string EncodeBytes(const Alphabet& alphabet, const uint8_t* bytes, size_t count);

// Strict inverse of EncodeBytes: rejects impossible lengths, foreign symbols and
// non-zero trailing bits.
bool        DecodeBytes(const Alphabet& alphabet, const char* text, size_t length, std::vector<uint8_t>& bytes, Error::Record* error = nullptr);

std::string Encode(const Alphabet& alphabet, const WideTime& time);

bool        Decode(const Alphabet& alphabet, const char* text, size_t length, WideTime& time, Error::Record* error = nullptr);

bool        Decode(const Alphabet& alphabet, const std::string& text, WideTime& time, Error::Record* error = nullptr);

} // namespace Codec
} // namespace Geotime

#endif
