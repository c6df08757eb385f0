#include "gt/codec/Alphabet.hpp"

namespace Geotime {
namespace Codec {

// Variables

// These tables are wire formats. Reordering a symbol breaks every stored string.

const Alphabet HexAlphabet = {
    "hex",
    "0123456789abcdef",
    4
};

const Alphabet Base32HexAlphabet = {
    "base32hex",
    "0123456789ABCDEFGHIJKLMNOPQRSTUV",
    5
};

const Alphabet GeohashAlphabet = {
    "geohash",
    "0123456789bcdefghjkmnpqrstuvwxyz",
    5
};

const Alphabet Lexical64Alphabet = {
    "lexical64",
    "0123456789=ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz",
    6
};

// Classes

uint32_t Alphabet::Size() const {
    return 1U << this->bits;
}

size_t Alphabet::EncodedLength(size_t count) const {
    return (count * 8 + this->bits - 1) / this->bits;
}

int32_t Alphabet::Index(char ch) const {
    auto size = this->Size();

    for (uint32_t i = 0; i < size; i++) {
        if (this->symbols[i] == ch) {
            return static_cast<int32_t>(i);
        }
    }

    return -1;
}

} // namespace Codec
} // namespace Geotime
