#ifndef GT_CODEC_ALPHABET_HPP
#define GT_CODEC_ALPHABET_HPP

#include <cstddef>
#include <cstdint>

namespace Geotime {
namespace Codec {

// Types

// An ordered symbol set. Symbol i encodes the bits value i, so the character codes must
// ascend with i for the encoded strings to sort like the values they encode.
class Alphabet {
    public:
        const char* name;
        const char* symbols;
        // bits per symbol
        uint32_t    bits;

        // Number of symbols, 2^bits.
        uint32_t Size() const;

        // Symbols needed for count bytes. The final symbol is completed with zero bits.
        size_t   EncodedLength(size_t count) const;

        // Returns -1 for characters outside the alphabet.
        int32_t  Index(char ch) const;
};

// Variables

// 0-9 a-f
extern const Alphabet HexAlphabet;

// RFC 4648 base32hex without padding: 0-9 A-V
extern const Alphabet Base32HexAlphabet;

// 0-9 then lowercase letters without a i l o
extern const Alphabet GeohashAlphabet;

// 0-9 = A-Z _ a-z
extern const Alphabet Lexical64Alphabet;

} // namespace Codec
} // namespace Geotime

#endif
