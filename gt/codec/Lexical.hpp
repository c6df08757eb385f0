#ifndef GT_CODEC_LEXICAL_HPP
#define GT_CODEC_LEXICAL_HPP

#include "gt/codec/Codec.hpp"

#include <string>

namespace Geotime {
namespace Codec {

// Types

// Serialization view of a WideTime in one alphabet. Str() is fixed length and sorts
// in the same order as the times it encodes.
template<const Alphabet& A>
class Lexical {
    public:
        static bool Parse(const std::string& text, Lexical& result, Error::Record* error = nullptr) {
            WideTime time;
            if (!Decode(A, text, time, error)) {
                return false;
            }

            result = Lexical(time);
            return true;
        }

        static const Alphabet& GetAlphabet() {
            return A;
        }

        Lexical() {
        }

        explicit Lexical(const WideTime& time) : time(time) {
        }

        const WideTime& Time() const {
            return this->time;
        }

        std::string Str() const {
            return Encode(A, this->time);
        }

        bool operator==(const Lexical& other) const { return this->time == other.time; }
        bool operator!=(const Lexical& other) const { return this->time != other.time; }
        bool operator<(const Lexical& other) const { return this->time < other.time; }

    private:
        WideTime time;
};

typedef Lexical<HexAlphabet>       LexicalHex;
typedef Lexical<Base32HexAlphabet> LexicalBase32Hex;
typedef Lexical<GeohashAlphabet>   LexicalGeohash;
typedef Lexical<Lexical64Alphabet> Lexical64;

} // namespace Codec
} // namespace Geotime

#endif
