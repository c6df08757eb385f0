#include "gt/Codec.hpp"
#include "test/Test.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

using Geotime::WideTime;
using Geotime::int128_t;
using Geotime::uint128_t;
using Geotime::Codec::Alphabet;
using Geotime::Error::Record;

static const int128_t wideMax = static_cast<int128_t>(~static_cast<uint128_t>(0) >> 1);
static const int128_t wideMin = -wideMax - 1;

static const Alphabet* const alphabets[] = {
    &Geotime::Codec::HexAlphabet,
    &Geotime::Codec::Base32HexAlphabet,
    &Geotime::Codec::GeohashAlphabet,
    &Geotime::Codec::Lexical64Alphabet
};

// Sorted samples spanning the domain, with neighbours around every byte boundary of interest.
static std::vector<int128_t> sortedSamples() {
    std::vector<int128_t> samples = {
        wideMin,
        wideMin + 1,
        -(static_cast<int128_t>(1) << 64) - 1,
        -(static_cast<int128_t>(1) << 64),
        -(static_cast<int128_t>(1) << 63) - 1,
        -5364662400000LL,
        -256,
        -255,
        -100,
        -1,
        0,
        1,
        100,
        255,
        256,
        1700000000000LL,
        static_cast<int128_t>(1) << 63,
        static_cast<int128_t>(1) << 64,
        wideMax - 1,
        wideMax
    };

    std::mt19937_64 rng(0x6774u);
    for (int32_t i = 0; i < 200; i++) {
        auto hi = static_cast<uint128_t>(rng());
        auto lo = static_cast<uint128_t>(rng());
        // Vary the magnitude so that short and long values are both covered.
        auto shift = static_cast<uint32_t>(rng() % 128);
        samples.push_back(static_cast<int128_t>((hi << 64 | lo)) >> shift);
    }

    std::sort(samples.begin(), samples.end());
    samples.erase(std::unique(samples.begin(), samples.end()), samples.end());
    return samples;
}

TEST_CASE("Geotime::Codec::SignFlip", "[codec]") {
    SECTION("maps signed order onto unsigned order") {
        auto samples = sortedSamples();
        for (size_t i = 1; i < samples.size(); i++) {
            REQUIRE((Geotime::Codec::SignFlip(samples[i - 1]) < Geotime::Codec::SignFlip(samples[i])));
        }

        REQUIRE((Geotime::Codec::SignFlip(wideMin) == 0));
        REQUIRE((Geotime::Codec::SignFlip(wideMax) == ~static_cast<uint128_t>(0)));
    }

    SECTION("is self inverse") {
        for (auto value : sortedSamples()) {
            REQUIRE((Geotime::Codec::SignUnflip(Geotime::Codec::SignFlip(value)) == value));
        }
    }
}

TEST_CASE("Geotime::Codec::ToBytes", "[codec]") {
    SECTION("writes sixteen bytes big-endian") {
        uint8_t bytes[GT_CODEC_WIDTH];
        Geotime::Codec::ToBytes(static_cast<uint128_t>(0x0102), bytes);

        for (int32_t i = 0; i < GT_CODEC_WIDTH - 2; i++) {
            REQUIRE(bytes[i] == 0);
        }
        REQUIRE(bytes[14] == 0x01);
        REQUIRE(bytes[15] == 0x02);

        REQUIRE((Geotime::Codec::FromBytes(bytes) == 0x0102));
    }
}

TEST_CASE("Geotime::Codec::Encode fixed points", "[codec]") {
    SECTION("hex") {
        using Geotime::Codec::LexicalHex;

        REQUIRE(LexicalHex(WideTime::FromNarrow(int32_t(0))).Str() == "80000000000000000000000000000000");
        REQUIRE(LexicalHex(WideTime::FromNarrow(int32_t(-1))).Str() == "7fffffffffffffffffffffffffffffff");
        REQUIRE(LexicalHex(WideTime::FromNarrow(int32_t(1))).Str() == "80000000000000000000000000000001");
        REQUIRE(LexicalHex(WideTime::FromNarrow(int32_t(100))).Str() == "80000000000000000000000000000064");
        REQUIRE(LexicalHex(WideTime::FromNarrow(int32_t(-100))).Str() == "7fffffffffffffffffffffffffffff9c");
        REQUIRE(LexicalHex(WideTime(wideMin)).Str() == "00000000000000000000000000000000");
        REQUIRE(LexicalHex(WideTime(wideMax)).Str() == "ffffffffffffffffffffffffffffffff");
    }

    SECTION("base32hex without padding") {
        using Geotime::Codec::LexicalBase32Hex;

        REQUIRE(LexicalBase32Hex(WideTime::FromNarrow(int32_t(0))).Str() == "G0000000000000000000000000");
        REQUIRE(LexicalBase32Hex(WideTime::FromNarrow(int32_t(1))).Str() == "G0000000000000000000000004");
        REQUIRE(LexicalBase32Hex(WideTime::FromNarrow(int32_t(-1))).Str() == "FVVVVVVVVVVVVVVVVVVVVVVVVS");
        REQUIRE(LexicalBase32Hex(WideTime::FromNarrow(int32_t(100))).Str() == "G00000000000000000000000CG");
        REQUIRE(LexicalBase32Hex(WideTime::FromNarrow(int32_t(-100))).Str() == "FVVVVVVVVVVVVVVVVVVVVVVVJG");
    }

    SECTION("geohash") {
        using Geotime::Codec::LexicalGeohash;

        REQUIRE(LexicalGeohash(WideTime::FromNarrow(int32_t(0))).Str() == "h0000000000000000000000000");
        REQUIRE(LexicalGeohash(WideTime::FromNarrow(int32_t(-1))).Str() == "gzzzzzzzzzzzzzzzzzzzzzzzzw");
        REQUIRE(LexicalGeohash(WideTime::FromNarrow(int64_t(1700000000000LL))).Str() == "h000000000000000065wztc800");
    }

    SECTION("lexical64") {
        using Geotime::Codec::Lexical64;

        REQUIRE(Lexical64(WideTime::FromNarrow(int32_t(0))).Str() == "V000000000000000000000");
        REQUIRE(Lexical64(WideTime::FromNarrow(int32_t(1))).Str() == "V00000000000000000000F");
        REQUIRE(Lexical64(WideTime::FromNarrow(int32_t(-1))).Str() == "Uzzzzzzzzzzzzzzzzzzzzk");
        REQUIRE(Lexical64(WideTime::FromNarrow(int32_t(100))).Str() == "V0000000000000000000O0");
        REQUIRE(Lexical64(WideTime(wideMin)).Str() == "0000000000000000000000");
        REQUIRE(Lexical64(WideTime(wideMax)).Str() == "zzzzzzzzzzzzzzzzzzzzzk");
    }
}

TEST_CASE("Geotime::Codec alphabets", "[codec]") {
    SECTION("symbols ascend in character code order") {
        for (auto alphabet : alphabets) {
            std::string symbols(alphabet->symbols);
            REQUIRE(symbols.size() == alphabet->Size());
            REQUIRE(std::is_sorted(symbols.begin(), symbols.end()));
            REQUIRE(std::adjacent_find(symbols.begin(), symbols.end()) == symbols.end());
        }
    }

    SECTION("encoded lengths are fixed") {
        REQUIRE(Geotime::Codec::HexAlphabet.EncodedLength(GT_CODEC_WIDTH) == 32);
        REQUIRE(Geotime::Codec::Base32HexAlphabet.EncodedLength(GT_CODEC_WIDTH) == 26);
        REQUIRE(Geotime::Codec::GeohashAlphabet.EncodedLength(GT_CODEC_WIDTH) == 26);
        REQUIRE(Geotime::Codec::Lexical64Alphabet.EncodedLength(GT_CODEC_WIDTH) == 22);
    }
}

TEST_CASE("Geotime::Codec round trip and order", "[codec]") {
    auto samples = sortedSamples();

    for (auto alphabet : alphabets) {
        SECTION(std::string("round trips every sample in ") + alphabet->name) {
            auto length = alphabet->EncodedLength(GT_CODEC_WIDTH);

            for (auto value : samples) {
                auto text = Geotime::Codec::Encode(*alphabet, WideTime(value));
                REQUIRE(text.size() == length);

                WideTime decoded;
                Record error;
                REQUIRE(Geotime::Codec::Decode(*alphabet, text, decoded, &error));
                REQUIRE(error.Ok());
                REQUIRE(decoded == WideTime(value));
            }
        }

        SECTION(std::string("preserves order in ") + alphabet->name) {
            std::string previous;

            for (auto value : samples) {
                auto text = Geotime::Codec::Encode(*alphabet, WideTime(value));
                if (!previous.empty()) {
                    REQUIRE(previous < text);
                }
                previous = text;
            }
        }
    }
}

TEST_CASE("Geotime::Codec::Lexical", "[codec]") {
    SECTION("parses back to the same time") {
        using Geotime::Codec::Lexical64;

        Lexical64 parsed;
        REQUIRE(Lexical64::Parse("V00000000000000000000F", parsed));
        REQUIRE(parsed.Time() == WideTime::FromNarrow(int32_t(1)));
        REQUIRE(parsed == Lexical64(WideTime::FromNarrow(int32_t(1))));
        REQUIRE(Lexical64(WideTime()) < parsed);
        REQUIRE(&Lexical64::GetAlphabet() == &Geotime::Codec::Lexical64Alphabet);
    }

    SECTION("leaves the result untouched on failure") {
        using Geotime::Codec::LexicalHex;

        LexicalHex parsed(WideTime::FromNarrow(int32_t(7)));
        Record error;
        REQUIRE_FALSE(LexicalHex::Parse("8000", parsed, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);
        REQUIRE(parsed.Time() == WideTime::FromNarrow(int32_t(7)));
    }
}

TEST_CASE("Geotime::Codec::Decode errors", "[codec]") {
    using Geotime::Codec::Decode;

    WideTime time;
    Record error;

    SECTION("truncated input") {
        REQUIRE_FALSE(Decode(Geotime::Codec::HexAlphabet, std::string("8000000000000000000000000000000"), time, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);

        error.Clear();
        REQUIRE_FALSE(Decode(Geotime::Codec::Base32HexAlphabet, std::string("G000000000000000000000000"), time, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);

        error.Clear();
        REQUIRE_FALSE(Decode(Geotime::Codec::Lexical64Alphabet, std::string("V00000000000000000000"), time, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);

        error.Clear();
        REQUIRE_FALSE(Decode(Geotime::Codec::GeohashAlphabet, std::string(""), time, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);
    }

    SECTION("symbol outside the alphabet") {
        REQUIRE_FALSE(Decode(Geotime::Codec::HexAlphabet, std::string("8000000000000000000000000000000g"), time, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);
        REQUIRE(error.position == 31);

        // Hex decodes lowercase only, so each value has exactly one valid spelling.
        error.Clear();
        REQUIRE_FALSE(Decode(Geotime::Codec::HexAlphabet, std::string("7FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"), time, &error));
        REQUIRE(error.position == 1);

        error.Clear();
        REQUIRE_FALSE(Decode(Geotime::Codec::Base32HexAlphabet, std::string("W0000000000000000000000000"), time, &error));
        REQUIRE(error.position == 0);

        error.Clear();
        REQUIRE_FALSE(Decode(Geotime::Codec::GeohashAlphabet, std::string("h00000000000a0000000000000"), time, &error));
        REQUIRE(error.position == 12);

        error.Clear();
        REQUIRE_FALSE(Decode(Geotime::Codec::Lexical64Alphabet, std::string("V000000000+00000000000"), time, &error));
        REQUIRE(error.position == 10);
        REQUIRE(std::string(error.message) == "lexical64: invalid symbol '+' at 10");
    }

    SECTION("padding is not part of any alphabet") {
        REQUIRE_FALSE(Decode(Geotime::Codec::Base32HexAlphabet, std::string("G0000000000000000000000000======"), time, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);
        REQUIRE(error.position == 26);
    }

    SECTION("decoded length other than sixteen bytes") {
        REQUIRE_FALSE(Decode(Geotime::Codec::HexAlphabet, std::string("800000000000000000000000000000000000"), time, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);
        REQUIRE(std::string(error.message) == "hex: decoded 18 bytes, expected 16");

        error.Clear();
        REQUIRE_FALSE(Decode(Geotime::Codec::Base32HexAlphabet, std::string("G00000000000000000000000"), time, &error));
        REQUIRE(std::string(error.message) == "base32hex: decoded 15 bytes, expected 16");
    }

    SECTION("non-canonical trailing bits") {
        REQUIRE_FALSE(Decode(Geotime::Codec::Base32HexAlphabet, std::string("G0000000000000000000000001"), time, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);
        REQUIRE(error.position == 25);

        error.Clear();
        REQUIRE_FALSE(Decode(Geotime::Codec::Lexical64Alphabet, std::string("V000000000000000000001"), time, &error));
        REQUIRE(error.position == 21);
    }

    SECTION("null input") {
        REQUIRE_FALSE(Decode(Geotime::Codec::HexAlphabet, nullptr, 0, time, &error));
        REQUIRE(error.kind == Geotime::Error::Decode);
    }

    SECTION("the output is untouched on failure") {
        time = WideTime::FromNarrow(int32_t(9));
        REQUIRE_FALSE(Decode(Geotime::Codec::HexAlphabet, std::string("zz"), time));
        REQUIRE(time == WideTime::FromNarrow(int32_t(9)));
    }
}
