#ifndef GT_CODEC_HPP
#define GT_CODEC_HPP

#include "gt/codec/Alphabet.hpp"
#include "gt/codec/Codec.hpp"
#include "gt/codec/Lexical.hpp"

#endif
