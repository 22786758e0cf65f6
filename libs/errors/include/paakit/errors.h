#pragma once

#include <stdexcept>

namespace paakit {

// Base of every error raised by the paakit libraries. Messages carry a
// lower-case component prefix ("paa: ", "dxt: ", ...).
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Structural violation of the PAA container: unknown format code, truncated
// TAGG or mipmap record, missing terminator, broken mipmap chain.
// Fatal to the whole read.
class ContainerFormatError : public Error {
public:
    using Error::Error;
};

// A TAGG with a recognized signature whose payload has the wrong shape.
// Unknown signatures never raise this.
class ChunkFormatError : public Error {
public:
    using Error::Error;
};

// Encoded pixel data does not match the declared dimensions and format.
// Scoped to a single decode call; the rest of the file stays usable.
class DecodeError : public Error {
public:
    using Error::Error;
};

// Corrupt LZO/LZSS stream.
class DecompressionError : public Error {
public:
    using Error::Error;
};

} // namespace paakit
