#pragma once

#include <stdexcept>
#include <string>

namespace auraseal {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A bit sequence or length table that no valid canonical code can produce.
class CodecCorruptError : public Error {
public:
    using Error::Error;
};

// A fetched part failed parsing, digest, crc or coherence checks.
class ChunkCorruptError : public Error {
public:
    using Error::Error;
};

class NetworkTimeoutError : public Error {
public:
    using Error::Error;
};

// More data parts are missing than there are parity parts available.
class UnrecoverableError : public Error {
public:
    using Error::Error;
};

class InsufficientPartsError : public Error {
public:
    using Error::Error;
};

class IntegrityMismatchError : public Error {
public:
    using Error::Error;
};

class MalformedManifestError : public Error {
public:
    using Error::Error;
};

class MalformedIntegrityStringError : public Error {
public:
    using Error::Error;
};

class CancelledError : public Error {
public:
    using Error::Error;
};

} // namespace auraseal
