#pragma once

#include <stdexcept>
#include <string>

namespace bagindex {

class IndexError : public std::runtime_error {
public:
    explicit IndexError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed footer, unknown index type or invalid parameters.
class ConfigError : public IndexError {
public:
    explicit ConfigError(const std::string& what) : IndexError("config error: " + what) {}
};

class EmptyIndexError : public IndexError {
public:
    explicit EmptyIndexError(const std::string& what) : IndexError("empty index: " + what) {}
};

class QueryTooShortError : public IndexError {
public:
    explicit QueryTooShortError(const std::string& what) : IndexError("query too short: " + what) {}
};

// Positional read past the end of a record store.
class OutOfRangeError : public IndexError {
public:
    explicit OutOfRangeError(const std::string& what) : IndexError("out of range: " + what) {}
};

class IOError : public IndexError {
public:
    explicit IOError(const std::string& what) : IndexError("io error: " + what) {}
};

// Stored bytes do not decode to the expected shape.
class CorruptIndexError : public IndexError {
public:
    explicit CorruptIndexError(const std::string& what) : IndexError("corrupt index: " + what) {}
};

} // namespace bagindex
