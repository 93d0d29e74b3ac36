#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

// Base class for errors surfaced by cache table lookups.
class CacheTableException : public std::runtime_error {
public:
    explicit CacheTableException(const std::string& message)
        : std::runtime_error(message) {}
};

// remove() on an absent key, or value() on an absent key with no loader set.
class KeyNotFoundException : public CacheTableException {
public:
    KeyNotFoundException()
        : CacheTableException("Key not found in cache") {}
};

// value() on an absent key whose loader produced nothing.
class KeyNotFoundOrLoadableException : public CacheTableException {
public:
    KeyNotFoundOrLoadableException()
        : CacheTableException("Key not found and could not be loaded into cache") {}
};

#endif // CACHEERRORS_HPP
