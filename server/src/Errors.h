#pragma once
#include <stdexcept>
#include <string>

namespace BlackRoom {

    // SQLite failure. Always propagated: a message is never broadcast unless it was persisted.
    class StorageError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Client-visible input error (HTTP 400).
    class ValidationError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Object key with a path separator or "..", rejected before touching the filesystem.
    class InvalidObjectKey : public ValidationError {
    public:
        explicit InvalidObjectKey(const std::string& key)
            : ValidationError("invalid object_key: " + key) {}
    };

    // Request body that does not match the endpoint's schema (HTTP 422).
    class SchemaError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace BlackRoom
