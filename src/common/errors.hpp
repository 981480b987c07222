#pragma once

#include <stdexcept>
#include <string>

namespace reveille {

class ReveilleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed user input. Always recovered by re-prompting.
class ValidationError : public ReveilleError {
public:
    using ReveilleError::ReveilleError;
};

// Ordinal or index outside the current alarm list.
class OutOfRange : public ValidationError {
public:
    using ValidationError::ValidationError;
};

// Missing or unusable tone file or tone directory.
class ResourceError : public ReveilleError {
public:
    using ReveilleError::ReveilleError;
};

// Audio command could not be launched.
class PlaybackError : public ReveilleError {
public:
    using ReveilleError::ReveilleError;
};

class StorageError : public ReveilleError {
public:
    using ReveilleError::ReveilleError;
};

} // namespace reveille
