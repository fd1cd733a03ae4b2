#ifndef KNAPSACK_ERROR_HPP
#define KNAPSACK_ERROR_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind {
    None,
    EmptyInput,
    DanglingReference,
    HashMismatch,
    NotFound,
    IntegrityViolation,
    TimedOut,
    Unreachable,
    OverlayUnavailable,
    InvalidMetadata,
    InvalidArgument,
    Cancelled,
    IoError
};

const char* error_kind_name(ErrorKind kind);

// Corruption or tampering: the remedy is fetching from another source.
bool is_integrity_error(ErrorKind kind);

// The content or the network is not there (yet).
bool is_availability_error(ErrorKind kind);

/**
 * @brief Exception thrown by the synchronous layers (hashing, chunking, store).
 *
 * what() reads "<operation> failed [<Kind>]: <detail>".
 */
class KnapsackError : public std::runtime_error {
public:
    KnapsackError(ErrorKind kind, std::string operation, const std::string& detail);

    ErrorKind kind() const { return kind_; }
    const std::string& operation() const { return operation_; }

private:
    ErrorKind kind_;
    std::string operation_;
};

#endif // KNAPSACK_ERROR_HPP
