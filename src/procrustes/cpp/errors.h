#ifndef PROCRUSTES_ERRORS_H
#define PROCRUSTES_ERRORS_H

#include <stdexcept>
#include <string>

namespace procrustes {

/**
 * Base class of every error thrown by the library.
 */
class ProcrustesError : public std::runtime_error {
public:
    explicit ProcrustesError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Dimension mismatch, wrong rank, or non-square matrix where a square one is required.
 */
class ShapeError : public ProcrustesError {
public:
    explicit ShapeError(const std::string& what) : ProcrustesError(what) {}
};

/**
 * Out-of-range or unrecognized configuration value.
 */
class InvalidArgumentError : public ProcrustesError {
public:
    explicit InvalidArgumentError(const std::string& what) : ProcrustesError(what) {}
};

class InvalidDriverError : public InvalidArgumentError {
public:
    explicit InvalidDriverError(const std::string& what) : InvalidArgumentError(what) {}
};

/**
 * Input that makes the requested operation undefined (zero norm, rank deficiency).
 */
class DegenerateInputError : public ProcrustesError {
public:
    explicit DegenerateInputError(const std::string& what) : ProcrustesError(what) {}
};

class NotDiagonalizableError : public DegenerateInputError {
public:
    explicit NotDiagonalizableError(const std::string& what) : DegenerateInputError(what) {}
};

/**
 * A decomposition failed to converge, or the input holds NaN/Inf.
 */
class NumericalError : public ProcrustesError {
public:
    explicit NumericalError(const std::string& what) : ProcrustesError(what) {}
};

} // namespace procrustes

#endif // PROCRUSTES_ERRORS_H
