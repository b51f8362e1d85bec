#pragma once

#include <stdexcept>
#include <string>

namespace CentiPrep {

/**
 * @brief Malformed input: a region identifier, a motif table row or a
 * bedGraph line that cannot be parsed.
 */
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief No motif match survived the significance filter.
 */
class NoSignificantMatchesError : public std::runtime_error {
public:
    explicit NoSignificantMatchesError(const std::string& source)
        : std::runtime_error("No significant sites for '" + source + "'"), source_(source) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

/**
 * @brief The alignment file returned no reads for any queried window.
 */
class NoOverlapError : public std::runtime_error {
public:
    explicit NoOverlapError(const std::string& source)
        : std::runtime_error("No reads fall in sites from '" + source + "'"), source_(source) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

/**
 * @brief Site metadata and read results no longer correspond one-to-one.
 */
class ReconciliationError : public std::runtime_error {
public:
    explicit ReconciliationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief The alignment index could neither be loaded nor built.
 */
class IndexError : public std::runtime_error {
public:
    explicit IndexError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A matrix row does not have the width of the rows before it.
 */
class MatrixShapeError : public std::runtime_error {
public:
    explicit MatrixShapeError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace CentiPrep
