/**
 * @file errors.h
 * @brief DagStat v1.0 - Error Types
 *
 * Three failure classes, all fatal to the call that raised them:
 *   - GraphError          : the causal graph would become invalid
 *                           (self-loop, duplicate edge, cycle)
 *   - ValidationError     : a structural precondition of a method is violated,
 *                           against the graph or against the dataset
 *   - IdentificationError : confounders declared in the graph are absent
 *                           from the dataset
 *
 * Refutation check failures are reported in the RefutationReport and are
 * never thrown.
 */
#ifndef DAGSTAT_ERRORS_H
#define DAGSTAT_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace dagstat {

class GraphError : public std::invalid_argument {
public:
    explicit GraphError(const std::string& what) : std::invalid_argument(what) {}
};

class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Declared confounders are not measured in the dataset
 *
 * Only confounders present in the graph can be detected. Confounders the
 * user never declared are invisible to identification.
 */
class IdentificationError : public std::runtime_error {
public:
    IdentificationError(const std::string& what, std::vector<std::string> missing)
        : std::runtime_error(what), missing_(std::move(missing)) {}

    // Sorted names of the unmeasured confounders
    const std::vector<std::string>& missing() const { return missing_; }

private:
    std::vector<std::string> missing_;
};

} // namespace dagstat

#endif // DAGSTAT_ERRORS_H
