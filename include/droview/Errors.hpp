#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace droview {

/*
 *  Error taxonomy.
 *
 *    load time   : DatasetLoadError, ShapeMismatchError   (fatal)
 *    lookups     : OutOfRangeError, UnknownModelError,
 *                  UnknownParameterError, SelectionError  (contract violations)
 *    per view    : EmptyDistributionError                 (one map only)
 *    per model   : ModelEvaluationError                   (one curve only)
 */
class DroError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DatasetLoadError : public DroError {
public:
    using DroError::DroError;
};

class ShapeMismatchError : public DatasetLoadError {
public:
    using DatasetLoadError::DatasetLoadError;
};

class OutOfRangeError : public DroError {
public:
    using DroError::DroError;
};

class UnknownModelError : public DroError {
public:
    using DroError::DroError;
};

class UnknownParameterError : public DroError {
public:
    using DroError::DroError;
};

class SelectionError : public DroError {
public:
    using DroError::DroError;
};

class EmptyDistributionError : public DroError {
public:
    using DroError::DroError;
};

class ModelEvaluationError : public DroError {
public:
    ModelEvaluationError(std::string model, const std::string& what)
        : DroError(model + ": " + what), model_(std::move(model)) {}

    const std::string& model() const { return model_; }

private:
    std::string model_;
};

} // namespace droview
