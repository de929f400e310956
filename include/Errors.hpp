#pragma once

#include <stdexcept>
#include <string>

namespace sigproj {

class SigProjError : public std::runtime_error {
public:
    explicit SigProjError(const std::string& message)
        : std::runtime_error(message) {}
};

class DataLoadingError : public SigProjError {
public:
    explicit DataLoadingError(const std::string& message)
        : SigProjError(message) {}
};

// Unknown method names and invalid options, raised before any stage runs
class ConfigurationError : public SigProjError {
public:
    explicit ConfigurationError(const std::string& message)
        : SigProjError(message) {}
};

class ProcessingError : public SigProjError {
public:
    explicit ProcessingError(const std::string& message)
        : SigProjError(message) {}
};

class FittingError : public ProcessingError {
public:
    explicit FittingError(const std::string& message)
        : ProcessingError(message) {}
};

// A collaborator failed inside a named pipeline stage
class StageError : public ProcessingError {
public:
    StageError(const std::string& stage, const std::string& message)
        : ProcessingError(stage + ": " + message), stageName(stage) {}

    const std::string& stage() const { return stageName; }

private:
    std::string stageName;
};

// Index or label alignment between result structures was broken
class ConsistencyError : public SigProjError {
public:
    explicit ConsistencyError(const std::string& message)
        : SigProjError(message) {}
};

} // namespace sigproj
