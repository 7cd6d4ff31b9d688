#pragma once

#include <stdexcept>
#include <string>

namespace ptsrc {

class PtsrcError : public std::runtime_error {
public:
    explicit PtsrcError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PtsrcError {
public:
    explicit ConfigError(const std::string& message)
        : PtsrcError("Config error: " + message) {}
};

class ValidationError : public PtsrcError {
public:
    explicit ValidationError(const std::string& message)
        : PtsrcError("Validation error: " + message) {}
};

class IOError : public PtsrcError {
public:
    explicit IOError(const std::string& message)
        : PtsrcError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class SolverError : public PtsrcError {
public:
    explicit SolverError(const std::string& message)
        : PtsrcError("Solver error: " + message) {}
};

class PipelineError : public PtsrcError {
public:
    explicit PipelineError(const std::string& message)
        : PtsrcError("Pipeline error: " + message) {}
};

} // namespace ptsrc
