#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace dsprof {

// Root of every error the engine raises on purpose.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Input could not be turned into a table (unsupported extension, bad encoding, malformed rows).
class LoadError : public Error {
public:
    explicit LoadError(const std::string& message) : Error("load error: " + message) {}
};

// Raised inside a single column's analysis; caught per column and recorded.
class AnalysisError : public Error {
public:
    explicit AnalysisError(const std::string& message) : Error("analysis error: " + message) {}
};

class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& message) : Error("schema error: " + message) {}
};

class ProfilingError : public Error {
public:
    explicit ProfilingError(const std::string& message) : Error("profiling error: " + message) {}
};

class CancelledError : public ProfilingError {
public:
    explicit CancelledError(const std::string& stage)
        : ProfilingError("cancelled during " + stage) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error("config error: " + message) {}
};

// Flattens a nested exception chain into "outer: inner: root".
inline std::string describe(const std::exception& e) {
    std::string out = e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        out += ": ";
        out += describe(inner);
    } catch (...) {
        out += ": (non-standard exception)";
    }
    return out;
}

}
