#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace dynsys {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }
/**
 * @brief Base exception for dynamical system errors.
 */
class SystemException : public std::runtime_error {
public:
    /**
     * @brief Construct a SystemException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    SystemException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(""), line_(0) {}
    SystemException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Exception for invalid method arguments (non-positive trajectory time,
 * state vectors of the wrong dimension, times outside an integration span).
 */
class InvalidParameterException : public SystemException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : SystemException(functionName, "Invalid Parameter: " + message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : SystemException(file, line, functionName, "InvalidParameterException", message) {}
};

/**
 * @brief Exception raised at the solver boundary when numerical integration fails
 * or a solver algorithm cannot be used.
 */
class SolverException : public SystemException {
public:
    /**
     * @brief Construct a SolverException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the solver error.
     */
    SolverException(const std::string& functionName, const std::string& message)
        : SystemException(functionName, "Solver Error: " + message) {}
    SolverException(const char* file, int line, const std::string& functionName, const std::string& message)
        : SystemException(file, line, functionName, "SolverException", message) {}
};

/**
 * @brief Exception for dynamical system construction errors.
 */
class SystemConstructionException : public SystemException {
public:
    /**
     * @brief Construct a SystemConstructionException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the construction error.
     */
    SystemConstructionException(const std::string& functionName, const std::string& message)
        : SystemException(functionName, "System Construction Error: " + message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public SystemException {
public:
    FileIOException(const std::string& functionName, const std::string& message)
        : SystemException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public SystemException {
public:
    DataFormatException(const std::string& functionName, const std::string& message)
        : SystemException(functionName, "Data Format Error: " + message) {}
};

/**
 * @brief Exception for invalid or empty trajectories.
 */
class InvalidResultException : public SystemException {
public:
    InvalidResultException(const std::string& functionName, const std::string& message)
        : SystemException(functionName, "Invalid Result: " + message) {}
};

/**
 * @brief Exception for out-of-range access.
 * @param file File where the error occurred.
 * @param line Line number where the error occurred.
 */
class OutOfRangeException : public SystemException {
public:
    OutOfRangeException(const char* file, int line, const std::string& functionName, const std::string& message)
        : SystemException(file, line, functionName, "OutOfRangeException", message) {}
};

} // namespace dynsys

#define DYNSYS_THROW_INVALID_PARAM(func, msg) throw dynsys::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define DYNSYS_THROW_SOLVER_ERROR(func, msg) throw dynsys::SolverException(__FILE__, __LINE__, func, msg)
#define DYNSYS_THROW_OUT_OF_RANGE(func, msg) throw dynsys::OutOfRangeException(__FILE__, __LINE__, func, msg)
#define DYNSYS_THROW_SYSTEM_EXCEPTION(func, msg) throw dynsys::SystemException(func, msg)

#endif // EXCEPTIONS_HPP
