#ifndef COGNIA_EXCEPTIONS_H
#define COGNIA_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Cognia {

class CogniaException : public std::runtime_error {
public:
    explicit CogniaException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public CogniaException {
public:
    explicit IOException(const std::string& message) : CogniaException("IO Error: " + message) {}
};

class DatasetException : public CogniaException {
public:
    explicit DatasetException(const std::string& message) : CogniaException("Dataset Error: " + message) {}
};

class ConfigurationException : public CogniaException {
public:
    explicit ConfigurationException(const std::string& message) : CogniaException("Configuration Error: " + message) {}
};

// Structurally invalid analysis input (non-square matrix, duplicate column keys, ...).
class InvalidInputShapeException : public CogniaException {
public:
    explicit InvalidInputShapeException(const std::string& message) : CogniaException("Invalid Input Shape: " + message) {}
};

} // namespace Cognia

#endif // COGNIA_EXCEPTIONS_H
