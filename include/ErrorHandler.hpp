#pragma once

#include <string>
#include <stdexcept>
#include <sstream>

namespace pano {

/**
 * @brief Enhanced exception with context information
 */
class ContextException : public std::runtime_error {
public:
    ContextException(const std::string& message,
                     const std::string& file = "",
                     int line = 0,
                     const std::string& function = "")
        : std::runtime_error(formatMessage(message, file, line, function))
        , message_(message), file_(file), line_(line), function_(function) {}

    /// @brief Message without the location suffix.
    const std::string& message() const { return message_; }
    const std::string& file() const { return file_; }
    int line() const { return line_; }
    const std::string& function() const { return function_; }

    /// @brief Short name of the error category, used in reports.
    virtual const char* kind() const { return "Error"; }

private:
    static std::string formatMessage(const std::string& msg,
                                     const std::string& file,
                                     int line,
                                     const std::string& func) {
        std::ostringstream oss;
        oss << msg;
        if (!file.empty() || line > 0 || !func.empty()) {
            oss << " [";
            if (!func.empty()) oss << func << "()";
            if (!file.empty()) {
                if (!func.empty()) oss << " ";
                // Extract just filename from path
                size_t pos = file.find_last_of("\\/");
                oss << (pos == std::string::npos ? file : file.substr(pos + 1));
            }
            if (line > 0) oss << ":" << line;
            oss << "]";
        }
        return oss.str();
    }

    std::string message_;
    std::string file_;
    int line_;
    std::string function_;
};

/**
 * @brief Source image, mask or sidecar file does not exist.
 */
class InputNotFoundError : public ContextException {
public:
    using ContextException::ContextException;
    const char* kind() const override { return "InputNotFound"; }
};

/**
 * @brief Image height or width is below 2.
 *
 * Angle mapping divides by (height - 1) and (width - 1).
 */
class DegenerateImageError : public ContextException {
public:
    using ContextException::ContextException;
    const char* kind() const override { return "DegenerateImage"; }
};

/**
 * @brief Failure while loading, dithering, projecting or serializing.
 */
class ConversionError : public ContextException {
public:
    using ContextException::ContextException;
    const char* kind() const override { return "ConversionFailure"; }
};

/**
 * @brief Throw DegenerateImageError unless both dimensions are at least 2.
 */
void requireNonDegenerate(int height, int width, const std::string& what);

/**
 * @brief Print error with context
 */
void printErrorWithContext(const std::exception& e, const std::string& context = "");

} // namespace pano

// Macros for throwing exceptions with context
#define THROW_CONTEXT(msg) throw pano::ContextException(msg, __FILE__, __LINE__, __FUNCTION__)
#define THROW_CONTEXT_IF(condition, msg) if (condition) THROW_CONTEXT(msg)
#define THROW_CONTEXT_AS(Type, msg) throw Type(msg, __FILE__, __LINE__, __FUNCTION__)
#define THROW_CONTEXT_AS_IF(condition, Type, msg) if (condition) THROW_CONTEXT_AS(Type, msg)
