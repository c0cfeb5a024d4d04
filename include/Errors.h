#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace pq {

// Base error for the analyzer
class PqError : public std::runtime_error {
public:
    explicit PqError(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid numeric parameter (non-positive voltage, PF outside (0,1], ...)
class ValidationError : public PqError {
public:
    explicit ValidationError(const std::string& msg) : PqError(msg) {}
};

// Waveform record too short for harmonic extraction
class SignalTooShortError : public ValidationError {
public:
    explicit SignalTooShortError(const std::string& msg) : ValidationError(msg) {}
};

// Unrecognized catalog identifier (topology, mitigation, window, ...)
class UnknownKeyError : public PqError {
public:
    UnknownKeyError(const std::string& kind, const std::string& key,
                    const std::vector<std::string>& valid)
        : PqError(format(kind, key, valid)), key_(key), valid_(valid) {}

    const std::string& key() const { return key_; }
    const std::vector<std::string>& valid_keys() const { return valid_; }

private:
    static std::string format(const std::string& kind, const std::string& key,
                              const std::vector<std::string>& valid) {
        std::string msg = "Unknown " + kind + " '" + key + "'. Available: [";
        for (size_t i = 0; i < valid.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += valid[i];
        }
        msg += "]";
        return msg;
    }

    std::string key_;
    std::vector<std::string> valid_;
};

// Output file could not be written
class IOError : public PqError {
public:
    explicit IOError(const std::string& msg) : PqError(msg) {}
};

} // namespace pq

#endif // ERRORS_H
