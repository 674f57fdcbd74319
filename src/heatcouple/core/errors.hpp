/**
 * @file core/errors.hpp
 * @brief Exception taxonomy of the coupling library
 *
 * Every fatal condition is reported as a heatcouple::Error. The coupling
 * controller attaches the name of the state-machine step in which the
 * exception was raised before letting it unwind to the run boundary.
 * Rollback requested by the coordinator is not an error.
 */

#ifndef HEATCOUPLE_CORE_ERRORS_HPP
#define HEATCOUPLE_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace heatcouple
{

class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& message);

    const char* what() const noexcept override;

    void setStep(const std::string& step);
    const std::string& getStep() const { return step_; }
    const std::string& getMessage() const { return message_; }

private:
    std::string message_;
    std::string step_;
    std::string full_;
};

/// The local PDE solve did not converge.
class SolverDivergence : public Error
{
public:
    explicit SolverDivergence(const std::string& message) : Error(message) {}
};

/// A channel call was made out of contract order.
class CoordinatorProtocolViolation : public Error
{
public:
    explicit CoordinatorProtocolViolation(const std::string& message) : Error(message) {}
};

/// Unsupported role or option, mismatched buffer lengths.
class ConfigurationError : public Error
{
public:
    explicit ConfigurationError(const std::string& message) : Error(message) {}
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_ERRORS_HPP
