/**
 * @file core/errors.cpp
 * @brief Implementation of the exception taxonomy
 */

#include "heatcouple/core/errors.hpp"

namespace heatcouple
{

Error::Error(const std::string& message)
    : std::runtime_error(message),
      message_(message),
      full_(message)
{
}

const char* Error::what() const noexcept
{
    return full_.c_str();
}

void Error::setStep(const std::string& step)
{
    // Innermost step wins when an error crosses nested steps
    if (!step_.empty())
    {
        return;
    }
    step_ = step;
    full_ = "[" + step_ + "] " + message_;
}

} // namespace heatcouple
