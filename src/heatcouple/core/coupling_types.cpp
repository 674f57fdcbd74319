/**
 * @file core/coupling_types.cpp
 * @brief Name conversions for the coupling enums
 */

#include "heatcouple/core/coupling_types.hpp"
#include "heatcouple/core/errors.hpp"

namespace heatcouple
{

Role parseRole(const std::string& name)
{
    if (name == "Dirichlet")
    {
        return Role::Dirichlet;
    }
    if (name == "Neumann")
    {
        return Role::Neumann;
    }
    throw ConfigurationError("invalid side '" + name + "' (expected Dirichlet or Neumann)");
}

const char* roleName(Role role)
{
    switch (role)
    {
    case Role::Dirichlet:
        return "Dirichlet";
    case Role::Neumann:
        return "Neumann";
    }
    return "Unknown";
}

const char* readQuantity(Role role)
{
    return role == Role::Dirichlet ? TEMPERATURE : FLUX;
}

const char* writeQuantity(Role role)
{
    return role == Role::Dirichlet ? FLUX : TEMPERATURE;
}

const char* actionName(CheckpointAction action)
{
    switch (action)
    {
    case CheckpointAction::WriteCheckpoint:
        return "WriteCheckpoint";
    case CheckpointAction::ReadCheckpoint:
        return "ReadCheckpoint";
    }
    return "Unknown";
}

} // namespace heatcouple
