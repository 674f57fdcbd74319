/**
 * @file core/interface_sample.cpp
 * @brief Implementation of InterfaceSample
 */

#include "heatcouple/core/interface_sample.hpp"
#include "heatcouple/core/errors.hpp"
#include <string>

namespace heatcouple
{

InterfaceSample::InterfaceSample(int dimension)
    : dimension_(dimension)
{
    if (dimension_ < 1 || dimension_ > 3)
    {
        throw ConfigurationError("InterfaceSample: unsupported dimension "
                                 + std::to_string(dimension_));
    }
}

void InterfaceSample::addPoint(const mfem::Vector& x, double weight)
{
    addPoint(-1, mfem::IntegrationPoint(), x, weight);
}

void InterfaceSample::addPoint(int boundaryElement,
                               const mfem::IntegrationPoint& ip,
                               const mfem::Vector& x,
                               double weight)
{
    if (x.Size() != dimension_)
    {
        throw ConfigurationError("InterfaceSample: point of dimension "
                                 + std::to_string(x.Size())
                                 + " added to a sample of dimension "
                                 + std::to_string(dimension_));
    }
    for (int d = 0; d < dimension_; d++)
    {
        coordinates_.push_back(x(d));
    }
    weights_.push_back(weight);
    elements_.push_back(boundaryElement);
    referencePoints_.push_back(ip);
}

void InterfaceSample::getPoint(int i, mfem::Vector& x) const
{
    x.SetSize(dimension_);
    for (int d = 0; d < dimension_; d++)
    {
        x(d) = coordinates_[i * dimension_ + d];
    }
}

double InterfaceSample::getTotalWeight() const
{
    double total = 0.0;
    for (double w : weights_)
    {
        total += w;
    }
    return total;
}

double InterfaceSample::integrate(const mfem::Vector& values) const
{
    if (values.Size() != size())
    {
        throw ConfigurationError("InterfaceSample::integrate: " + std::to_string(values.Size())
                                 + " values for " + std::to_string(size()) + " points");
    }
    double total = 0.0;
    for (int i = 0; i < size(); i++)
    {
        total += weights_[i] * values(i);
    }
    return total;
}

} // namespace heatcouple
