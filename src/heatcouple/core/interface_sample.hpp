/**
 * @file core/interface_sample.hpp
 * @brief Ordered set of evaluation points on the coupling interface
 */

#ifndef HEATCOUPLE_CORE_INTERFACE_SAMPLE_HPP
#define HEATCOUPLE_CORE_INTERFACE_SAMPLE_HPP

#include "mfem.hpp"
#include <vector>

namespace heatcouple
{

/**
 * @brief Geometric points on the interface with one integration weight each
 *
 * The point order is the indexing contract between a participant and the
 * coupling channel: value i of an exchange buffer belongs to point i.
 * Points that come from a finite element mesh also remember their boundary
 * element and reference coordinates so that basis functions can be
 * evaluated there.
 */
class InterfaceSample
{
public:
    explicit InterfaceSample(int dimension = 2);

    void addPoint(const mfem::Vector& x, double weight);
    void addPoint(int boundaryElement,
                  const mfem::IntegrationPoint& ip,
                  const mfem::Vector& x,
                  double weight);

    int size() const { return static_cast<int>(weights_.size()); }
    int getDimension() const { return dimension_; }

    /// Coordinates flattened point by point (x0 y0 x1 y1 ...)
    const std::vector<double>& getCoordinates() const { return coordinates_; }
    const std::vector<double>& getWeights() const { return weights_; }

    void getPoint(int i, mfem::Vector& x) const;
    double getWeight(int i) const { return weights_[i]; }
    int getBoundaryElement(int i) const { return elements_[i]; }
    const mfem::IntegrationPoint& getReferencePoint(int i) const { return referencePoints_[i]; }

    /// Sum of the weights, i.e. the measure of the sampled interface
    double getTotalWeight() const;

    /// Weighted sum of per-point values
    double integrate(const mfem::Vector& values) const;

private:
    int dimension_;
    std::vector<double> coordinates_;
    std::vector<double> weights_;
    std::vector<int> elements_;
    std::vector<mfem::IntegrationPoint> referencePoints_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_INTERFACE_SAMPLE_HPP
