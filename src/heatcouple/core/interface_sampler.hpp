/**
 * @file core/interface_sampler.hpp
 * @brief Builds the consumption and production point sets of an interface
 */

#ifndef HEATCOUPLE_CORE_INTERFACE_SAMPLER_HPP
#define HEATCOUPLE_CORE_INTERFACE_SAMPLER_HPP

#include "heatcouple/core/coupling_types.hpp"
#include "heatcouple/core/interface_sample.hpp"
#include "mfem.hpp"
#include <vector>

namespace heatcouple
{

/**
 * @class InterfaceSampler
 * @brief Samples the boundary elements carrying the interface attribute
 *
 * The consumption sample uses the Gauss rule of the PDE quadrature so that
 * incoming data is integrated consistently with the weak form. The
 * production sample places a fixed number of uniform midpoint sub-samples
 * on every interface element, matching the exchange mesh resolution.
 * Both samples are built once; the mesh is static for the run.
 */
class InterfaceSampler
{
public:
    static constexpr int DEFAULT_SUBSAMPLES = 16;

    InterfaceSampler(mfem::FiniteElementSpace* fespace,
                     int interfaceAttribute,
                     int quadratureOrder,
                     int subsamples = DEFAULT_SUBSAMPLES);

    const InterfaceSample& getSample(SampleKind kind) const;
    int getInterfaceAttribute() const { return interfaceAttribute_; }
    int getNumDofs() const { return fespace_->GetVSize(); }

    /// Values of the field with coefficients dofs at the sample points
    void evaluate(const mfem::Vector& dofs, SampleKind kind, mfem::Vector& values) const;

    /// load_n = sum_p w_p phi_n(x_p) values_p
    void integrate(const mfem::Vector& values, SampleKind kind, mfem::Vector& load) const;

    /// area_n = sum_p w_p phi_n(x_p)
    void integrateBasis(SampleKind kind, mfem::Vector& areas) const;

    /// M_mn = sum_p w_p phi_m(x_p) phi_n(x_p); the caller owns the result
    mfem::SparseMatrix* assembleMass(SampleKind kind) const;

private:
    struct BasisCache
    {
        std::vector<mfem::Array<int>> dofs;
        std::vector<mfem::Vector> shapes;
    };

    void buildSample(bool uniform, InterfaceSample& sample) const;
    /// Shape values at every point, from the point's element and reference coordinates
    void cacheBasis(const InterfaceSample& sample, BasisCache& basis) const;
    const BasisCache& getBasis(SampleKind kind) const;

    mfem::FiniteElementSpace* fespace_; // Not owned
    int interfaceAttribute_;
    int quadratureOrder_;
    int subsamples_;

    InterfaceSample consumption_;
    InterfaceSample production_;
    BasisCache consumptionBasis_;
    BasisCache productionBasis_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_INTERFACE_SAMPLER_HPP
