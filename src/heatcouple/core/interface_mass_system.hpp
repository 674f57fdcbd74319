/**
 * @file core/interface_mass_system.hpp
 * @brief Constrained mass-type system on the interface dofs
 */

#ifndef HEATCOUPLE_CORE_INTERFACE_MASS_SYSTEM_HPP
#define HEATCOUPLE_CORE_INTERFACE_MASS_SYSTEM_HPP

#include "mfem.hpp"
#include <memory>

namespace heatcouple
{

/**
 * @class InterfaceMassSystem
 * @brief Solves M x = b on the rows of M with support, other dofs fixed
 *
 * The constraint vector marks free dofs with NaN and fixed dofs with their
 * value. Only free dofs whose row in M has an entry above the support
 * tolerance are solved for; free dofs without support stay NaN in the
 * result. The reduced matrix is factorized once at construction, so every
 * solve is a forward/backward substitution.
 *
 * Used for the least-squares fit of Dirichlet interface data and for the
 * constrained flux projection.
 */
class InterfaceMassSystem
{
public:
    static constexpr double DEFAULT_SUPPORT_TOLERANCE = 1.0e-15;

    InterfaceMassSystem(const mfem::SparseMatrix& mass,
                        const mfem::Vector& constraints,
                        double supportTolerance = DEFAULT_SUPPORT_TOLERANCE);

    ~InterfaceMassSystem();

    InterfaceMassSystem(const InterfaceMassSystem&) = delete;
    InterfaceMassSystem& operator=(const InterfaceMassSystem&) = delete;

    /// x = constraints, with the supported free entries solved from M x = rhs
    void solve(const mfem::Vector& rhs, mfem::Vector& x) const;

    int getNumFree() const { return free_.Size(); }
    const mfem::Array<int>& getFreeDofs() const { return free_; }

    /// Rows of mass with at least one entry of magnitude above tolerance
    static void rowSupport(const mfem::SparseMatrix& mass, double tolerance, mfem::Array<int>& rows);

private:
    mfem::Vector constraints_;
    mfem::Array<int> free_;
    mfem::Vector fixedLoad_;
    mfem::DenseMatrix reduced_;
    std::unique_ptr<mfem::DenseMatrixInverse> inverse_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_INTERFACE_MASS_SYSTEM_HPP
