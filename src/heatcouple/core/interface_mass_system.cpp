/**
 * @file core/interface_mass_system.cpp
 * @brief Implementation of InterfaceMassSystem
 */

#include "heatcouple/core/interface_mass_system.hpp"
#include "heatcouple/core/coupling_types.hpp"
#include "heatcouple/core/errors.hpp"
#include <cmath>
#include <string>

namespace heatcouple
{

void InterfaceMassSystem::rowSupport(const mfem::SparseMatrix& mass, double tolerance, mfem::Array<int>& rows)
{
    rows.SetSize(0);
    for (int i = 0; i < mass.Height(); i++)
    {
        const double* entries = mass.GetRowEntries(i);
        for (int k = 0; k < mass.RowSize(i); k++)
        {
            if (std::abs(entries[k]) > tolerance)
            {
                rows.Append(i);
                break;
            }
        }
    }
}

InterfaceMassSystem::InterfaceMassSystem(const mfem::SparseMatrix& mass,
                                         const mfem::Vector& constraints,
                                         double supportTolerance)
    : constraints_(constraints)
{
    const int n = mass.Height();
    if (mass.Width() != n || constraints.Size() != n)
    {
        throw ConfigurationError("InterfaceMassSystem: matrix of size "
                                 + std::to_string(mass.Height()) + "x" + std::to_string(mass.Width())
                                 + " does not match " + std::to_string(constraints.Size())
                                 + " constraint entries");
    }

    mfem::Array<int> support;
    rowSupport(mass, supportTolerance, support);

    mfem::Array<int> freeIndex(n);
    freeIndex = -1;
    for (int k = 0; k < support.Size(); k++)
    {
        const int i = support[k];
        if (!isConstrained(constraints_, i))
        {
            freeIndex[i] = free_.Size();
            free_.Append(i);
        }
    }

    const int nfree = free_.Size();
    reduced_.SetSize(nfree);
    reduced_ = 0.0;
    fixedLoad_.SetSize(nfree);
    fixedLoad_ = 0.0;

    for (int fi = 0; fi < nfree; fi++)
    {
        const int row = free_[fi];
        const int* cols = mass.GetRowColumns(row);
        const double* entries = mass.GetRowEntries(row);
        for (int k = 0; k < mass.RowSize(row); k++)
        {
            const int col = cols[k];
            if (freeIndex[col] >= 0)
            {
                reduced_(fi, freeIndex[col]) += entries[k];
            }
            else if (isConstrained(constraints_, col))
            {
                fixedLoad_(fi) += entries[k] * constraints_(col);
            }
        }
    }

    if (nfree > 0)
    {
        inverse_.reset(new mfem::DenseMatrixInverse(reduced_));
    }
}

InterfaceMassSystem::~InterfaceMassSystem() = default;

void InterfaceMassSystem::solve(const mfem::Vector& rhs, mfem::Vector& x) const
{
    if (rhs.Size() != constraints_.Size())
    {
        throw ConfigurationError("InterfaceMassSystem::solve: right-hand side of size "
                                 + std::to_string(rhs.Size()) + ", expected "
                                 + std::to_string(constraints_.Size()));
    }

    x = constraints_;
    const int nfree = free_.Size();
    if (nfree == 0)
    {
        return;
    }

    mfem::Vector reducedRhs(nfree);
    for (int fi = 0; fi < nfree; fi++)
    {
        reducedRhs(fi) = rhs(free_[fi]) - fixedLoad_(fi);
    }

    mfem::Vector reducedX(nfree);
    inverse_->Mult(reducedRhs, reducedX);

    for (int fi = 0; fi < nfree; fi++)
    {
        x(free_[fi]) = reducedX(fi);
    }
}

} // namespace heatcouple
