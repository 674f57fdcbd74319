/**
 * @file core/interface_sampler.cpp
 * @brief Implementation of InterfaceSampler
 */

#include "heatcouple/core/interface_sampler.hpp"
#include "heatcouple/core/errors.hpp"
#include <string>

namespace heatcouple
{

namespace
{

// Midpoints of n equal sub-cells in each reference direction
void makeUniformRule(mfem::Geometry::Type geom, int n, mfem::IntegrationRule& ir)
{
    if (geom == mfem::Geometry::SEGMENT)
    {
        ir.SetSize(n);
        for (int i = 0; i < n; i++)
        {
            ir.IntPoint(i).Set1w((i + 0.5) / n, 1.0 / n);
        }
        return;
    }
    if (geom == mfem::Geometry::SQUARE)
    {
        ir.SetSize(n * n);
        for (int j = 0; j < n; j++)
        {
            for (int i = 0; i < n; i++)
            {
                ir.IntPoint(j * n + i).Set2w((i + 0.5) / n, (j + 0.5) / n, 1.0 / (n * n));
            }
        }
        return;
    }
    throw ConfigurationError(std::string("InterfaceSampler: uniform sampling not supported on ")
                             + mfem::Geometry::Name[geom] + " interface elements");
}

} // namespace

InterfaceSampler::InterfaceSampler(mfem::FiniteElementSpace* fespace,
                                   int interfaceAttribute,
                                   int quadratureOrder,
                                   int subsamples)
    : fespace_(fespace),
      interfaceAttribute_(interfaceAttribute),
      quadratureOrder_(quadratureOrder),
      subsamples_(subsamples),
      consumption_(fespace ? fespace->GetMesh()->SpaceDimension() : 2),
      production_(fespace ? fespace->GetMesh()->SpaceDimension() : 2)
{
    if (!fespace_)
    {
        throw ConfigurationError("InterfaceSampler: FiniteElementSpace pointer is null");
    }
    if (quadratureOrder_ < 1 || subsamples_ < 1)
    {
        throw ConfigurationError("InterfaceSampler: quadrature order and sub-samples must be positive");
    }

    buildSample(false, consumption_);
    buildSample(true, production_);
    cacheBasis(consumption_, consumptionBasis_);
    cacheBasis(production_, productionBasis_);

    if (consumption_.size() == 0)
    {
        throw ConfigurationError("InterfaceSampler: no boundary element carries attribute "
                                 + std::to_string(interfaceAttribute_));
    }
}

void InterfaceSampler::buildSample(bool uniform, InterfaceSample& sample) const
{
    mfem::Mesh* mesh = fespace_->GetMesh();
    mfem::Vector x;

    for (int be = 0; be < mesh->GetNBE(); be++)
    {
        if (mesh->GetBdrAttribute(be) != interfaceAttribute_)
        {
            continue;
        }

        const mfem::Geometry::Type geom = fespace_->GetBE(be)->GetGeomType();
        mfem::IntegrationRule uniformRule;
        const mfem::IntegrationRule* ir = nullptr;
        if (uniform)
        {
            makeUniformRule(geom, subsamples_, uniformRule);
            ir = &uniformRule;
        }
        else
        {
            ir = &mfem::IntRules.Get(geom, quadratureOrder_);
        }

        mfem::ElementTransformation* T = mesh->GetBdrElementTransformation(be);
        for (int q = 0; q < ir->GetNPoints(); q++)
        {
            const mfem::IntegrationPoint& ip = ir->IntPoint(q);
            T->SetIntPoint(&ip);
            T->Transform(ip, x);
            sample.addPoint(be, ip, x, ip.weight * T->Weight());
        }
    }
}

void InterfaceSampler::cacheBasis(const InterfaceSample& sample, BasisCache& basis) const
{
    mfem::Array<int> dofs;
    mfem::Vector shape;

    basis.dofs.reserve(sample.size());
    basis.shapes.reserve(sample.size());
    for (int p = 0; p < sample.size(); p++)
    {
        const int be = sample.getBoundaryElement(p);
        const mfem::FiniteElement* fe = fespace_->GetBE(be);
        fespace_->GetBdrElementDofs(be, dofs);
        shape.SetSize(fe->GetDof());
        fe->CalcShape(sample.getReferencePoint(p), shape);

        basis.dofs.push_back(dofs);
        basis.shapes.push_back(shape);
    }
}

const InterfaceSample& InterfaceSampler::getSample(SampleKind kind) const
{
    return kind == SampleKind::Consumption ? consumption_ : production_;
}

const InterfaceSampler::BasisCache& InterfaceSampler::getBasis(SampleKind kind) const
{
    return kind == SampleKind::Consumption ? consumptionBasis_ : productionBasis_;
}

void InterfaceSampler::evaluate(const mfem::Vector& dofs, SampleKind kind, mfem::Vector& values) const
{
    if (dofs.Size() != getNumDofs())
    {
        throw ConfigurationError("InterfaceSampler::evaluate: dof vector of size "
                                 + std::to_string(dofs.Size()) + ", expected "
                                 + std::to_string(getNumDofs()));
    }

    const BasisCache& basis = getBasis(kind);
    const int npoints = getSample(kind).size();
    values.SetSize(npoints);
    for (int p = 0; p < npoints; p++)
    {
        const mfem::Array<int>& pdofs = basis.dofs[p];
        const mfem::Vector& shape = basis.shapes[p];
        double value = 0.0;
        for (int i = 0; i < pdofs.Size(); i++)
        {
            value += shape(i) * dofs(pdofs[i]);
        }
        values(p) = value;
    }
}

void InterfaceSampler::integrate(const mfem::Vector& values, SampleKind kind, mfem::Vector& load) const
{
    const InterfaceSample& sample = getSample(kind);
    if (values.Size() != sample.size())
    {
        throw ConfigurationError("InterfaceSampler::integrate: " + std::to_string(values.Size())
                                 + " values for " + std::to_string(sample.size()) + " points");
    }

    const BasisCache& basis = getBasis(kind);
    load.SetSize(getNumDofs());
    load = 0.0;
    for (int p = 0; p < sample.size(); p++)
    {
        const mfem::Array<int>& pdofs = basis.dofs[p];
        const mfem::Vector& shape = basis.shapes[p];
        const double wv = sample.getWeight(p) * values(p);
        for (int i = 0; i < pdofs.Size(); i++)
        {
            load(pdofs[i]) += wv * shape(i);
        }
    }
}

void InterfaceSampler::integrateBasis(SampleKind kind, mfem::Vector& areas) const
{
    mfem::Vector ones(getSample(kind).size());
    ones = 1.0;
    integrate(ones, kind, areas);
}

mfem::SparseMatrix* InterfaceSampler::assembleMass(SampleKind kind) const
{
    const InterfaceSample& sample = getSample(kind);
    const BasisCache& basis = getBasis(kind);
    const int n = getNumDofs();

    mfem::SparseMatrix* mass = new mfem::SparseMatrix(n, n);
    for (int p = 0; p < sample.size(); p++)
    {
        const mfem::Array<int>& pdofs = basis.dofs[p];
        const mfem::Vector& shape = basis.shapes[p];
        const double w = sample.getWeight(p);
        for (int i = 0; i < pdofs.Size(); i++)
        {
            for (int j = 0; j < pdofs.Size(); j++)
            {
                mass->Add(pdofs[i], pdofs[j], w * shape(i) * shape(j));
            }
        }
    }
    mass->Finalize();
    return mass;
}

} // namespace heatcouple
