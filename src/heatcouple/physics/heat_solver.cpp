/**
 * @file physics/heat_solver.cpp
 * @brief Implementation of the participant heat solver
 */

#include "heatcouple/physics/heat_solver.hpp"
#include "heatcouple/core/errors.hpp"
#include <limits>
#include <string>
#include <vector>

namespace heatcouple
{

HeatSolver::HeatSolver(mfem::Mesh* mesh,
                       int polynomialOrder,
                       int interfaceAttribute,
                       mfem::Coefficient* diffusivity,
                       mfem::Coefficient* boundaryCoeff,
                       SolverInterface* linearSolver,
                       int subsamples)
    : fec_(nullptr),
      fespace_(nullptr),
      massForm_(nullptr),
      diffusionForm_(nullptr),
      systemMatrix_(nullptr),
      cachedDt_(-1.0),
      diffusivity_(diffusivity),
      boundaryCoeff_(boundaryCoeff),
      linearSolver_(linearSolver),
      interfaceAttribute_(interfaceAttribute),
      fitTolerance_(-1.0)
{
    if (!mesh || !diffusivity_ || !boundaryCoeff_ || !linearSolver_)
    {
        throw ConfigurationError("HeatSolver: null pointer argument");
    }
    if (polynomialOrder < 1)
    {
        throw ConfigurationError("HeatSolver: polynomial order must be at least 1");
    }
    if (mesh->bdr_attributes.Size() == 0 || interfaceAttribute < 1
        || interfaceAttribute > mesh->bdr_attributes.Max())
    {
        throw ConfigurationError("HeatSolver: interface attribute "
                                 + std::to_string(interfaceAttribute)
                                 + " is not a boundary attribute of the mesh");
    }

    int dim = mesh->Dimension();
    fec_ = new mfem::H1_FECollection(polynomialOrder, dim);
    fespace_ = new mfem::FiniteElementSpace(mesh, fec_);

    massForm_ = new mfem::BilinearForm(fespace_);
    massForm_->AddDomainIntegrator(new mfem::MassIntegrator());
    massForm_->Assemble();
    massForm_->Finalize();

    diffusionForm_ = new mfem::BilinearForm(fespace_);
    diffusionForm_->AddDomainIntegrator(new mfem::DiffusionIntegrator(*diffusivity_));
    diffusionForm_->Assemble();
    diffusionForm_->Finalize();

    // Exterior boundaries are essential, the interface is left to the coupling
    essentialBdr_.SetSize(mesh->bdr_attributes.Max());
    essentialBdr_ = 1;
    essentialBdr_[interfaceAttribute - 1] = 0;
    updateBoundaryConditions();

    sampler_.reset(new InterfaceSampler(fespace_, interfaceAttribute, 2 * polynomialOrder, subsamples));
    interfaceMass_.reset(sampler_->assembleMass(SampleKind::Consumption));
}

HeatSolver::~HeatSolver()
{
    delete systemMatrix_;
    delete diffusionForm_;
    delete massForm_;
    delete fespace_;
    delete fec_;
}

void HeatSolver::setBoundaryFlux(int attribute, mfem::Coefficient* flux)
{
    if (!flux)
    {
        throw ConfigurationError("HeatSolver::setBoundaryFlux: null coefficient");
    }
    if (attribute < 1 || attribute > essentialBdr_.Size() || attribute == interfaceAttribute_)
    {
        throw ConfigurationError("HeatSolver::setBoundaryFlux: " + std::to_string(attribute)
                                 + " is not an exterior boundary attribute");
    }

    boundaryFlux_[attribute] = flux;
    essentialBdr_[attribute - 1] = 0;
    updateBoundaryConditions();

    // The interface fit depends on the base constraints
    fitSystem_.reset();
}

void HeatSolver::updateBoundaryConditions()
{
    mfem::Array<int> essTdofList;
    fespace_->GetEssentialTrueDofs(essentialBdr_, essTdofList);

    mfem::GridFunction boundaryFunc(fespace_);
    boundaryFunc = 0.0;
    boundaryFunc.ProjectBdrCoefficient(*boundaryCoeff_, essentialBdr_);

    baseConstraints_.SetSize(fespace_->GetVSize());
    baseConstraints_ = std::numeric_limits<double>::quiet_NaN();
    for (int k = 0; k < essTdofList.Size(); k++)
    {
        baseConstraints_(essTdofList[k]) = boundaryFunc(essTdofList[k]);
    }

    exteriorLoad_.SetSize(0);
    if (boundaryFlux_.empty())
    {
        return;
    }

    // One marker per flux attribute, alive until Assemble()
    std::vector<mfem::Array<int>> markers(boundaryFlux_.size());
    mfem::LinearForm load(fespace_);
    size_t k = 0;
    for (const auto& entry : boundaryFlux_)
    {
        markers[k].SetSize(essentialBdr_.Size());
        markers[k] = 0;
        markers[k][entry.first - 1] = 1;
        load.AddBoundaryIntegrator(new mfem::BoundaryLFIntegrator(*entry.second), markers[k]);
        ++k;
    }
    load.Assemble();
    exteriorLoad_ = load;
}

int HeatSolver::getSize() const
{
    return fespace_->GetVSize();
}

void HeatSolver::getInitialState(mfem::Vector& state) const
{
    state.SetSize(getSize());
    state = 0.0;
}

void HeatSolver::getBaseConstraints(mfem::Vector& constraints) const
{
    constraints = baseConstraints_;
}

const InterfaceSample& HeatSolver::getInterfaceSample(SampleKind kind) const
{
    return sampler_->getSample(kind);
}

void HeatSolver::checkSize(const mfem::Vector& v, const char* what) const
{
    if (v.Size() != getSize())
    {
        throw ConfigurationError(std::string("HeatSolver: ") + what + " has size "
                                 + std::to_string(v.Size()) + ", expected "
                                 + std::to_string(getSize()));
    }
}

void HeatSolver::updateSystemMatrix(double dt)
{
    if (dt != cachedDt_)
    {
        delete systemMatrix_;
        systemMatrix_ = mfem::Add(1.0 / dt, massForm_->SpMat(), 1.0, diffusionForm_->SpMat());
        cachedDt_ = dt;
    }
}

void HeatSolver::solve(const mfem::Vector& previous,
                       double dt,
                       const BoundaryData& boundary,
                       mfem::Vector& next)
{
    if (!(dt > 0.0))
    {
        throw ConfigurationError("HeatSolver::solve: non-positive time step " + std::to_string(dt));
    }
    checkSize(previous, "previous state");
    checkSize(boundary.constraints, "constraint set");

    updateSystemMatrix(dt);

    // rhs = M u0 / dt - s + f
    mfem::Vector rhs(getSize());
    massForm_->SpMat().Mult(previous, rhs);
    rhs /= dt;
    if (boundary.source.Size() > 0)
    {
        checkSize(boundary.source, "source term");
        rhs -= boundary.source;
    }
    if (exteriorLoad_.Size() > 0)
    {
        rhs += exteriorLoad_;
    }

    mfem::SparseMatrix A(*systemMatrix_);
    next = previous;
    for (int i = 0; i < getSize(); i++)
    {
        if (isConstrained(boundary.constraints, i))
        {
            next(i) = boundary.constraints(i);
            A.EliminateRowCol(i, boundary.constraints(i), rhs);
        }
    }

    linearSolver_->solve(A, rhs, next);

    // Constrained dofs hold their prescribed value exactly
    for (int i = 0; i < getSize(); i++)
    {
        if (isConstrained(boundary.constraints, i))
        {
            next(i) = boundary.constraints(i);
        }
    }
}

void HeatSolver::computeResidual(const mfem::Vector& previous,
                                 const mfem::Vector& next,
                                 double dt,
                                 const BoundaryData& boundary,
                                 mfem::Vector& residual) const
{
    checkSize(previous, "previous state");
    checkSize(next, "new state");

    // r = M (u - u0) / dt + K u + s - f
    mfem::Vector increment(next);
    increment -= previous;
    residual.SetSize(getSize());
    massForm_->SpMat().Mult(increment, residual);
    residual /= dt;

    mfem::Vector stiffness(getSize());
    diffusionForm_->SpMat().Mult(next, stiffness);
    residual += stiffness;

    if (boundary.source.Size() > 0)
    {
        checkSize(boundary.source, "source term");
        residual += boundary.source;
    }
    if (exteriorLoad_.Size() > 0)
    {
        residual -= exteriorLoad_;
    }
}

void HeatSolver::evaluate(const mfem::Vector& dofs, SampleKind kind, mfem::Vector& values) const
{
    sampler_->evaluate(dofs, kind, values);
}

void HeatSolver::buildConstraints(const mfem::Vector& targetValues,
                                  double dropTolerance,
                                  mfem::Vector& constraints)
{
    if (!fitSystem_ || dropTolerance != fitTolerance_)
    {
        fitSystem_.reset(new InterfaceMassSystem(*interfaceMass_, baseConstraints_, dropTolerance));
        fitTolerance_ = dropTolerance;
    }

    // Least-squares fit of the interface trace: M_G u = sum_q w_q phi(x_q) T_q
    mfem::Vector rhs;
    sampler_->integrate(targetValues, SampleKind::Consumption, rhs);
    fitSystem_->solve(rhs, constraints);
}

void HeatSolver::buildSource(const mfem::Vector& fluxValues, mfem::Vector& source) const
{
    sampler_->integrate(fluxValues, SampleKind::Consumption, source);
}

double HeatSolver::computeL2Error(const mfem::Vector& state, mfem::Coefficient& exact) const
{
    checkSize(state, "state");
    mfem::GridFunction u(fespace_);
    u = state;
    return u.ComputeL2Error(exact);
}

} // namespace heatcouple
