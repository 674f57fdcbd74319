/**
 * @file test_interface_sampler.cpp
 * @brief Point sets and basis operations on the top edge of a half square
 */

#include "heatcouple/core/errors.hpp"
#include "heatcouple/core/interface_sampler.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>

using namespace heatcouple;

namespace
{

constexpr int NX = 4;
constexpr int NY = 2;
constexpr double HEIGHT = 0.5;
constexpr int TOP_ATTRIBUTE = 3;
constexpr int SUBSAMPLES = 16;
constexpr double TOLERANCE = 1.0e-12;

double linearField(const mfem::Vector& x)
{
    return 2.0 * x(0) + 3.0 * x(1) - 1.0;
}

class InterfaceSamplerTest : public ::testing::Test
{
protected:
    InterfaceSamplerTest()
        : mesh(mfem::Mesh::MakeCartesian2D(NX, NY, mfem::Element::QUADRILATERAL, true, 1.0, HEIGHT)),
          fec(1, 2),
          fespace(&mesh, &fec)
    {
    }

    mfem::Mesh mesh;
    mfem::H1_FECollection fec;
    mfem::FiniteElementSpace fespace;
};

} // namespace

TEST_F(InterfaceSamplerTest, PointCountsFollowRules)
{
    InterfaceSampler sampler(&fespace, TOP_ATTRIBUTE, 2, SUBSAMPLES);

    const int gaussPoints = mfem::IntRules.Get(mfem::Geometry::SEGMENT, 2).GetNPoints();
    EXPECT_EQ(sampler.getSample(SampleKind::Consumption).size(), NX * gaussPoints);
    EXPECT_EQ(sampler.getSample(SampleKind::Production).size(), NX * SUBSAMPLES);
    EXPECT_EQ(sampler.getNumDofs(), fespace.GetVSize());
}

TEST_F(InterfaceSamplerTest, PointsLieOnTheInterface)
{
    InterfaceSampler sampler(&fespace, TOP_ATTRIBUTE, 2, SUBSAMPLES);

    for (SampleKind kind : {SampleKind::Consumption, SampleKind::Production})
    {
        const InterfaceSample& sample = sampler.getSample(kind);
        EXPECT_EQ(sample.getDimension(), 2);
        EXPECT_NEAR(sample.getTotalWeight(), 1.0, TOLERANCE);

        mfem::Vector x;
        for (int i = 0; i < sample.size(); i++)
        {
            sample.getPoint(i, x);
            EXPECT_NEAR(x(1), HEIGHT, TOLERANCE);
            EXPECT_GT(x(0), 0.0);
            EXPECT_LT(x(0), 1.0);
            EXPECT_GT(sample.getWeight(i), 0.0);
        }
    }
}

TEST_F(InterfaceSamplerTest, PointsRememberTheirBoundaryElement)
{
    InterfaceSampler sampler(&fespace, TOP_ATTRIBUTE, 2, SUBSAMPLES);

    for (SampleKind kind : {SampleKind::Consumption, SampleKind::Production})
    {
        const InterfaceSample& sample = sampler.getSample(kind);
        mfem::Vector x;
        mfem::Vector mapped;
        int previous = -1;
        for (int i = 0; i < sample.size(); i++)
        {
            const int be = sample.getBoundaryElement(i);
            ASSERT_GE(be, 0);
            ASSERT_LT(be, mesh.GetNBE());
            EXPECT_EQ(mesh.GetBdrAttribute(be), TOP_ATTRIBUTE);
            // Stable order: boundary element index, then point index
            EXPECT_GE(be, previous);
            previous = be;

            mfem::ElementTransformation* T = mesh.GetBdrElementTransformation(be);
            const mfem::IntegrationPoint& ip = sample.getReferencePoint(i);
            T->SetIntPoint(&ip);
            T->Transform(ip, mapped);
            sample.getPoint(i, x);
            EXPECT_NEAR(mapped(0), x(0), TOLERANCE);
            EXPECT_NEAR(mapped(1), x(1), TOLERANCE);
        }
    }
}

TEST_F(InterfaceSamplerTest, SubsamplesAreEquallyWeighted)
{
    InterfaceSampler sampler(&fespace, TOP_ATTRIBUTE, 2, SUBSAMPLES);
    const InterfaceSample& sample = sampler.getSample(SampleKind::Production);

    const double expected = 1.0 / (NX * SUBSAMPLES);
    for (int i = 0; i < sample.size(); i++)
    {
        EXPECT_NEAR(sample.getWeight(i), expected, TOLERANCE);
    }
}

TEST_F(InterfaceSamplerTest, EvaluateReproducesLinearField)
{
    InterfaceSampler sampler(&fespace, TOP_ATTRIBUTE, 2, SUBSAMPLES);

    mfem::FunctionCoefficient coeff(linearField);
    mfem::GridFunction u(&fespace);
    u.ProjectCoefficient(coeff);

    for (SampleKind kind : {SampleKind::Consumption, SampleKind::Production})
    {
        mfem::Vector values;
        sampler.evaluate(u, kind, values);
        const InterfaceSample& sample = sampler.getSample(kind);
        ASSERT_EQ(values.Size(), sample.size());

        mfem::Vector x;
        for (int i = 0; i < sample.size(); i++)
        {
            sample.getPoint(i, x);
            EXPECT_NEAR(values(i), linearField(x), TOLERANCE);
        }
    }
}

TEST_F(InterfaceSamplerTest, BasisIntegralsSumToInterfaceLength)
{
    InterfaceSampler sampler(&fespace, TOP_ATTRIBUTE, 2, SUBSAMPLES);

    mfem::Vector areas;
    sampler.integrateBasis(SampleKind::Consumption, areas);
    ASSERT_EQ(areas.Size(), fespace.GetVSize());
    EXPECT_NEAR(areas.Sum(), 1.0, TOLERANCE);

    int supported = 0;
    for (int i = 0; i < areas.Size(); i++)
    {
        EXPECT_GE(areas(i), 0.0);
        supported += areas(i) > 0.0 ? 1 : 0;
    }
    EXPECT_EQ(supported, NX + 1);
}

TEST_F(InterfaceSamplerTest, MassRowSumsMatchBasisIntegrals)
{
    InterfaceSampler sampler(&fespace, TOP_ATTRIBUTE, 2, SUBSAMPLES);

    std::unique_ptr<mfem::SparseMatrix> mass(sampler.assembleMass(SampleKind::Consumption));
    mfem::Vector areas;
    sampler.integrateBasis(SampleKind::Consumption, areas);

    mfem::Vector ones(fespace.GetVSize());
    ones = 1.0;
    mfem::Vector rowSums(fespace.GetVSize());
    mass->Mult(ones, rowSums);

    for (int i = 0; i < areas.Size(); i++)
    {
        EXPECT_NEAR(rowSums(i), areas(i), TOLERANCE);
    }
}

TEST_F(InterfaceSamplerTest, WrongSizesAndAttributesAreRejected)
{
    EXPECT_THROW(InterfaceSampler(&fespace, 7, 2, SUBSAMPLES), ConfigurationError);
    EXPECT_THROW(InterfaceSampler(nullptr, TOP_ATTRIBUTE, 2, SUBSAMPLES), ConfigurationError);
    EXPECT_THROW(InterfaceSampler(&fespace, TOP_ATTRIBUTE, 2, 0), ConfigurationError);

    InterfaceSampler sampler(&fespace, TOP_ATTRIBUTE, 2, SUBSAMPLES);
    mfem::Vector tooShort(3);
    tooShort = 1.0;
    mfem::Vector out;
    EXPECT_THROW(sampler.evaluate(tooShort, SampleKind::Production, out), ConfigurationError);
    EXPECT_THROW(sampler.integrate(tooShort, SampleKind::Consumption, out), ConfigurationError);
}

TEST(InterfaceSampleTest, IntegrateUsesWeights)
{
    InterfaceSample sample(2);
    mfem::Vector x(2);
    x = 0.0;
    sample.addPoint(x, 0.25);
    x(0) = 1.0;
    sample.addPoint(x, 0.75);

    mfem::Vector values(2);
    values(0) = 4.0;
    values(1) = 2.0;
    EXPECT_DOUBLE_EQ(sample.integrate(values), 2.5);
    EXPECT_DOUBLE_EQ(sample.getTotalWeight(), 1.0);

    mfem::Vector wrong(3);
    EXPECT_THROW(sample.integrate(wrong), ConfigurationError);
    EXPECT_THROW(InterfaceSample(4), ConfigurationError);
}

int main(int argc, char** argv)
{
#ifdef MFEM_USE_MPI
    MPI_Init(&argc, &argv);
#endif

    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();

#ifdef MFEM_USE_MPI
    MPI_Finalize();
#endif

    return result;
}
