/**
 * @file test_in_process_channel.cpp
 * @brief Exchange protocol of the in-process coupling hub
 */

#include "heatcouple/channels/in_process_channel.hpp"
#include "heatcouple/core/errors.hpp"
#include <gtest/gtest.h>
#include <memory>

using namespace heatcouple;

namespace
{

constexpr double WINDOW = 0.1;
constexpr double TIME_TOLERANCE = 1.0e-12;

// n points evenly spread on the line y = height
InterfaceSample makeLine(int n, double height)
{
    InterfaceSample sample(2);
    mfem::Vector x(2);
    for (int i = 0; i < n; i++)
    {
        x(0) = (i + 0.5) / n;
        x(1) = height;
        sample.addPoint(x, 1.0 / n);
    }
    return sample;
}

mfem::Vector constant(int n, double value)
{
    mfem::Vector v(n);
    v = value;
    return v;
}

/**
 * @brief Two connected participants with a read and a write mesh each
 */
class InProcessChannelTest : public ::testing::Test
{
protected:
    void connect(const InProcessSettings& settings)
    {
        hub.reset(new InProcessCouplingHub(settings));
        first = hub->connect("HeatDirichlet");
        second = hub->connect("HeatNeumann");

        firstRead = first->registerInterface("Dirichlet-GP-Mesh", gauss);
        firstWrite = first->registerInterface("Dirichlet-CC-Mesh", cells);
        secondRead = second->registerInterface("Neumann-GP-Mesh", gauss);
        secondWrite = second->registerInterface("Neumann-CC-Mesh", cells);
    }

    InterfaceSample gauss = makeLine(8, 0.5);
    InterfaceSample cells = makeLine(16, 0.5);

    std::unique_ptr<InProcessCouplingHub> hub;
    std::unique_ptr<InProcessCouplingChannel> first;
    std::unique_ptr<InProcessCouplingChannel> second;
    MeshHandle firstRead, firstWrite, secondRead, secondWrite;
};

} // namespace

TEST_F(InProcessChannelTest, ThirdParticipantIsRejected)
{
    connect(InProcessSettings());
    EXPECT_EQ(hub->getNumParticipants(), 2);
    EXPECT_THROW(hub->connect("HeatRobin"), ConfigurationError);
}

TEST_F(InProcessChannelTest, DuplicateNamesAreRejected)
{
    InProcessCouplingHub single(InProcessSettings{});
    std::unique_ptr<InProcessCouplingChannel> channel = single.connect("HeatDirichlet");
    EXPECT_THROW(single.connect("HeatDirichlet"), ConfigurationError);

    channel->registerInterface("Mesh", gauss);
    EXPECT_THROW(channel->registerInterface("Mesh", cells), ConfigurationError);
}

TEST_F(InProcessChannelTest, ExplicitSchemeAlternatesParticipants)
{
    InProcessSettings settings;
    settings.maxTime = 0.3;
    settings.windowSize = WINDOW;
    connect(settings);

    EXPECT_NEAR(first->initialize(), WINDOW, TIME_TOLERANCE);
    EXPECT_NEAR(second->initialize(), WINDOW, TIME_TOLERANCE);
    EXPECT_FALSE(first->isActionRequired(CheckpointAction::WriteCheckpoint));

    // Nothing to read before the second participant has run
    EXPECT_FALSE(first->isReadAvailable());

    for (int window = 0; window < 3; window++)
    {
        ASSERT_TRUE(first->isOngoing());
        if (window > 0)
        {
            ASSERT_TRUE(first->isReadAvailable());
            mfem::Vector temperature;
            first->read(TEMPERATURE, firstRead, temperature);
            ASSERT_EQ(temperature.Size(), gauss.size());
            EXPECT_DOUBLE_EQ(temperature(0), 10.0 * window);
        }
        ASSERT_TRUE(first->isWriteRequired(WINDOW));
        first->write(FLUX, firstWrite, constant(cells.size(), window + 1.0));
        first->advance(WINDOW);

        ASSERT_TRUE(second->isReadAvailable());
        mfem::Vector flux;
        second->read(FLUX, secondRead, flux);
        ASSERT_EQ(flux.Size(), gauss.size());
        EXPECT_DOUBLE_EQ(flux(flux.Size() - 1), window + 1.0);
        second->write(TEMPERATURE, secondWrite, constant(cells.size(), 10.0 * (window + 1)));
        second->advance(WINDOW);
    }

    EXPECT_FALSE(first->isOngoing());
    EXPECT_FALSE(second->isOngoing());
    EXPECT_NEAR(first->getClock().time, 0.3, TIME_TOLERANCE);
    EXPECT_EQ(first->getCompletedSweeps(), 3);

    first->finalize();
    second->finalize();
    EXPECT_THROW(first->finalize(), CoordinatorProtocolViolation);
}

TEST_F(InProcessChannelTest, SecondParticipantCannotRunAhead)
{
    connect(InProcessSettings());
    first->initialize();
    second->initialize();

    mfem::Vector values;
    EXPECT_THROW(second->read(FLUX, secondRead, values), CoordinatorProtocolViolation);
}

TEST_F(InProcessChannelTest, ReadOfWrongQuantityIsProtocolViolation)
{
    connect(InProcessSettings());
    first->initialize();
    second->initialize();
    first->write(FLUX, firstWrite, constant(cells.size(), 1.0));
    first->advance(WINDOW);

    mfem::Vector values;
    EXPECT_THROW(second->read(TEMPERATURE, secondRead, values), CoordinatorProtocolViolation);
}

TEST_F(InProcessChannelTest, ImplicitSchemeRequestsCheckpoints)
{
    InProcessSettings settings;
    settings.maxTime = 2 * WINDOW;
    settings.windowSize = WINDOW;
    settings.iterationsPerWindow = 2;
    settings.relaxation = 0.5;
    connect(settings);

    first->initialize();
    second->initialize();
    ASSERT_TRUE(first->isActionRequired(CheckpointAction::WriteCheckpoint));
    EXPECT_THROW(first->advance(WINDOW), CoordinatorProtocolViolation);
    first->acknowledge(CheckpointAction::WriteCheckpoint);
    EXPECT_THROW(first->acknowledge(CheckpointAction::WriteCheckpoint), CoordinatorProtocolViolation);

    // Window 1, iteration 1
    first->write(FLUX, firstWrite, constant(cells.size(), 1.0));
    EXPECT_NEAR(first->advance(WINDOW), WINDOW, TIME_TOLERANCE);
    ASSERT_TRUE(first->isActionRequired(CheckpointAction::ReadCheckpoint));
    EXPECT_NEAR(first->getClock().time, 0.0, TIME_TOLERANCE);
    mfem::Vector values;
    EXPECT_THROW(first->read(TEMPERATURE, firstRead, values), CoordinatorProtocolViolation);
    first->acknowledge(CheckpointAction::ReadCheckpoint);

    second->acknowledge(CheckpointAction::WriteCheckpoint);
    second->read(FLUX, secondRead, values);
    second->write(TEMPERATURE, secondWrite, constant(cells.size(), 1.0));
    second->advance(WINDOW);
    second->acknowledge(CheckpointAction::ReadCheckpoint);

    // Window 1, iteration 2
    first->read(TEMPERATURE, firstRead, values);
    EXPECT_DOUBLE_EQ(values(0), 1.0);
    first->write(FLUX, firstWrite, constant(cells.size(), 1.0));
    first->advance(WINDOW);
    EXPECT_FALSE(first->isActionRequired(CheckpointAction::ReadCheckpoint));
    EXPECT_TRUE(first->isActionRequired(CheckpointAction::WriteCheckpoint));
    EXPECT_EQ(first->getIteration(), 0);

    second->read(FLUX, secondRead, values);
    second->write(TEMPERATURE, secondWrite, constant(cells.size(), 3.0));
    second->advance(WINDOW);

    // Window 2 sees the relaxed temperature 0.5 * 3 + 0.5 * 1
    first->acknowledge(CheckpointAction::WriteCheckpoint);
    first->read(TEMPERATURE, firstRead, values);
    EXPECT_DOUBLE_EQ(values(0), 2.0);
}

TEST_F(InProcessChannelTest, SubcyclingWritesAtWindowEnd)
{
    InProcessSettings settings;
    settings.maxTime = WINDOW;
    settings.windowSize = WINDOW;
    connect(settings);
    first->initialize();

    const double half = 0.5 * WINDOW;
    EXPECT_FALSE(first->isWriteRequired(half));
    EXPECT_NEAR(first->advance(half), half, TIME_TOLERANCE);
    EXPECT_NEAR(first->getClock().time, half, TIME_TOLERANCE);
    EXPECT_TRUE(first->isWriteRequired(half));
    EXPECT_THROW(first->advance(WINDOW), CoordinatorProtocolViolation);

    // Completing the window without data is a protocol error
    EXPECT_THROW(first->advance(half), CoordinatorProtocolViolation);
}

TEST_F(InProcessChannelTest, CallsOutsideTheRunAreRejected)
{
    connect(InProcessSettings());
    mfem::Vector values;
    EXPECT_THROW(first->advance(WINDOW), CoordinatorProtocolViolation);
    EXPECT_THROW(first->read(TEMPERATURE, firstRead, values), CoordinatorProtocolViolation);

    first->initialize();
    EXPECT_THROW(first->initialize(), CoordinatorProtocolViolation);
    EXPECT_THROW(first->registerInterface("Late-Mesh", gauss), CoordinatorProtocolViolation);
    EXPECT_THROW(first->write(FLUX, firstWrite, constant(3, 1.0)), ConfigurationError);

    first->finalize();
    EXPECT_THROW(first->isReadAvailable(), CoordinatorProtocolViolation);
}

TEST_F(InProcessChannelTest, InvalidSettingsAreRejected)
{
    InProcessSettings settings;
    settings.iterationsPerWindow = 0;
    EXPECT_THROW(InProcessCouplingHub{settings}, ConfigurationError);

    settings = InProcessSettings();
    settings.relaxation = 1.5;
    EXPECT_THROW(InProcessCouplingHub{settings}, ConfigurationError);

    settings = InProcessSettings();
    settings.windowSize = 0.0;
    EXPECT_THROW(InProcessCouplingHub{settings}, ConfigurationError);
}

TEST(NearestNeighbourTest, PicksClosestSourcePoint)
{
    InterfaceSample source = makeLine(4, 0.5);
    InterfaceSample target = makeLine(2, 0.5);

    mfem::Vector values(4);
    for (int i = 0; i < 4; i++)
    {
        values(i) = i;
    }

    // Targets at x = 0.25 and 0.75 are equidistant from two sources; the first wins
    mfem::Vector mapped;
    mapNearestNeighbour(source, values, target, mapped);
    ASSERT_EQ(mapped.Size(), 2);
    EXPECT_EQ(mapped(0), 0.0);
    EXPECT_EQ(mapped(1), 2.0);

    mfem::Vector wrong(3);
    EXPECT_THROW(mapNearestNeighbour(source, wrong, target, mapped), ConfigurationError);
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
