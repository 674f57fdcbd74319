/**
 * @file io/solution_writer.hpp
 * @brief Console progress and ParaView output of committed windows
 */

#ifndef HEATCOUPLE_IO_SOLUTION_WRITER_HPP
#define HEATCOUPLE_IO_SOLUTION_WRITER_HPP

#include "heatcouple/core/coupling_observer.hpp"
#include "mfem.hpp"
#include <string>

namespace heatcouple
{

struct WriterOptions
{
    std::string collectionName = "solution";
    std::string outputDir = "results";
    bool paraview = true;
    int saveEvery = 1;
    int printLevel = 1;
    /// Prepended to console lines, e.g. the participant name
    std::string prefix;
};

/**
 * @class SolutionWriter
 * @brief CouplingObserver saving Temperature and Exact fields
 *
 * The exact field is the steady reference solution and is projected once.
 * Every saveEvery committed windows the state is copied into the
 * Temperature field and written to the ParaView collection.
 */
class SolutionWriter : public CouplingObserver
{
public:
    SolutionWriter(mfem::FiniteElementSpace* fespace, mfem::Coefficient* exact, const WriterOptions& options);
    ~SolutionWriter() override;

    SolutionWriter(const SolutionWriter&) = delete;
    SolutionWriter& operator=(const SolutionWriter&) = delete;

    /// Writes cycle 0 before the first window
    void saveInitial(const mfem::Vector& state);

    void onWindowCommitted(int window, double time, const mfem::Vector& state) override;
    void onRollback(double time) override;

    const mfem::GridFunction& getTemperature() const { return temperature_; }
    int getNumSaved() const { return numSaved_; }
    double getLastError() const { return lastError_; }

private:
    void save(int cycle, double time);

    mfem::Coefficient* exact_;
    WriterOptions options_;
    mfem::GridFunction temperature_;
    mfem::GridFunction exactField_;
    mfem::ParaViewDataCollection* paraview_;
    int numSaved_;
    double lastError_;
};

/// Writes "h, error" in the format of the convergence logs, truncating the file
void writeErrorLog(const std::string& fileName, double meshSize, double error);

} // namespace heatcouple

#endif // HEATCOUPLE_IO_SOLUTION_WRITER_HPP
