/**
 * @file io/solution_writer.cpp
 * @brief Implementation of the solution writer
 */

#include "heatcouple/io/solution_writer.hpp"
#include "heatcouple/core/errors.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>

namespace heatcouple
{

SolutionWriter::SolutionWriter(mfem::FiniteElementSpace* fespace,
                               mfem::Coefficient* exact,
                               const WriterOptions& options)
    : exact_(exact),
      options_(options),
      temperature_(fespace),
      exactField_(fespace),
      paraview_(nullptr),
      numSaved_(0),
      lastError_(0.0)
{
    if (!exact_)
    {
        throw ConfigurationError("SolutionWriter: null exact solution");
    }
    if (options_.saveEvery < 1)
    {
        throw ConfigurationError("SolutionWriter: output interval must be at least 1");
    }

    temperature_ = 0.0;
    exactField_.ProjectCoefficient(*exact_);

    if (options_.paraview)
    {
        paraview_ = new mfem::ParaViewDataCollection(options_.collectionName, fespace->GetMesh());
        paraview_->SetPrefixPath(options_.outputDir);
        paraview_->SetLevelsOfDetail(fespace->GetMaxElementOrder());
        paraview_->SetDataFormat(mfem::VTKFormat::BINARY);
        paraview_->RegisterField("Temperature", &temperature_);
        paraview_->RegisterField("Exact", &exactField_);
    }
}

SolutionWriter::~SolutionWriter()
{
    delete paraview_;
}

void SolutionWriter::saveInitial(const mfem::Vector& state)
{
    temperature_ = state;
    save(0, 0.0);

    if (options_.printLevel > 0)
    {
        std::cout << options_.prefix << "Window |   Time    | T_min  | T_max  | L2 error" << std::endl;
        std::cout << options_.prefix << "-------+-----------+--------+--------+----------" << std::endl;
    }
}

void SolutionWriter::onWindowCommitted(int window, double time, const mfem::Vector& state)
{
    temperature_ = state;
    lastError_ = temperature_.ComputeL2Error(*exact_);

    if (options_.printLevel > 0)
    {
        std::cout << options_.prefix << std::setw(6) << window << " | " << std::setw(9) << std::fixed
                  << std::setprecision(4) << time << " | " << std::setw(6) << std::setprecision(3)
                  << temperature_.Min() << " | " << std::setw(6) << temperature_.Max() << " | "
                  << std::scientific << std::setprecision(2) << lastError_ << std::defaultfloat << std::endl;
    }

    if (window % options_.saveEvery == 0)
    {
        save(window, time);
    }
}

void SolutionWriter::onRollback(double time)
{
    if (options_.printLevel > 1)
    {
        std::cout << options_.prefix << "rollback to t = " << time << std::endl;
    }
}

void SolutionWriter::save(int cycle, double time)
{
    if (!paraview_)
    {
        return;
    }
    paraview_->SetCycle(cycle);
    paraview_->SetTime(time);
    paraview_->Save();
    ++numSaved_;
}

void writeErrorLog(const std::string& fileName, double meshSize, double error)
{
    std::ofstream out(fileName, std::ios::trunc);
    if (!out)
    {
        throw ConfigurationError("cannot open error log '" + fileName + "'");
    }
    out << std::scientific << std::setprecision(2) << meshSize << ", " << error << std::endl;
}

} // namespace heatcouple
