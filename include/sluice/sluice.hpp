#pragma once

/**
 * @file sluice.hpp
 * @brief Umbrella header for the Sluice flowsheet engine
 *
 * Include this header to get access to all Sluice public APIs.
 */

// Core
#include <sluice/core/Component.hpp>
#include <sluice/core/ComponentFactory.hpp>
#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/Error.hpp>
#include <sluice/core/ErrorLogging.hpp>
#include <sluice/core/NodeConfig.hpp>
#include <sluice/core/ParameterResolver.hpp>

// Graph
#include <sluice/graph/Flowsheet.hpp>

// Scheduling
#include <sluice/sched/CycleAnalyzer.hpp>
#include <sluice/sched/StagePlanner.hpp>
#include <sluice/sched/TearSelector.hpp>

// Simulation
#include <sluice/sim/Executor.hpp>
#include <sluice/sim/Simulator.hpp>
#include <sluice/sim/SimulatorConfig.hpp>
#include <sluice/sim/SolverConfig.hpp>

// I/O
#include <sluice/io/Console.hpp>
#include <sluice/io/FlowsheetLoader.hpp>
#include <sluice/io/LogService.hpp>
#include <sluice/io/LogSink.hpp>
#include <sluice/io/ObservationRecorder.hpp>
#include <sluice/io/PlanExport.hpp>
#include <sluice/io/Recorder.hpp>
#include <sluice/io/RecordingReader.hpp>

namespace sluice {
// Version functions are defined in core/CoreTypes.hpp
} // namespace sluice
