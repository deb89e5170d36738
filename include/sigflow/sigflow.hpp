#pragma once

/**
 * @file sigflow.hpp
 * @brief Umbrella header for the SigFlow block-diagram engine
 *
 * Include this header to get access to all SigFlow public APIs. The standard
 * blocks live in the header-only block library (`sources/`, `math/`,
 * `discrete/`, `control/`, `sinks/`) and are included separately.
 */

// Core
#include <sigflow/core/Block.hpp>
#include <sigflow/core/Config.hpp>
#include <sigflow/core/CoreTypes.hpp>
#include <sigflow/core/Error.hpp>
#include <sigflow/core/ErrorLogging.hpp>

// Signal
#include <sigflow/signal/Port.hpp>
#include <sigflow/signal/Signal.hpp>

// Simulation
#include <sigflow/sim/DependencyGraph.hpp>
#include <sigflow/sim/System.hpp>
#include <sigflow/sim/SystemBuilder.hpp>
#include <sigflow/sim/SystemParams.hpp>

// Numerics
#include <sigflow/numeric/Ode.hpp>

// I/O
#include <sigflow/io/Console.hpp>
#include <sigflow/io/IntrospectionGraph.hpp>
#include <sigflow/io/LogService.hpp>
#include <sigflow/io/LogSink.hpp>
#include <sigflow/io/ParameterStore.hpp>
