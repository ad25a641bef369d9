//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.hpp
// Purpose: Declare tracing configuration and sink for interpreter steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: The sink borrows its output stream, which must outlive it.
// Links: src/vm/VMExecute.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Opcode.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace moo::vm
{
struct Activation;

/// @brief Configuration for interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,  ///< Tracing disabled
        Ops,  ///< One line per executed instruction
        Lines ///< One line whenever the executing source line changes
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record execution of @p op by the activation @p act at stack
    ///        depth @p depth (1 = outermost verb).
    void onStep(const compiler::Op &op, const Activation &act, size_t depth);

    const TraceConfig &config() const
    {
        return cfg;
    }

  private:
    std::ostream &stream() const;

    TraceConfig cfg; ///< Active configuration
    const Activation *lastActivation = nullptr;
    std::optional<size_t> lastLine;
};

} // namespace moo::vm
