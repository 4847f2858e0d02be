/**
 * @file phase.hpp
 * @brief Construction phase ordering used for progress reporting.
 * @author Dimitris Kafetzis
 *
 * Phases never gate scheduling; dependencies do. The rank only orders
 * reports and, when enabled, the dispatch order inside one ready batch.
 */

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace crew_orchestrator {

inline constexpr std::array<std::string_view, 9> kPhaseOrder{
    "planning",
    "permitting",
    "demolition",
    "foundation",
    "framing",
    "rough_in",
    "inspection",
    "finishing",
    "final_inspection",
};

/// Position of a phase in kPhaseOrder; unknown phases rank after all known ones.
[[nodiscard]] constexpr size_t phase_rank(std::string_view phase) noexcept {
    for (size_t i = 0; i < kPhaseOrder.size(); ++i) {
        if (kPhaseOrder[i] == phase) return i;
    }
    return kPhaseOrder.size();
}

}  // namespace crew_orchestrator
