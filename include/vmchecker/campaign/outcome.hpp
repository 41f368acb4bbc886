/// \file
/// Result data for one campaign run. Nothing here outlives the process
#pragma once

#include <vmchecker/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>
#include <gsl/util>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/count_if.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vmchecker {

/// Idle -> Connected -> Reverted -> LoggedIn -> Running(i) -> {Running(i+1) | Aborted | Completed}
enum class CampaignState { Idle, Connected, Reverted, LoggedIn, Running, Aborted, Completed };
BOOST_DESCRIBE_ENUM(CampaignState, Idle, Connected, Reverted, LoggedIn, Running, Aborted, Completed);

constexpr bool is_terminal(CampaignState state) noexcept {
    return state == CampaignState::Aborted || state == CampaignState::Completed;
}

struct StageOutcome
{
    std::size_t index{};
    bool passed{};

    /// Scripts that were started, in order. On failure, the last one is the one that timed out
    std::vector<std::string> scripts_attempted;

    std::optional<std::string> timed_out_script;
};

struct CampaignOutcome
{
    std::vector<StageOutcome> stage_outcomes;
    std::size_t num_stages_total{};
    CampaignState final_state = CampaignState::Idle;

    /// Every stage ran, and passed
    bool passed() const noexcept {
        return final_state == CampaignState::Completed && stage_outcomes.size() == num_stages_total &&
               ranges::all_of(stage_outcomes, &StageOutcome::passed);
    }

    std::size_t num_stages_passed() const noexcept {
        return gsl::narrow_cast<std::size_t>(ranges::count_if(stage_outcomes, &StageOutcome::passed));
    }
};

} // namespace vmchecker

FMT_SERIALIZE_ENUM(::vmchecker::CampaignState);
