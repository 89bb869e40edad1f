#pragma once

#include <assoc-core/fwd.hh>

/// The empty payload of ac::assoc_set.
/// Carries no information: all units are equal.
struct ac::unit
{
    [[nodiscard]] friend constexpr bool operator==(unit, unit) noexcept { return true; }
};
