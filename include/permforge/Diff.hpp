/**
 * @file Diff.hpp
 * @brief Minimal world overrides relative to the default context
 */

#ifndef PERMFORGE_DIFF_HPP
#define PERMFORGE_DIFF_HPP

#include "permforge/Model.hpp"

namespace permforge {

/**
 * @brief Compute the override of `overlay` relative to `base`
 *
 * For every group of `overlay`:
 * - weight: included if `base` has no weight for it or a different one
 * - parents: included if the group is new or the list differs
 *   (order-sensitive)
 * - permissions: included if the group is new or the lists differ as
 *   case-insensitive sets; the included list is overlay's complete list
 *
 * Groups of `base` that `overlay` does not mention are left out: a world
 * never implies deletion of default groups.
 *
 * @param base The default context
 * @param overlay The world context
 * @return The delta; empty when overlay adds nothing to base
 */
DeltaTree diff(const CombinedTree& base, const CombinedTree& overlay);

/**
 * @brief Layer a delta over a base tree
 *
 * For every group of the overlay a delta was computed from, the result
 * carries the overlay's parents, weight and permissions.
 */
CombinedTree apply(const CombinedTree& base, const DeltaTree& delta);

} // namespace permforge

#endif // PERMFORGE_DIFF_HPP
