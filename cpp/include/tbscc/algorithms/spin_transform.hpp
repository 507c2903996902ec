// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <tbscc/data/spin_array.hpp>

namespace tbscc::algorithms {

/**
 * @brief Convert (charge, magnetization) to (up, down) in place
 *
 * Works on a flat column-major buffer holding num_spin contiguous blocks of
 * spin_stride elements. For two channels every pair (q, m) becomes
 * (0.5 (q + m), 0.5 (q - m)); one and four channels are left unchanged
 * (non-collinear components are consumed as they are).
 *
 * @param data First element of the buffer
 * @param spin_stride Number of elements per spin channel
 * @param num_spin Number of spin channels
 * @throws ConfigurationError if num_spin is not 1, 2 or 4
 */
void to_up_down(double* data, size_t spin_stride, size_t num_spin);

/**
 * @brief Convert (up, down) to (charge, magnetization) in place
 *
 * Inverse of to_up_down: (u, d) becomes (u + d, u - d) for two channels.
 *
 * @throws ConfigurationError if num_spin is not 1, 2 or 4
 */
void to_charge_mag(double* data, size_t spin_stride, size_t num_spin);

/**
 * @brief In-place to_up_down over an array of any rank, spin axis last
 *
 * ```cpp
 * data::SpinResolvedArray q({1}, 2);
 * q(0, 0) = 2.0;
 * q(0, 1) = 0.4;
 * to_up_down(q);  // q == (1.2, 0.8)
 * ```
 */
void to_up_down(data::SpinResolvedArray& array);

/// In-place to_charge_mag over an array of any rank, spin axis last
void to_charge_mag(data::SpinResolvedArray& array);

/// Transformed copy; the argument is left untouched
data::SpinResolvedArray as_up_down(data::SpinResolvedArray array);

/// Transformed copy; the argument is left untouched
data::SpinResolvedArray as_charge_mag(data::SpinResolvedArray array);

}  // namespace tbscc::algorithms
