// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_miniscript_compiler_h_
#define included_msc_miniscript_compiler_h_

#include <miniscript/miniscript.h>
#include <policy/policy.h>

namespace msc {

/**
 * Witness element sizes (in bytes, length prefix included) the compiler
 * optimizes for, and the limits it works within.
 */
struct CostModel {
    double sig_size = 73;
    double pk_size = 34;
    double preimage_size = 33;
    double hash_dsat_size = 33;
    //! Candidates costing more than this are dropped.
    double max_cost = 10000;
    //! Only accept results where every satisfaction needs a signature.
    bool require_safe = false;
};

/**
 * Find the cheapest fragment enforcing policy, where cost is script size
 * plus the expected witness size given the OR weights. avgcost is set to
 * the expected satisfaction witness size of the result. Throws
 * compile_error naming the smallest sub-policy that has no acceptable
 * compilation (printed with ctx, or with hex keys if none is given).
 */
NodeRef Compile(const Policy& policy, double& avgcost, const CostModel& model = CostModel(), const KeyContext* ctx = nullptr);

} // namespace msc

#endif // included_msc_miniscript_compiler_h_
