// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_miniscript_tree_h_
#define included_msc_miniscript_tree_h_

#include <miniscript/miniscript.h>
#include <miniscript/satisfy.h>

#include <string>

namespace msc {

/**
 * Render node as an indented tree, one fragment per line, with wrappers
 * folded into their child's line. With a report, each line is marked
 * with the satisfaction and dissatisfaction availability of that
 * fragment and, if color is set, drawn green when it can be satisfied and
 * red when it cannot.
 */
std::string TreeString(const Node& node, const KeyContext& ctx, const SatisfactionReport* report = nullptr, bool color = true);

} // namespace msc

#endif // included_msc_miniscript_tree_h_
