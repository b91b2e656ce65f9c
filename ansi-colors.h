// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_ansicolors_h_
#define included_msc_ansicolors_h_

#include <string>

namespace ansi {

const std::string reset("\033[0m"); // everything back to normal

const std::string bold("\033[1m"); // often a brighter shade of the same color

const std::string fg_red    ("\033[0;31m");
const std::string fg_green  ("\033[0;32m");

} // namespace ansi

#endif // included_msc_ansicolors_h_
