// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_miniscript_codec_h_
#define included_msc_miniscript_codec_h_

#include <miniscript/miniscript.h>
#include <script/script.h>

#include <string>

namespace msc {

/**
 * Canonical script for a fragment. A v: wrapper over a child ending in
 * OP_CHECKSIG, OP_EQUAL or OP_CHECKMULTISIG merges into the -VERIFY form of
 * that opcode instead of appending OP_VERIFY.
 */
Script ToScript(const Node& node);

/**
 * Recover the fragment a script is the canonical encoding of. Keys are
 * resolved through ctx.FromPKBytes. Chains of and_v come back right-nested.
 * Throws decode_error with the byte offset of the problem.
 */
NodeRef FromScript(const Script& script, const KeyContext& ctx);

/**
 * Indented listing of a script, one branch level per indent. With a
 * context, keys known to it print as <name> and their hashes as
 * <HASH160(name)>.
 */
std::string Disassemble(const Script& script, const KeyContext* ctx = nullptr);

} // namespace msc

#endif // included_msc_miniscript_codec_h_
