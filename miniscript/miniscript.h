// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_miniscript_miniscript_h_
#define included_msc_miniscript_miniscript_h_

#include <miniscript/errors.h>
#include <miniscript/key.h>
#include <miniscript/types.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace msc {

struct Node;

/** Deepest nesting the fragment, script and policy parsers accept. */
static const uint32_t MAX_RECURSION_DEPTH = 402;

/** Fragments own their children exclusively and are immutable once built. */
typedef std::unique_ptr<const Node> NodeRef;

/**
 * A typed fragment. The type, script length, opcode counts and stack sizes
 * are derived from the children when the node is built (see MakeNode) and
 * never change afterwards.
 */
struct Node {
    //! What kind of node this is.
    const NodeType nodetype;
    //! The k parameter (time for OLDER/AFTER, threshold for THRESH/MULTI).
    const uint32_t k = 0;
    //! The keys used by this expression (only for PK_K/MULTI).
    const std::vector<Key> keys;
    //! The data bytes in this expression (key hash for PK_H, digest for the hash fragments).
    const valtype data;
    //! Subexpressions (for WRAP_*/AND_*/OR_*/ANDOR/THRESH).
    const std::vector<NodeRef> subs;

private:
    const Type typ;
    const size_t scriptlen;
    const Ops ops;
    const StackSize ss;

    Type CalcType() const;
    size_t CalcScriptLen() const;
    Ops CalcOps() const;
    StackSize CalcStackSize() const;

    Node(NodeType nt, std::vector<NodeRef> sub, std::vector<Key> key, valtype arg, uint32_t val);
    friend NodeRef MakeNode(NodeType nt, std::vector<NodeRef> subs, std::vector<Key> keys, valtype data, uint32_t k);

public:

    Type GetType() const { return typ; }

    /** Length of the encoded script in bytes. */
    size_t ScriptSize() const { return scriptlen; }

    /** Worst-case number of executed non-push opcodes on satisfaction. */
    uint32_t GetOps() const { return ops.count + ops.sat.value; }
    const Ops& GetOpsInfo() const { return ops; }
    bool CheckOpsLimit() const;

    /** Maximum number of witness stack items on satisfaction (the script push not included). */
    uint32_t GetStackSize() const { return ss.sat.value; }
    const StackSize& GetStackSizeInfo() const { return ss; }
    bool CheckStackSize() const;

    bool IsValid() const { return !(typ == ""_mst); }
    bool IsValidTopLevel() const { return IsValid() && typ << "B"_mst; }
    bool IsNonMalleable() const { return typ << "m"_mst; }
    bool NeedsSignature() const { return typ << "s"_mst; }
    bool CheckTimeLocksMix() const { return typ << "k"_mst; }

    /** Valid top level B, non-malleable, needs a signature, no timelock mixing, and within the standardness limits. */
    bool IsSane() const;

    /** Text form, using the context for key names. */
    std::string ToString(const KeyContext& ctx) const;

    /** Deep copy. */
    NodeRef Clone() const;

    /**
     * Equality of the encoded scripts. Trees differing only in how and_v
     * associates, or in whether a wrapper or and_b/or_b sits above an and_v
     * or on its last operand, are equal.
     */
    bool operator==(const Node& other) const;
    bool operator!=(const Node& other) const { return !(*this == other); }
};

/** Render a composition (for type errors): name, arguments and child types. */
std::string DescribeComposition(NodeType nt, const std::vector<NodeRef>& subs, uint32_t k, size_t n_keys);

/**
 * Build a node, checking arguments and types. Throws type_error if the
 * arguments are malformed or the children cannot be composed this way.
 */
NodeRef MakeNode(NodeType nt, std::vector<NodeRef> subs, uint32_t k = 0);
NodeRef MakeNode(NodeType nt, std::vector<Key> keys, uint32_t k = 0);
NodeRef MakeNode(NodeType nt, valtype data);
NodeRef MakeNode(NodeType nt, uint32_t k = 0);
NodeRef MakeNode(NodeType nt, std::vector<NodeRef> subs, std::vector<Key> keys, valtype data, uint32_t k);

/** Vector of nodes from individual arguments (a braced list cannot hold move-only values). */
template<typename... Args>
std::vector<NodeRef> Subs(Args&&... args)
{
    std::vector<NodeRef> ret;
    ret.reserve(sizeof...(args));
    int dummy[] = {0, ((void)ret.emplace_back(std::forward<Args>(args)), 0)...};
    (void)dummy;
    return ret;
}

/**
 * Parse the text form of a fragment. Accepts the wrapper prefixes
 * (a s c d v j n t l u) and the pk, pkh and and_n shorthands.
 * Throws parse_error with the span of the offending text, or type_error.
 */
NodeRef FromString(const std::string& str, const KeyContext& ctx);

} // namespace msc

#endif // included_msc_miniscript_miniscript_h_
