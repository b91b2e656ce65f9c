// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdio>
#include <set>
#include <unistd.h>

#include <cliargs.h>
#include <logging.h>
#include <miniscript/codec.h>
#include <miniscript/compiler.h>
#include <miniscript/oracle.h>
#include <miniscript/satisfy.h>
#include <miniscript/tree.h>
#include <policy/policy.h>
#include <script/interpreter.h>
#include <util/strings.h>

#include <tinyformat.h>

using namespace msc;

namespace {

void usage(const char* argv0)
{
    fprintf(stderr, "Syntax: %s [-m|--miniscript] [-d|--decode] [-s|--satisfy [--have=<key>[,<key>...]] [--preimage=<hex>[,<hex>...]] [--older=<n>] [--after=<n>]] [--sig-size=<bytes>] [--require-safe] [--debug=compile|decode|satisfy|verify[,...]|-D...] <input>\n", argv0);
    fprintf(stderr, "By default the input is a policy, e.g. 'or(9@pk(A),and(pk(B),older(144)))', which is compiled.\n");
    fprintf(stderr, "With --miniscript the input is a fragment, e.g. 'and_v(v:pk(A),older(144))'; with --decode it is a script in hex.\n");
    fprintf(stderr, "Keys are 66 hex digits or names of at most 16 characters; a name stands for a fixed key derived from it.\n");
    fprintf(stderr, "--satisfy produces a witness from what --have, --preimage, --older (input nSequence) and --after (nLockTime) make available, verifies it, and prints which fragments can be satisfied.\n");
    fprintf(stderr, "You can set the environment variables DEBUG_COMPILE, DEBUG_DECODE, DEBUG_SATISFY and DEBUG_VERIFY to increase verbosity for the respective areas.\n");
}

/** Print what went wrong, pointing at the offending part of the input where known. */
void print_span(const std::string& input, size_t begin, size_t end)
{
    if (begin > input.size()) return;
    if (end <= begin) end = begin + 1;
    fprintf(stderr, "  %s\n  %s%s\n", input.c_str(), std::string(begin, ' ').c_str(), ("^" + std::string(end - begin - 1, '~')).c_str());
}

bool parse_number(const cliargs& ca, char opt, const char* name, uint32_t& out)
{
    auto it = ca.m.find(opt);
    if (it == ca.m.end()) return true;
    if (!ParseUInt32(it->second, &out)) {
        fprintf(stderr, "invalid --%s value: %s\n", name, it->second.c_str());
        return false;
    }
    return true;
}

void describe(const Node& node, const CompilerContext& ctx)
{
    Script script = ToScript(node);
    printf("fragment:  %s\n", node.ToString(ctx).c_str());
    printf("type:      %s\n", node.GetType().ToString().c_str());
    printf("script:    %s\n", HexStr(script).c_str());
    printf("size:      %u bytes\n", (unsigned)node.ScriptSize());
    printf("ops:       %u (limit %d)\n", node.GetOps(), MAX_OPS_PER_SCRIPT);
    printf("stack:     %u items (limit %u)\n", node.GetStackSize(), MAX_STANDARD_P2WSH_STACK_ITEMS);
    printf("sane:      %s\n", node.IsSane() ? "yes" : "no");
    if (!node.IsSane()) {
        if (!node.IsValidTopLevel()) printf("           not a valid top level (B) expression\n");
        if (!node.IsNonMalleable()) printf("           malleable\n");
        if (!node.NeedsSignature()) printf("           can be satisfied without a signature\n");
        if (!node.CheckTimeLocksMix()) printf("           mixes height and time locks\n");
        if (!node.CheckOpsLimit()) printf("           exceeds the opcode limit\n");
        if (!node.CheckStackSize()) printf("           exceeds the stack item limit\n");
    }
    printf("disassembly:\n%s", Disassemble(script, &ctx).c_str());
}

int satisfy(const Node& node, const cliargs& ca, CompilerContext& ctx)
{
    InventorySatisfier oracle;
    oracle.ctx = &ctx;
    auto it = ca.m.find('H');
    if (it != ca.m.end()) {
        std::set<std::string> names;
        DelimiterSet(it->second, names, false);
        for (const auto& name : names) {
            Key key;
            if (!ctx.FromString(name, key)) {
                fprintf(stderr, "invalid key in --have: %s\n", name.c_str());
                return 1;
            }
            oracle.signers.insert(key);
        }
    }
    it = ca.m.find('P');
    if (it != ca.m.end()) {
        std::set<std::string> hexes;
        DelimiterSet(it->second, hexes);
        for (const auto& hex : hexes) {
            valtype preimage = ParseHex(hex);
            if (preimage.size() != 32) {
                fprintf(stderr, "preimages must be 32 bytes of hex: %s\n", hex.c_str());
                return 1;
            }
            oracle.preimages.push_back(std::move(preimage));
        }
    }
    if (!parse_number(ca, 'o', "older", oracle.sequence)) return 1;
    if (!parse_number(ca, 'a', "after", oracle.locktime)) return 1;

    SatisfactionReport report;
    std::vector<valtype> witness;
    Availability avail = Satisfy(node, oracle, witness, true, &report);
    printf("\n%s", TreeString(node, ctx, &report, isatty(fileno(stdout))).c_str());
    if (avail == Availability::NO) {
        std::vector<valtype> malleable;
        if (Satisfy(node, oracle, malleable, false) == Availability::YES) {
            printf("unsatisfiable without malleability; a malleable witness of %u items exists\n", (unsigned)malleable.size());
        } else {
            printf("unsatisfiable\n");
        }
        return 2;
    }
    printf("witness (%u items, bottom first):\n", (unsigned)witness.size());
    for (const auto& item : witness) {
        printf("  <%s>\n", HexStr(item).c_str());
    }

    ScriptError serror;
    std::vector<SatisfiedConstraint> trace;
    PretendSignatureChecker checker(oracle.sequence, oracle.locktime);
    if (!VerifyWitness(witness, ToScript(node), STANDARD_SCRIPT_VERIFY_FLAGS, checker, &serror, &trace)) {
        printf("witness verification FAILED: %s\n", ScriptErrorString(serror).c_str());
        return 3;
    }
    printf("witness verified; satisfied constraints:\n");
    for (const auto& c : trace) {
        printf("  %s\n", c.ToString().c_str());
    }
    return 0;
}

} // namespace

int main(int argc, char* const* argv)
{
    msc_enable_categories_from_env();

    cliargs ca;
    ca.add_option("help", 'h', no_arg);
    ca.add_option("miniscript", 'm', no_arg);
    ca.add_option("decode", 'd', no_arg);
    ca.add_option("satisfy", 's', no_arg);
    ca.add_option("have", 'H', req_arg);
    ca.add_option("preimage", 'P', req_arg);
    ca.add_option("older", 'o', req_arg);
    ca.add_option("after", 'a', req_arg);
    ca.add_option("sig-size", 'S', req_arg);
    ca.add_option("require-safe", 'R', no_arg);
    ca.add_option("debug", 'D', req_arg);
    if (!ca.parse(argc, argv) || ca.m.count('h') || ca.l.size() != 1 || (ca.m.count('m') && ca.m.count('d'))) {
        usage(argv[0]);
        return ca.m.count('h') ? 0 : 1;
    }

    if (ca.m.count('D')) {
        std::set<std::string> debug_set;
        DelimiterSet(ca.m['D'], debug_set);
        for (const auto& name : debug_set) {
            if (!msc_enable_category(name)) {
                fprintf(stderr, "unknown debug category: %s\n", name.c_str());
                return 1;
            }
        }
    }

    CostModel model;
    if (ca.m.count('S')) {
        uint32_t sig_size;
        if (!ParseUInt32(ca.m['S'], &sig_size) || sig_size == 0) {
            fprintf(stderr, "invalid --sig-size value: %s\n", ca.m['S'].c_str());
            return 1;
        }
        model.sig_size = sig_size;
    }
    model.require_safe = ca.m.count('R') > 0;

    CompilerContext ctx;
    ctx.symbolic_outputs = true;
    const std::string input = ca.l[0];
    NodeRef node;
    try {
        if (ca.m.count('m')) {
            node = FromString(input, ctx);
        } else if (ca.m.count('d')) {
            if (!IsHex(input)) {
                fprintf(stderr, "not a hex script: %s\n", input.c_str());
                return 1;
            }
            node = FromScript(Script(ParseHex(input)), ctx);
        } else {
            Policy policy = ParsePolicy(input, ctx);
            printf("policy:    %s\n", ToString(policy, ctx).c_str());
            double avgcost = 0;
            node = Compile(policy, avgcost, model, &ctx);
            printf("cost:      %.3f (script %u + expected witness %.3f)\n", node->ScriptSize() + avgcost, (unsigned)node->ScriptSize(), avgcost);
        }
    } catch (const parse_error& e) {
        fprintf(stderr, "%s\n", e.what());
        print_span(input, e.begin(), e.end());
        return 1;
    } catch (const decode_error& e) {
        fprintf(stderr, "%s\n", e.what());
        print_span(input, e.offset() * 2, e.offset() * 2 + 2);
        return 1;
    } catch (const type_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    } catch (const compile_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    describe(*node, ctx);

    if (ca.m.count('s')) return satisfy(*node, ca, ctx);
    return 0;
}
