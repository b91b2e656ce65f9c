// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <script/interpreter.h>

#include <crypto/hash.h>
#include <logging.h>
#include <util/strings.h>

#include <tinyformat.h>

namespace msc {

namespace {

inline bool set_success(ScriptError* ret)
{
    if (ret)
        *ret = SCRIPT_ERR_OK;
    return true;
}

inline bool set_error(ScriptError* ret, const ScriptError serror)
{
    if (ret)
        *ret = serror;
    return false;
}

} // anonymous namespace

#define stacktop(i)  (stack.at(stack.size()+(i)))
#define popstack(stack) do { msc_verify_logf("\t\t<> POP  " #stack "\n"); stack.pop_back(); } while (0)
#define pushstack(stack, v) do { stack.push_back(v); if (msc_enabled(msc_verify_logf)) msc_verify_logf("\t\t<> PUSH " #stack " %s\n", HexStr(stack.back()).c_str()); } while (0)

bool CastToBool(const valtype& vch)
{
    for (unsigned int i = 0; i < vch.size(); i++)
    {
        if (vch[i] != 0)
        {
            // Can be negative zero
            if (i == vch.size()-1 && vch[i] == 0x80)
                return false;
            return true;
        }
    }
    return false;
}

bool IsSupportedOpcode(opcodetype opcode)
{
    if (opcode <= OP_PUSHDATA4) return true;
    if (opcode >= OP_1 && opcode <= OP_16) return true;
    switch (opcode) {
    case OP_IF: case OP_NOTIF: case OP_ELSE: case OP_ENDIF: case OP_VERIFY:
    case OP_TOALTSTACK: case OP_FROMALTSTACK: case OP_IFDUP: case OP_DUP: case OP_SWAP:
    case OP_SIZE: case OP_EQUAL: case OP_EQUALVERIFY:
    case OP_0NOTEQUAL: case OP_ADD: case OP_BOOLAND: case OP_BOOLOR:
    case OP_RIPEMD160: case OP_SHA256: case OP_HASH160: case OP_HASH256:
    case OP_CHECKSIG: case OP_CHECKSIGVERIFY: case OP_CHECKMULTISIG: case OP_CHECKMULTISIGVERIFY:
    case OP_CHECKLOCKTIMEVERIFY: case OP_CHECKSEQUENCEVERIFY:
        return true;
    default:
        return false;
    }
}

std::string SatisfiedConstraint::ToString() const
{
    switch (kind) {
    case Kind::SIGNATURE: return strprintf("signature for %s", HexStr(data));
    case Kind::HASHLOCK: return strprintf("preimage of %s %s", GetOpName(hash_op), HexStr(data));
    case Kind::RELATIVE_TIMELOCK: return strprintf("relative timelock %d", value);
    case Kind::ABSOLUTE_TIMELOCK: return strprintf("absolute timelock %d", value);
    }
    throw std::logic_error("unknown constraint kind");
}

static void Record(ScriptExecutionEnvironment& env, SatisfiedConstraint c)
{
    if (msc_enabled(msc_verify_logf)) msc_verify_logf("\t\t<> satisfied: %s\n", c.ToString().c_str());
    if (env.trace) env.trace->push_back(std::move(c));
}

ScriptExecutionEnvironment::ScriptExecutionEnvironment(std::vector<valtype>& stack_in, const Script& script_in, unsigned int flags_in, const BaseSignatureChecker& checker_in, ScriptError* serror_in, std::vector<SatisfiedConstraint>* trace_in)
: script(script_in)
, pend(script_in.end())
, opcode(OP_INVALIDOPCODE)
, prev_opcode(OP_INVALIDOPCODE)
, nOpCount(0)
, fRequireMinimal((flags_in & SCRIPT_VERIFY_MINIMALDATA) != 0)
, stack(stack_in)
, flags(flags_in)
, checker(checker_in)
, serror(serror_in)
, trace(trace_in)
, pending_hashlock(OP_INVALIDOPCODE)
{}

bool StepScript(ScriptExecutionEnvironment& env, Script::const_iterator& pc)
{
    static const valtype vchFalse(0);
    static const valtype vchTrue(1, 1);

    auto& opcode = env.opcode;
    auto& vchPushValue = env.vchPushValue;
    auto& vfExec = env.vfExec;
    auto& altstack = env.altstack;
    auto& nOpCount = env.nOpCount;
    auto& fRequireMinimal = env.fRequireMinimal;
    auto& stack = env.stack;
    auto& flags = env.flags;
    auto& checker = env.checker;
    auto& serror = env.serror;

    bool fExec = vfExec.all_true();

    //
    // Read instruction
    //
    if (!env.script.GetOp(pc, opcode, vchPushValue))
        return set_error(serror, SCRIPT_ERR_BAD_OPCODE);
    if (vchPushValue.size() > MAX_SCRIPT_ELEMENT_SIZE)
        return set_error(serror, SCRIPT_ERR_PUSH_SIZE);
    if (!IsSupportedOpcode(opcode))
        return set_error(serror, SCRIPT_ERR_BAD_OPCODE);

    if (opcode > OP_16 && ++nOpCount > MAX_OPS_PER_SCRIPT)
        return set_error(serror, SCRIPT_ERR_OP_COUNT);

    if (msc_enabled(msc_verify_logf)) {
        msc_verify_logf("\t%s %s\n", fExec ? "exec" : "skip", vchPushValue.size() ? HexStr(vchPushValue).c_str() : GetOpName(opcode).c_str());
    }

    if (fExec && opcode <= OP_PUSHDATA4) {
        if (fRequireMinimal && !CheckMinimalPush(vchPushValue, opcode)) {
            return set_error(serror, SCRIPT_ERR_MINIMALDATA);
        }
        pushstack(stack, vchPushValue);
    } else if (fExec || (OP_IF <= opcode && opcode <= OP_ENDIF))
    switch (opcode)
    {
        //
        // Push value
        //
        case OP_1: case OP_2: case OP_3: case OP_4: case OP_5: case OP_6: case OP_7: case OP_8:
        case OP_9: case OP_10: case OP_11: case OP_12: case OP_13: case OP_14: case OP_15: case OP_16:
        {
            // ( -- value)
            ScriptNum bn((int)opcode - (int)(OP_1 - 1));
            pushstack(stack, bn.getvch());
        }
        break;

        //
        // Control
        //
        case OP_CHECKLOCKTIMEVERIFY:
        {
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);

            // Locktimes are 32-bit unsigned, so accept up to 5-byte numbers.
            const ScriptNum nLockTime(stacktop(-1), fRequireMinimal, 5);
            if (nLockTime < 0)
                return set_error(serror, SCRIPT_ERR_NEGATIVE_LOCKTIME);
            if (!checker.CheckLockTime(nLockTime))
                return set_error(serror, SCRIPT_ERR_UNSATISFIED_LOCKTIME);
            Record(env, SatisfiedConstraint{SatisfiedConstraint::Kind::ABSOLUTE_TIMELOCK, {}, OP_INVALIDOPCODE, nLockTime.GetInt64()});
        }
        break;

        case OP_CHECKSEQUENCEVERIFY:
        {
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);

            const ScriptNum nSequence(stacktop(-1), fRequireMinimal, 5);
            if (nSequence < 0)
                return set_error(serror, SCRIPT_ERR_NEGATIVE_LOCKTIME);

            // Disabled sequence locks behave as a NOP.
            if ((nSequence.GetInt64() & SEQUENCE_LOCKTIME_DISABLE_FLAG) != 0)
                break;

            if (!checker.CheckSequence(nSequence))
                return set_error(serror, SCRIPT_ERR_UNSATISFIED_LOCKTIME);
            Record(env, SatisfiedConstraint{SatisfiedConstraint::Kind::RELATIVE_TIMELOCK, {}, OP_INVALIDOPCODE, nSequence.GetInt64()});
        }
        break;

        case OP_IF:
        case OP_NOTIF:
        {
            // <expression> if [statements] [else [statements]] endif
            bool fValue = false;
            if (fExec)
            {
                if (stack.size() < 1)
                    return set_error(serror, SCRIPT_ERR_UNBALANCED_CONDITIONAL);
                valtype& vch = stacktop(-1);
                if (flags & SCRIPT_VERIFY_MINIMALIF) {
                    if (vch.size() > 1)
                        return set_error(serror, SCRIPT_ERR_MINIMALIF);
                    if (vch.size() == 1 && vch[0] != 1)
                        return set_error(serror, SCRIPT_ERR_MINIMALIF);
                }
                fValue = CastToBool(vch);
                if (opcode == OP_NOTIF)
                    fValue = !fValue;
                popstack(stack);
            }
            vfExec.push_back(fValue);
        }
        break;

        case OP_ELSE:
        {
            if (vfExec.empty())
                return set_error(serror, SCRIPT_ERR_UNBALANCED_CONDITIONAL);
            vfExec.toggle_top();
        }
        break;

        case OP_ENDIF:
        {
            if (vfExec.empty())
                return set_error(serror, SCRIPT_ERR_UNBALANCED_CONDITIONAL);
            vfExec.pop_back();
        }
        break;

        case OP_VERIFY:
        {
            // (true -- ) or
            // (false -- false) and return
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            if (!CastToBool(stacktop(-1)))
                return set_error(serror, SCRIPT_ERR_VERIFY);
            popstack(stack);
        }
        break;

        //
        // Stack ops
        //
        case OP_TOALTSTACK:
        {
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            pushstack(altstack, stacktop(-1));
            popstack(stack);
        }
        break;

        case OP_FROMALTSTACK:
        {
            if (altstack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_ALTSTACK_OPERATION);
            pushstack(stack, altstack.back());
            popstack(altstack);
        }
        break;

        case OP_IFDUP:
        {
            // (x - 0 | x x)
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            valtype vch = stacktop(-1);
            if (CastToBool(vch))
                pushstack(stack, vch);
        }
        break;

        case OP_DUP:
        {
            // (x -- x x)
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            valtype vch = stacktop(-1);
            pushstack(stack, vch);
        }
        break;

        case OP_SWAP:
        {
            // (x1 x2 -- x2 x1)
            if (stack.size() < 2)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            swap(stacktop(-2), stacktop(-1));
        }
        break;

        case OP_SIZE:
        {
            // (in -- in size)
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            ScriptNum bn(stacktop(-1).size());
            pushstack(stack, bn.getvch());
        }
        break;

        //
        // Bitwise logic
        //
        case OP_EQUAL:
        case OP_EQUALVERIFY:
        {
            // (x1 x2 - bool)
            if (stack.size() < 2)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            const bool fEqual = (stacktop(-2) == stacktop(-1));
            if (fEqual && env.pending_hashlock != OP_INVALIDOPCODE) {
                Record(env, SatisfiedConstraint{SatisfiedConstraint::Kind::HASHLOCK, stacktop(-1), env.pending_hashlock, 0});
            }
            env.pending_hashlock = OP_INVALIDOPCODE;
            popstack(stack);
            popstack(stack);
            pushstack(stack, fEqual ? vchTrue : vchFalse);
            if (opcode == OP_EQUALVERIFY)
            {
                if (!fEqual)
                    return set_error(serror, SCRIPT_ERR_EQUALVERIFY);
                popstack(stack);
            }
        }
        break;

        //
        // Numeric
        //
        case OP_0NOTEQUAL:
        {
            // (in -- out)
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            ScriptNum bn(stacktop(-1), fRequireMinimal);
            popstack(stack);
            pushstack(stack, ScriptNum(bn != 0).getvch());
        }
        break;

        case OP_ADD:
        case OP_BOOLAND:
        case OP_BOOLOR:
        {
            // (x1 x2 -- out)
            if (stack.size() < 2)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            ScriptNum bn1(stacktop(-2), fRequireMinimal);
            ScriptNum bn2(stacktop(-1), fRequireMinimal);
            ScriptNum bn(0);
            switch (opcode)
            {
            case OP_ADD:      bn = bn1 + bn2; break;
            case OP_BOOLAND:  bn = ScriptNum(bn1 != 0 && bn2 != 0); break;
            case OP_BOOLOR:   bn = ScriptNum(bn1 != 0 || bn2 != 0); break;
            default: throw std::logic_error("invalid opcode");
            }
            popstack(stack);
            popstack(stack);
            pushstack(stack, bn.getvch());
        }
        break;

        //
        // Crypto
        //
        case OP_RIPEMD160:
        case OP_SHA256:
        case OP_HASH160:
        case OP_HASH256:
        {
            // (in -- hash)
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            const valtype& vch = stacktop(-1);
            valtype vchHash;
            if (opcode == OP_RIPEMD160)
                vchHash = RIPEMD160(vch);
            else if (opcode == OP_SHA256)
                vchHash = SHA256(vch);
            else if (opcode == OP_HASH160)
                vchHash = Hash160(vch);
            else
                vchHash = Hash256(vch);
            // A hash lock checks the preimage size first; a key hash check hashes a DUP.
            env.pending_hashlock = env.prev_opcode == OP_EQUALVERIFY ? opcode : OP_INVALIDOPCODE;
            popstack(stack);
            pushstack(stack, vchHash);
        }
        break;

        case OP_CHECKSIG:
        case OP_CHECKSIGVERIFY:
        {
            // (sig pubkey -- bool)
            if (stack.size() < 2)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);

            const valtype& vchSig    = stacktop(-2);
            const valtype& vchPubKey = stacktop(-1);

            bool fSuccess = !vchSig.empty() && checker.CheckSig(vchSig, vchPubKey);
            if (!fSuccess && (flags & SCRIPT_VERIFY_NULLFAIL) && vchSig.size())
                return set_error(serror, SCRIPT_ERR_SIG_NULLFAIL);
            if (fSuccess) {
                Record(env, SatisfiedConstraint{SatisfiedConstraint::Kind::SIGNATURE, vchPubKey, OP_INVALIDOPCODE, 0});
            }

            popstack(stack);
            popstack(stack);
            pushstack(stack, fSuccess ? vchTrue : vchFalse);
            if (opcode == OP_CHECKSIGVERIFY)
            {
                if (!fSuccess)
                    return set_error(serror, SCRIPT_ERR_CHECKSIGVERIFY);
                popstack(stack);
            }
        }
        break;

        case OP_CHECKMULTISIG:
        case OP_CHECKMULTISIGVERIFY:
        {
            // ([sig ...] num_of_signatures [pubkey ...] num_of_pubkeys -- bool)

            int i = 1;
            if ((int)stack.size() < i)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);

            int nKeysCount = ScriptNum(stacktop(-i), fRequireMinimal).getint();
            if (nKeysCount < 0 || nKeysCount > MAX_PUBKEYS_PER_MULTISIG)
                return set_error(serror, SCRIPT_ERR_PUBKEY_COUNT);
            nOpCount += nKeysCount;
            if (nOpCount > MAX_OPS_PER_SCRIPT)
                return set_error(serror, SCRIPT_ERR_OP_COUNT);
            int ikey = ++i;
            // ikey2 is the position of last non-signature item in the stack. Top stack item = 1.
            int ikey2 = nKeysCount + 2;
            i += nKeysCount;
            if ((int)stack.size() < i)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);

            int nSigsCount = ScriptNum(stacktop(-i), fRequireMinimal).getint();
            if (nSigsCount < 0 || nSigsCount > nKeysCount)
                return set_error(serror, SCRIPT_ERR_SIG_COUNT);
            int isig = ++i;
            i += nSigsCount;
            if ((int)stack.size() < i)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);

            // Signatures are matched against keys from the top down, so the
            // topmost signature belongs to the last key it can match.
            std::vector<valtype> matched;
            bool fSuccess = true;
            while (fSuccess && nSigsCount > 0)
            {
                const valtype& vchSig    = stacktop(-isig);
                const valtype& vchPubKey = stacktop(-ikey);

                if (!vchSig.empty() && checker.CheckSig(vchSig, vchPubKey)) {
                    matched.push_back(vchPubKey);
                    isig++;
                    nSigsCount--;
                }
                ikey++;
                nKeysCount--;

                // More signatures left than keys: too many have failed.
                if (nSigsCount > nKeysCount)
                    fSuccess = false;
            }
            msc_verify_logf("\t\t<> multisig loop ended in %s state\n", fSuccess ? "successful" : "failure");

            // Clean up stack of actual arguments
            while (i-- > 1) {
                // If the operation failed, all signatures must be empty
                if (!fSuccess && (flags & SCRIPT_VERIFY_NULLFAIL) && !ikey2 && stacktop(-1).size())
                    return set_error(serror, SCRIPT_ERR_SIG_NULLFAIL);
                if (ikey2 > 0)
                    ikey2--;
                popstack(stack);
            }

            // CHECKMULTISIG consumes one extra, unchecked argument.
            if (stack.size() < 1)
                return set_error(serror, SCRIPT_ERR_INVALID_STACK_OPERATION);
            if ((flags & SCRIPT_VERIFY_NULLDUMMY) && stacktop(-1).size())
                return set_error(serror, SCRIPT_ERR_SIG_NULLDUMMY);
            popstack(stack);

            if (fSuccess) {
                for (const valtype& key : matched) {
                    Record(env, SatisfiedConstraint{SatisfiedConstraint::Kind::SIGNATURE, key, OP_INVALIDOPCODE, 0});
                }
            }
            pushstack(stack, fSuccess ? vchTrue : vchFalse);

            if (opcode == OP_CHECKMULTISIGVERIFY)
            {
                if (!fSuccess)
                    return set_error(serror, SCRIPT_ERR_CHECKMULTISIGVERIFY);
                popstack(stack);
            }
        }
        break;

        default:
            return set_error(serror, SCRIPT_ERR_BAD_OPCODE);
    }

    if (fExec) env.prev_opcode = opcode;

    // Size limits
    if (stack.size() + altstack.size() > MAX_STACK_SIZE)
        return set_error(serror, SCRIPT_ERR_STACK_SIZE);

    return true;
}

bool EvalScript(std::vector<valtype>& stack, const Script& script, unsigned int flags, const BaseSignatureChecker& checker, ScriptError* serror, std::vector<SatisfiedConstraint>* trace)
{
    set_error(serror, SCRIPT_ERR_UNKNOWN_ERROR);
    if (script.size() > MAX_SCRIPT_SIZE)
        return set_error(serror, SCRIPT_ERR_SCRIPT_SIZE);

    ScriptExecutionEnvironment env(stack, script, flags, checker, serror, trace);
    Script::const_iterator pc = script.begin();
    try {
        while (pc < env.pend) {
            if (!StepScript(env, pc)) {
                return false;
            }
        }
    } catch (const scriptnum_error& e) {
        msc_verify_logf("\t\t<> %s\n", e.what());
        return set_error(serror, SCRIPT_ERR_UNKNOWN_NUMBER);
    }

    if (!env.vfExec.empty())
        return set_error(serror, SCRIPT_ERR_UNBALANCED_CONDITIONAL);

    return set_success(serror);
}

bool VerifyWitness(const std::vector<valtype>& witness, const Script& script, unsigned int flags, const BaseSignatureChecker& checker, ScriptError* serror, std::vector<SatisfiedConstraint>* trace)
{
    for (const valtype& elem : witness) {
        if (elem.size() > MAX_SCRIPT_ELEMENT_SIZE) return set_error(serror, SCRIPT_ERR_PUSH_SIZE);
    }
    std::vector<valtype> stack(witness);
    if (!EvalScript(stack, script, flags, checker, serror, trace)) {
        return false;
    }
    if (stack.empty() || !CastToBool(stack.back()))
        return set_error(serror, SCRIPT_ERR_EVAL_FALSE);
    if ((flags & SCRIPT_VERIFY_CLEANSTACK) && stack.size() != 1)
        return set_error(serror, SCRIPT_ERR_CLEANSTACK);
    return set_success(serror);
}

} // namespace msc
