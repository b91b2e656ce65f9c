// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_script_interpreter_h_
#define included_msc_script_interpreter_h_

#include <script/script.h>
#include <script/script_error.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace msc {

/** Script verification flags. */
enum
{
    SCRIPT_VERIFY_NONE      = 0,

    // Require minimal encodings for all push operations and for every
    // stack element interpreted as a number.
    SCRIPT_VERIFY_MINIMALDATA = (1U << 0),

    // The dummy stack item consumed by CHECKMULTISIG must be empty.
    SCRIPT_VERIFY_NULLDUMMY = (1U << 1),

    // The argument of OP_IF/NOTIF must be exactly 0x01 or empty.
    SCRIPT_VERIFY_MINIMALIF = (1U << 2),

    // Signature(s) must be empty if a CHECK(MULTI)SIG operation failed.
    SCRIPT_VERIFY_NULLFAIL = (1U << 3),

    // Exactly one (true) stack element must remain after evaluation.
    SCRIPT_VERIFY_CLEANSTACK = (1U << 4),
};

/** The P2WSH standardness rules. */
static const unsigned int STANDARD_SCRIPT_VERIFY_FLAGS = SCRIPT_VERIFY_MINIMALDATA |
                                                         SCRIPT_VERIFY_NULLDUMMY |
                                                         SCRIPT_VERIFY_MINIMALIF |
                                                         SCRIPT_VERIFY_NULLFAIL |
                                                         SCRIPT_VERIFY_CLEANSTACK;

bool CastToBool(const valtype& vch);

/** Whether opcode is one the fragment encoder can emit. Everything else fails evaluation. */
bool IsSupportedOpcode(opcodetype opcode);

class BaseSignatureChecker
{
public:
    virtual bool CheckSig(const valtype& sig, const valtype& pubkey) const
    {
        return false;
    }

    virtual bool CheckLockTime(const ScriptNum& nLockTime) const
    {
        return false;
    }

    virtual bool CheckSequence(const ScriptNum& nSequence) const
    {
        return false;
    }

    virtual ~BaseSignatureChecker() {}
};

/** A constraint the witness was shown to fulfil during evaluation. */
struct SatisfiedConstraint {
    enum class Kind {
        SIGNATURE,         //!< data = public key
        HASHLOCK,          //!< data = digest, hash_op = the hash opcode
        RELATIVE_TIMELOCK, //!< value = sequence
        ABSOLUTE_TIMELOCK, //!< value = locktime
    };
    Kind kind;
    valtype data;
    opcodetype hash_op{OP_INVALIDOPCODE};
    int64_t value{0};

    std::string ToString() const;
    bool operator==(const SatisfiedConstraint& other) const
    {
        return kind == other.kind && data == other.data && hash_op == other.hash_op && value == other.value;
    }
};

/**
 * The stack of IF/ELSE/ENDIF execution states, reduced to its size and the
 * position of the first false entry.
 */
class ConditionStack {
private:
    static constexpr uint32_t NO_FALSE = std::numeric_limits<uint32_t>::max();

    uint32_t m_stack_size = 0;
    uint32_t m_first_false_pos = NO_FALSE;

public:
    bool empty() const { return m_stack_size == 0; }
    bool all_true() const { return m_first_false_pos == NO_FALSE; }
    void push_back(bool f)
    {
        if (m_first_false_pos == NO_FALSE && !f) m_first_false_pos = m_stack_size;
        ++m_stack_size;
    }
    void pop_back()
    {
        if (m_stack_size == 0) throw std::logic_error("ConditionStack::pop_back on empty stack");
        --m_stack_size;
        if (m_first_false_pos == m_stack_size) m_first_false_pos = NO_FALSE;
    }
    void toggle_top()
    {
        if (m_stack_size == 0) throw std::logic_error("ConditionStack::toggle_top on empty stack");
        if (m_first_false_pos == NO_FALSE) {
            m_first_false_pos = m_stack_size - 1;
        } else if (m_first_false_pos == m_stack_size - 1) {
            m_first_false_pos = NO_FALSE;
        }
    }
};

struct ScriptExecutionEnvironment {
    const Script& script;
    Script::const_iterator pend;
    opcodetype opcode;
    opcodetype prev_opcode;
    valtype vchPushValue;
    ConditionStack vfExec;
    std::vector<valtype> altstack;
    int nOpCount;
    bool fRequireMinimal;
    std::vector<valtype>& stack;
    unsigned int flags;
    const BaseSignatureChecker& checker;
    ScriptError* serror;
    std::vector<SatisfiedConstraint>* trace;
    //! Hash opcode whose output awaits comparison against a digest (OP_INVALIDOPCODE if none).
    opcodetype pending_hashlock;
    ScriptExecutionEnvironment(std::vector<valtype>& stack_in, const Script& script_in, unsigned int flags_in, const BaseSignatureChecker& checker_in, ScriptError* serror_in, std::vector<SatisfiedConstraint>* trace_in);
};

/** Execute the opcode at pc. */
bool StepScript(ScriptExecutionEnvironment& env, Script::const_iterator& pc);

bool EvalScript(std::vector<valtype>& stack, const Script& script, unsigned int flags, const BaseSignatureChecker& checker, ScriptError* error = nullptr, std::vector<SatisfiedConstraint>* trace = nullptr);

/**
 * Evaluate script over the witness stack (bottom first) and apply the
 * final stack rules. Succeeds iff the witness spends the script.
 */
bool VerifyWitness(const std::vector<valtype>& witness, const Script& script, unsigned int flags, const BaseSignatureChecker& checker, ScriptError* serror = nullptr, std::vector<SatisfiedConstraint>* trace = nullptr);

} // namespace msc

#endif // included_msc_script_interpreter_h_
