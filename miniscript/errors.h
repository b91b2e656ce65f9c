// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_miniscript_errors_h_
#define included_msc_miniscript_errors_h_

#include <cstddef>
#include <stdexcept>
#include <string>

#include <tinyformat.h>

namespace msc {

/** A fragment composition violates the typing rules. */
class type_error : public std::runtime_error {
public:
    type_error(const std::string& reason, const std::string& node)
    : std::runtime_error(strprintf("type error: %s in %s", reason, node))
    , m_reason(reason)
    , m_node(node)
    {}
    const std::string& reason() const { return m_reason; }
    const std::string& node() const { return m_node; }
private:
    std::string m_reason;
    std::string m_node;
};

/** Script bytes that are not the canonical encoding of any well-typed fragment. */
class decode_error : public std::runtime_error {
public:
    decode_error(const std::string& reason, size_t offset)
    : std::runtime_error(strprintf("decode error at offset %u: %s", offset, reason))
    , m_reason(reason)
    , m_offset(offset)
    {}
    const std::string& reason() const { return m_reason; }
    size_t offset() const { return m_offset; }
private:
    std::string m_reason;
    size_t m_offset;
};

/** No fragment satisfying the root requirements exists for a policy. */
class compile_error : public std::runtime_error {
public:
    compile_error(const std::string& reason, const std::string& policy)
    : std::runtime_error(strprintf("compile error: %s (policy %s)", reason, policy))
    , m_reason(reason)
    , m_policy(policy)
    {}
    const std::string& reason() const { return m_reason; }
    const std::string& policy() const { return m_policy; }
private:
    std::string m_reason;
    std::string m_policy;
};

/** Malformed policy or fragment text; [begin, end) is the offending span. */
class parse_error : public std::runtime_error {
public:
    parse_error(const std::string& message, size_t begin, size_t end)
    : std::runtime_error(strprintf("%s (at %u..%u)", message, begin, end))
    , m_begin(begin)
    , m_end(end)
    {}
    size_t begin() const { return m_begin; }
    size_t end() const { return m_end; }
private:
    size_t m_begin;
    size_t m_end;
};

} // namespace msc

#endif // included_msc_miniscript_errors_h_
