// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <miniscript/tree.h>

#include <ansi-colors.h>

#include <tinyformat.h>

namespace msc {

namespace {

//! Column the availability markers are aligned to.
const size_t MARKER_COLUMN = 40;

bool IsWrapper(NodeType nt) {
    switch (nt) {
    case NodeType::WRAP_A:
    case NodeType::WRAP_S:
    case NodeType::WRAP_C:
    case NodeType::WRAP_D:
    case NodeType::WRAP_V:
    case NodeType::WRAP_J:
    case NodeType::WRAP_N:
        return true;
    default:
        return false;
    }
}

const char* AvailString(Availability avail) {
    return avail == Availability::YES ? "yes" : "no";
}

struct TreeStringEmitter {
    const KeyContext& m_ctx;
    const SatisfactionReport* m_report;
    bool m_color;
    std::string m_str;
    std::string m_ind;

    TreeStringEmitter(const KeyContext& ctx, const SatisfactionReport* report, bool color) : m_ctx(ctx), m_report(report), m_color(color) {}

    void line(const std::string& value, const Node* node);
    void emit(const Node& node);
};

void TreeStringEmitter::line(const std::string& value, const Node* node) {
    std::string text = m_ind + value;
    const std::pair<Availability, Availability>* avail = nullptr;
    if (node && m_report) {
        auto it = m_report->find(node);
        if (it != m_report->end()) avail = &it->second;
    }
    if (!avail) {
        m_str += text + "\n";
        return;
    }
    const Availability dsat = avail->first;
    const Availability sat = avail->second;
    text += std::string(text.size() < MARKER_COLUMN ? MARKER_COLUMN - text.size() : 1, ' ');
    text += strprintf("sat:%s dsat:%s", AvailString(sat), AvailString(dsat));
    if (m_color) {
        text = (sat == Availability::YES ? ansi::fg_green : ansi::fg_red) + ansi::bold + text + ansi::reset;
    }
    m_str += text + "\n";
}

void TreeStringEmitter::emit(const Node& node) {
    // a chain of wrappers shares the line of the node it wraps
    std::string prefix;
    const Node* inner = &node;
    while (IsWrapper(inner->nodetype)) {
        prefix += NodeTypeName(inner->nodetype);
        inner = inner->subs[0].get();
    }
    if (!prefix.empty()) prefix += ":";

    if (inner->subs.empty()) {
        line(prefix + inner->ToString(m_ctx), &node);
        return;
    }
    std::string open = prefix + NodeTypeName(inner->nodetype) + "(";
    if (inner->nodetype == NodeType::THRESH) open += strprintf("%u,", inner->k);
    line(open, &node);
    m_ind += "  ";
    for (const auto& sub : inner->subs) {
        emit(*sub);
    }
    m_ind.resize(m_ind.size() - 2);
    line(")", nullptr);
}

} // namespace

std::string TreeString(const Node& node, const KeyContext& ctx, const SatisfactionReport* report, bool color)
{
    TreeStringEmitter emitter(ctx, report, color);
    emitter.emit(node);
    return emitter.m_str;
}

} // namespace msc
