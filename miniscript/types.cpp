// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <miniscript/types.h>

#include <script/script.h>

#include <tinyformat.h>

namespace msc {

static const char TYPE_LETTERS[] = "BVKWzondufesmxghijk";

std::string NodeTypeName(NodeType nodetype)
{
    switch (nodetype) {
        case NodeType::JUST_0: return "0";
        case NodeType::JUST_1: return "1";
        case NodeType::PK_K: return "pk_k";
        case NodeType::PK_H: return "pk_h";
        case NodeType::OLDER: return "older";
        case NodeType::AFTER: return "after";
        case NodeType::SHA256: return "sha256";
        case NodeType::HASH256: return "hash256";
        case NodeType::RIPEMD160: return "ripemd160";
        case NodeType::HASH160: return "hash160";
        case NodeType::WRAP_A: return "a";
        case NodeType::WRAP_S: return "s";
        case NodeType::WRAP_C: return "c";
        case NodeType::WRAP_D: return "d";
        case NodeType::WRAP_V: return "v";
        case NodeType::WRAP_J: return "j";
        case NodeType::WRAP_N: return "n";
        case NodeType::AND_V: return "and_v";
        case NodeType::AND_B: return "and_b";
        case NodeType::ANDOR: return "andor";
        case NodeType::OR_B: return "or_b";
        case NodeType::OR_C: return "or_c";
        case NodeType::OR_D: return "or_d";
        case NodeType::OR_I: return "or_i";
        case NodeType::THRESH: return "thresh";
        case NodeType::MULTI: return "multi";
    }
    throw std::logic_error("unhandled node type");
}

std::string Type::ToString() const
{
    std::string ret;
    for (const char* p = TYPE_LETTERS; *p; ++p) {
        if (m_flags & TypeFlag(*p)) ret += *p;
    }
    return ret;
}

bool ParseType(const std::string& str, Type& out)
{
    out = ""_mst;
    for (char c : str) {
        bool found = false;
        for (const char* p = TYPE_LETTERS; *p; ++p) {
            if (*p == c) found = true;
        }
        if (!found) return false;
        out = out | Type::Make(TypeFlag(c));
    }
    return true;
}

Type SanitizeType(Type e)
{
    int num_types = (e << "K"_mst) + (e << "V"_mst) + (e << "B"_mst) + (e << "W"_mst);
    if (num_types == 0) return ""_mst; // No valid type, don't care about the rest
    bool ok =
        num_types == 1 &&                       // K, V, B, W all conflict with each other
        (!(e << "z"_mst) || !(e << "o"_mst)) && // z conflicts with o
        (!(e << "n"_mst) || !(e << "z"_mst)) && // n conflicts with z
        (!(e << "n"_mst) || !(e << "W"_mst)) && // n conflicts with W
        (!(e << "V"_mst) || !(e << "d"_mst)) && // V conflicts with d
        (!(e << "K"_mst) ||  (e << "u"_mst)) && // K implies u
        (!(e << "V"_mst) || !(e << "u"_mst)) && // V conflicts with u
        (!(e << "e"_mst) || !(e << "f"_mst)) && // e conflicts with f
        (!(e << "e"_mst) ||  (e << "d"_mst)) && // e implies d
        (!(e << "V"_mst) || !(e << "e"_mst)) && // V conflicts with e
        (!(e << "d"_mst) || !(e << "f"_mst)) && // d conflicts with f
        (!(e << "V"_mst) ||  (e << "f"_mst)) && // V implies f
        (!(e << "K"_mst) ||  (e << "s"_mst)) && // K implies s
        (!(e << "z"_mst) ||  (e << "m"_mst));   // z implies m
    if (!ok) throw std::logic_error(strprintf("inconsistent type %s", e.ToString()));
    return e;
}

/** Whether combining two sub-expressions that are both needed would mix timelock kinds. */
static bool MixesTimelocks(Type x, Type y)
{
    return ((x << "g"_mst) && (y << "h"_mst)) ||
           ((x << "h"_mst) && (y << "g"_mst)) ||
           ((x << "i"_mst) && (y << "j"_mst)) ||
           ((x << "j"_mst) && (y << "i"_mst));
}

Type ComputeType(NodeType nodetype, Type x, Type y, Type z, const std::vector<Type>& sub_types, uint32_t k, size_t n_subs, size_t n_keys)
{
    // Below is the per-nodetype logic for computing the expression types.
    // It heavily relies on Type's << operator (where "X << a_mst" means
    // "X has all properties listed in a").
    switch (nodetype) {
        case NodeType::PK_K: return "Konudemsxk"_mst;
        case NodeType::PK_H: return "Knudemsxk"_mst;
        case NodeType::OLDER: return
            "g"_mst.If(k & SEQUENCE_LOCKTIME_TYPE_FLAG) |
            "h"_mst.If(!(k & SEQUENCE_LOCKTIME_TYPE_FLAG)) |
            "Bzfmxk"_mst;
        case NodeType::AFTER: return
            "i"_mst.If(k >= LOCKTIME_THRESHOLD) |
            "j"_mst.If(k < LOCKTIME_THRESHOLD) |
            "Bzfmxk"_mst;
        case NodeType::SHA256: return "Bonudmk"_mst;
        case NodeType::RIPEMD160: return "Bonudmk"_mst;
        case NodeType::HASH256: return "Bonudmk"_mst;
        case NodeType::HASH160: return "Bonudmk"_mst;
        case NodeType::JUST_1: return "Bzufmxk"_mst;
        case NodeType::JUST_0: return "Bzudemsxk"_mst;
        case NodeType::WRAP_A: return
            "W"_mst.If(x << "B"_mst) | // W=B_x
            (x & "ghijk"_mst) | // g=g_x, h=h_x, i=i_x, j=j_x, k=k_x
            (x & "udfems"_mst) | // u=u_x, d=d_x, f=f_x, e=e_x, m=m_x, s=s_x
            "x"_mst; // x
        case NodeType::WRAP_S: return
            "W"_mst.If(x << "Bo"_mst) | // W=B_x*o_x
            (x & "ghijk"_mst) |
            (x & "udfemsx"_mst); // u=u_x, d=d_x, f=f_x, e=e_x, m=m_x, s=s_x, x=x_x
        case NodeType::WRAP_C: return
            "B"_mst.If(x << "K"_mst) | // B=K_x
            (x & "ghijk"_mst) |
            (x & "ondfem"_mst) | // o=o_x, n=n_x, d=d_x, f=f_x, e=e_x, m=m_x
            "us"_mst; // u, s
        case NodeType::WRAP_D: return
            "B"_mst.If(x << "Vz"_mst) | // B=V_x*z_x
            "o"_mst.If(x << "z"_mst) | // o=z_x
            "e"_mst.If(x << "f"_mst) | // e=f_x
            (x & "ghijk"_mst) |
            (x & "ms"_mst) | // m=m_x, s=s_x
            "nudx"_mst; // n, u (MINIMALIF), d, x
        case NodeType::WRAP_V: return
            "V"_mst.If(x << "B"_mst) | // V=B_x
            (x & "ghijk"_mst) |
            (x & "zonms"_mst) | // z=z_x, o=o_x, n=n_x, m=m_x, s=s_x
            "fx"_mst; // f, x
        case NodeType::WRAP_J: return
            "B"_mst.If(x << "Bn"_mst) | // B=B_x*n_x
            "e"_mst.If(x << "f"_mst) | // e=f_x
            (x & "ghijk"_mst) |
            (x & "oums"_mst) | // o=o_x, u=u_x, m=m_x, s=s_x
            "ndx"_mst; // n, d, x
        case NodeType::WRAP_N: return
            (x & "ghijk"_mst) |
            (x & "Bzondfems"_mst) | // B=B_x, z=z_x, o=o_x, n=n_x, d=d_x, f=f_x, e=e_x, m=m_x, s=s_x
            "ux"_mst; // u, x
        case NodeType::AND_V: return
            (y & "KVB"_mst).If(x << "V"_mst) | // B=V_x*B_y, V=V_x*V_y, K=V_x*K_y
            (x & "n"_mst) | (y & "n"_mst).If(x << "z"_mst) | // n=n_x+z_x*n_y
            ((x | y) & "o"_mst).If((x | y) << "z"_mst) | // o=o_x*z_y+z_x*o_y
            (x & y & "dmz"_mst) | // d=d_x*d_y, m=m_x*m_y, z=z_x*z_y
            ((x | y) & "s"_mst) | // s=s_x+s_y
            "f"_mst.If((y << "f"_mst) || (x << "s"_mst)) | // f=f_y+s_x
            (y & "ux"_mst) | // u=u_y, x=x_y
            ((x | y) & "ghij"_mst) | // g=g_x+g_y, h=h_x+h_y, i=i_x+i_y, j=j_x+j_y
            "k"_mst.If(((x & y) << "k"_mst) && !MixesTimelocks(x, y)); // k=k_x*k_y*!(g_x*h_y+h_x*g_y+i_x*j_y+j_x*i_y)
        case NodeType::AND_B: return
            (x & "B"_mst).If(y << "W"_mst) | // B=B_x*W_y
            ((x | y) & "o"_mst).If((x | y) << "z"_mst) | // o=o_x*z_y+z_x*o_y
            (x & "n"_mst) | (y & "n"_mst).If(x << "z"_mst) | // n=n_x+z_x*n_y
            (x & y & "e"_mst).If((x & y) << "s"_mst) | // e=e_x*e_y*s_x*s_y
            (x & y & "dzm"_mst) | // d=d_x*d_y, z=z_x*z_y, m=m_x*m_y
            "f"_mst.If(((x & y) << "f"_mst) || (x << "sf"_mst) || (y << "sf"_mst)) | // f=f_x*f_y+f_x*s_x+f_y*s_y
            ((x | y) & "s"_mst) | // s=s_x+s_y
            "ux"_mst | // u, x
            ((x | y) & "ghij"_mst) |
            "k"_mst.If(((x & y) << "k"_mst) && !MixesTimelocks(x, y));
        case NodeType::OR_B: return
            "B"_mst.If(x << "Bd"_mst && y << "Wd"_mst) | // B=B_x*d_x*W_x*d_y
            ((x | y) & "o"_mst).If((x | y) << "z"_mst) | // o=o_x*z_y+z_x*o_y
            (x & y & "m"_mst).If((x | y) << "s"_mst && (x & y) << "e"_mst) | // m=m_x*m_y*e_x*e_y*(s_x+s_y)
            (x & y & "zse"_mst) | // z=z_x*z_y, s=s_x*s_y, e=e_x*e_y
            "dux"_mst | // d, u, x
            ((x | y) & "ghij"_mst) |
            (x & y & "k"_mst); // k=k_x*k_y
        case NodeType::OR_D: return
            (y & "B"_mst).If(x << "Bdu"_mst) | // B=B_y*B_x*d_x*u_x
            (x & "o"_mst).If(y << "z"_mst) | // o=o_x*z_y
            (x & y & "m"_mst).If(x << "e"_mst && (x | y) << "s"_mst) | // m=m_x*m_y*e_x*(s_x+s_y)
            (x & y & "zes"_mst) | // z=z_x*z_y, e=e_x*e_y, s=s_x*s_y
            (y & "ufd"_mst) | // u=u_y, f=f_y, d=d_y
            "x"_mst | // x
            ((x | y) & "ghij"_mst) |
            (x & y & "k"_mst);
        case NodeType::OR_C: return
            (y & "V"_mst).If(x << "Bdu"_mst) | // V=V_y*B_x*u_x*d_x
            (x & "o"_mst).If(y << "z"_mst) | // o=o_x*z_y
            (x & y & "m"_mst).If(x << "e"_mst && (x | y) << "s"_mst) | // m=m_x*m_y*e_x*(s_x+s_y)
            (x & y & "zs"_mst) | // z=z_x*z_y, s=s_x*s_y
            "fx"_mst | // f, x
            ((x | y) & "ghij"_mst) |
            (x & y & "k"_mst);
        case NodeType::OR_I: return
            (x & y & "VBKufs"_mst) | // V=V_x*V_y, B=B_x*B_y, K=K_x*K_y, u=u_x*u_y, f=f_x*f_y, s=s_x*s_y
            "o"_mst.If((x & y) << "z"_mst) | // o=z_x*z_y
            ((x | y) & "e"_mst).If((x | y) << "f"_mst) | // e=e_x*f_y+f_x*e_y
            (x & y & "m"_mst).If((x | y) << "s"_mst) | // m=m_x*m_y*(s_x+s_y)
            ((x | y) & "d"_mst) | // d=d_x+d_y
            "x"_mst | // x
            ((x | y) & "ghij"_mst) |
            (x & y & "k"_mst);
        case NodeType::ANDOR: return
            (y & z & "BKV"_mst).If(x << "Bdu"_mst) | // B=B_x*d_x*u_x*B_y*B_z, K=B_x*d_x*u_x*K_y*K_z, V=B_x*d_x*u_x*V_y*V_z
            (x & y & z & "z"_mst) | // z=z_x*z_y*z_z
            ((x | (y & z)) & "o"_mst).If((x | (y & z)) << "z"_mst) | // o=o_x*z_y*z_z+z_x*o_y*o_z
            (y & z & "u"_mst) | // u=u_y*u_z
            (z & "f"_mst).If((x << "s"_mst) || (y << "f"_mst)) | // f=(s_x+f_y)*f_z
            (z & "d"_mst) | // d=d_z
            (z & "e"_mst).If(x << "e"_mst && ((x << "s"_mst) || (y << "f"_mst))) | // e=e_x*e_z*(s_x+f_y)
            (x & y & z & "m"_mst).If(x << "e"_mst && (x | y | z) << "s"_mst) | // m=m_x*m_y*m_z*e_x*(s_x+s_y+s_z)
            (z & (x | y) & "s"_mst) | // s=s_z*(s_x+s_y)
            "x"_mst | // x
            ((x | y | z) & "ghij"_mst) |
            "k"_mst.If(((x & y & z) << "k"_mst) && !MixesTimelocks(x, y)); // k=k_x*k_y*k_z*!(mix of x and y)
        case NodeType::MULTI: return "Bnudemsk"_mst;
        case NodeType::THRESH: {
            bool all_e = true;
            bool all_m = true;
            uint32_t args = 0;
            uint32_t num_s = 0;
            Type acc_tl = "k"_mst;
            for (size_t i = 0; i < sub_types.size(); ++i) {
                Type t = sub_types[i];
                if (!(t << (i ? "Wdu"_mst : "Bdu"_mst))) return ""_mst; // Require Bdu, Wdu, Wdu, ...
                if (!(t << "e"_mst)) all_e = false;
                if (!(t << "m"_mst)) all_m = false;
                if (t << "s"_mst) num_s += 1;
                args += (t << "z"_mst) ? 0 : (t << "o"_mst) ? 1 : 2;
                // With k > 1 two children with different timelock kinds may both be needed.
                acc_tl = ((acc_tl | t) & "ghij"_mst) |
                    "k"_mst.If(((acc_tl & t) << "k"_mst) && (k <= 1 || !MixesTimelocks(acc_tl, t)));
            }
            return "Bdu"_mst |
                   "z"_mst.If(args == 0) | // z=all z
                   "o"_mst.If(args == 1) | // o=all z except one o
                   "e"_mst.If(all_e && num_s == n_subs) | // e=all e and all s
                   "m"_mst.If(all_e && all_m && num_s >= n_subs - k) | // m=all e, >=(n-k) s
                   "s"_mst.If(num_s >= n_subs - k + 1) | // s= >=(n-k+1) s
                   acc_tl; // timelock info
        }
    }
    throw std::logic_error("ComputeType: unhandled node type");
}

std::string TypeRequirement(NodeType nodetype, const std::vector<Type>& sub_types)
{
    auto need = [&](size_t i, Type t, const char* what) -> std::string {
        if (i < sub_types.size() && !(sub_types[i] << t)) return strprintf("argument %d must be %s (is %s)", i + 1, what, sub_types[i].ToString());
        return "";
    };
    auto same_basic = [&](size_t i, size_t j) -> std::string {
        for (Type t : {"B"_mst, "K"_mst, "V"_mst}) {
            if ((sub_types[i] << t) && (sub_types[j] << t)) return "";
        }
        return strprintf("arguments %d and %d must share basic type B, K or V (are %s and %s)", i + 1, j + 1, sub_types[i].ToString(), sub_types[j].ToString());
    };
    std::string r;
    switch (nodetype) {
        case NodeType::WRAP_A: return need(0, "B"_mst, "B");
        case NodeType::WRAP_S: return need(0, "Bo"_mst, "Bo");
        case NodeType::WRAP_C: return need(0, "K"_mst, "K");
        case NodeType::WRAP_D: return need(0, "Vz"_mst, "Vz");
        case NodeType::WRAP_V: return need(0, "B"_mst, "B");
        case NodeType::WRAP_J: return need(0, "Bn"_mst, "Bn");
        case NodeType::WRAP_N: return need(0, "B"_mst, "B");
        case NodeType::AND_V:
            if (!(r = need(0, "V"_mst, "V")).empty()) return r;
            if (!(sub_types[1] << "B"_mst) && !(sub_types[1] << "K"_mst) && !(sub_types[1] << "V"_mst)) {
                return strprintf("argument 2 must be B, K or V (is %s)", sub_types[1].ToString());
            }
            return "";
        case NodeType::AND_B:
            if (!(r = need(0, "B"_mst, "B")).empty()) return r;
            return need(1, "W"_mst, "W");
        case NodeType::OR_B:
            if (!(r = need(0, "Bd"_mst, "Bd")).empty()) return r;
            return need(1, "Wd"_mst, "Wd");
        case NodeType::OR_C:
            if (!(r = need(0, "Bdu"_mst, "Bdu")).empty()) return r;
            return need(1, "V"_mst, "V");
        case NodeType::OR_D:
            if (!(r = need(0, "Bdu"_mst, "Bdu")).empty()) return r;
            return need(1, "B"_mst, "B");
        case NodeType::OR_I:
            return same_basic(0, 1);
        case NodeType::ANDOR:
            if (!(r = need(0, "Bdu"_mst, "Bdu")).empty()) return r;
            return same_basic(1, 2);
        case NodeType::THRESH:
            if (!(r = need(0, "Bdu"_mst, "Bdu")).empty()) return r;
            for (size_t i = 1; i < sub_types.size(); ++i) {
                if (!(r = need(i, "Wdu"_mst, "Wdu")).empty()) return r;
            }
            return "";
        default:
            return "";
    }
}

size_t ComputeScriptLen(NodeType nodetype, Type sub0typ, size_t subsize, uint32_t k, size_t n_subs, size_t n_keys)
{
    switch (nodetype) {
        case NodeType::JUST_1:
        case NodeType::JUST_0: return 1;
        case NodeType::PK_K: return 34;
        case NodeType::PK_H: return 3 + 21;
        case NodeType::OLDER:
        case NodeType::AFTER: return 1 + (Script() << (int64_t)k).size();
        case NodeType::HASH256:
        case NodeType::SHA256: return 4 + 2 + 33;
        case NodeType::HASH160:
        case NodeType::RIPEMD160: return 4 + 2 + 21;
        case NodeType::MULTI: return 1 + (Script() << (int64_t)n_keys).size() + (Script() << (int64_t)k).size() + 34 * n_keys;
        case NodeType::AND_V: return subsize;
        case NodeType::WRAP_V: return subsize + (sub0typ << "x"_mst);
        case NodeType::WRAP_S:
        case NodeType::WRAP_C:
        case NodeType::WRAP_N:
        case NodeType::AND_B:
        case NodeType::OR_B: return subsize + 1;
        case NodeType::WRAP_A:
        case NodeType::OR_C: return subsize + 2;
        case NodeType::WRAP_D:
        case NodeType::OR_D:
        case NodeType::OR_I:
        case NodeType::ANDOR: return subsize + 3;
        case NodeType::WRAP_J: return subsize + 4;
        case NodeType::THRESH: return subsize + n_subs + (Script() << (int64_t)k).size();
    }
    throw std::logic_error("ComputeScriptLen: unhandled node type");
}

Ops ComputeOps(NodeType nodetype, Type sub0typ, const std::vector<Ops>& sub_ops, uint32_t k, size_t n_keys)
{
    switch (nodetype) {
        case NodeType::JUST_1: return {0, 0, {}};
        case NodeType::JUST_0: return {0, {}, 0};
        case NodeType::PK_K: return {0, 0, 0};
        case NodeType::PK_H: return {3, 0, 0};
        case NodeType::OLDER:
        case NodeType::AFTER: return {1, 0, {}};
        case NodeType::SHA256:
        case NodeType::RIPEMD160:
        case NodeType::HASH256:
        case NodeType::HASH160: return {4, 0, {}};
        case NodeType::AND_V: return {sub_ops[0].count + sub_ops[1].count, sub_ops[0].sat + sub_ops[1].sat, {}};
        case NodeType::AND_B: {
            const auto& x = sub_ops[0];
            const auto& y = sub_ops[1];
            return {1 + x.count + y.count, x.sat + y.sat, x.dsat + y.dsat};
        }
        case NodeType::OR_B: {
            const auto& x = sub_ops[0];
            const auto& y = sub_ops[1];
            return {1 + x.count + y.count, (x.sat + y.dsat) | (y.sat + x.dsat), x.dsat + y.dsat};
        }
        case NodeType::OR_D: {
            const auto& x = sub_ops[0];
            const auto& y = sub_ops[1];
            return {3 + x.count + y.count, x.sat | (y.sat + x.dsat), x.dsat + y.dsat};
        }
        case NodeType::OR_C: {
            const auto& x = sub_ops[0];
            const auto& y = sub_ops[1];
            return {2 + x.count + y.count, x.sat | (y.sat + x.dsat), {}};
        }
        case NodeType::OR_I: {
            const auto& x = sub_ops[0];
            const auto& y = sub_ops[1];
            return {3 + x.count + y.count, x.sat | y.sat, x.dsat | y.dsat};
        }
        case NodeType::ANDOR: {
            const auto& x = sub_ops[0];
            const auto& y = sub_ops[1];
            const auto& z = sub_ops[2];
            return {3 + x.count + y.count + z.count, (y.sat + x.sat) | (z.sat + x.dsat), z.dsat + x.dsat};
        }
        case NodeType::MULTI: return {1, (uint32_t)n_keys, (uint32_t)n_keys};
        case NodeType::WRAP_S:
        case NodeType::WRAP_C:
        case NodeType::WRAP_N: return {1 + sub_ops[0].count, sub_ops[0].sat, sub_ops[0].dsat};
        case NodeType::WRAP_A: return {2 + sub_ops[0].count, sub_ops[0].sat, sub_ops[0].dsat};
        case NodeType::WRAP_D: return {3 + sub_ops[0].count, sub_ops[0].sat, 0};
        case NodeType::WRAP_J: return {4 + sub_ops[0].count, sub_ops[0].sat, 0};
        case NodeType::WRAP_V: return {sub_ops[0].count + (sub0typ << "x"_mst), sub_ops[0].sat, {}};
        case NodeType::THRESH: {
            uint32_t count = 0;
            // sats[j] is the worst case for j satisfied children among those seen so far
            std::vector<MaxInt<uint32_t>> sats{MaxInt<uint32_t>(0)};
            for (const auto& sub : sub_ops) {
                count += sub.count + 1;
                std::vector<MaxInt<uint32_t>> next_sats{sats[0] + sub.dsat};
                for (size_t j = 1; j < sats.size(); ++j) next_sats.push_back((sats[j] + sub.dsat) | (sats[j - 1] + sub.sat));
                next_sats.push_back(sats[sats.size() - 1] + sub.sat);
                sats = std::move(next_sats);
            }
            if (k >= sats.size()) throw std::logic_error("thresh k exceeds number of children");
            return {count, sats[k], sats[0]};
        }
    }
    throw std::logic_error("ComputeOps: unhandled node type");
}

StackSize ComputeStackSize(NodeType nodetype, const std::vector<StackSize>& sub_ss, uint32_t k)
{
    switch (nodetype) {
        case NodeType::JUST_0: return {{}, 0};
        case NodeType::JUST_1:
        case NodeType::OLDER:
        case NodeType::AFTER: return {0, {}};
        case NodeType::PK_K: return {1, 1};
        case NodeType::PK_H: return {2, 2};
        case NodeType::SHA256:
        case NodeType::RIPEMD160:
        case NodeType::HASH256:
        case NodeType::HASH160: return {1, {}};
        case NodeType::ANDOR: {
            const auto& x = sub_ss[0];
            const auto& y = sub_ss[1];
            const auto& z = sub_ss[2];
            return {(x.sat + y.sat) | (x.dsat + z.sat), x.dsat + z.dsat};
        }
        case NodeType::AND_V: return {sub_ss[0].sat + sub_ss[1].sat, {}};
        case NodeType::AND_B: return {sub_ss[0].sat + sub_ss[1].sat, sub_ss[0].dsat + sub_ss[1].dsat};
        case NodeType::OR_B: {
            const auto& x = sub_ss[0];
            const auto& y = sub_ss[1];
            return {(x.dsat + y.sat) | (x.sat + y.dsat), x.dsat + y.dsat};
        }
        case NodeType::OR_C: return {sub_ss[0].sat | (sub_ss[0].dsat + sub_ss[1].sat), {}};
        case NodeType::OR_D: return {sub_ss[0].sat | (sub_ss[0].dsat + sub_ss[1].sat), sub_ss[0].dsat + sub_ss[1].dsat};
        case NodeType::OR_I: {
            const auto& x = sub_ss[0];
            const auto& y = sub_ss[1];
            return {(x.sat + 1) | (y.sat + 1), (x.dsat + 1) | (y.dsat + 1)};
        }
        case NodeType::MULTI: return {k + 1, k + 1};
        case NodeType::WRAP_A:
        case NodeType::WRAP_N:
        case NodeType::WRAP_S:
        case NodeType::WRAP_C: return sub_ss[0];
        case NodeType::WRAP_D: return {1 + sub_ss[0].sat, 1};
        case NodeType::WRAP_V: return {sub_ss[0].sat, {}};
        case NodeType::WRAP_J: return {sub_ss[0].sat, 1};
        case NodeType::THRESH: {
            std::vector<MaxInt<uint32_t>> sats{MaxInt<uint32_t>(0)};
            for (const auto& sub : sub_ss) {
                std::vector<MaxInt<uint32_t>> next_sats{sats[0] + sub.dsat};
                for (size_t j = 1; j < sats.size(); ++j) next_sats.push_back((sats[j] + sub.dsat) | (sats[j - 1] + sub.sat));
                next_sats.push_back(sats[sats.size() - 1] + sub.sat);
                sats = std::move(next_sats);
            }
            if (k >= sats.size()) throw std::logic_error("thresh k exceeds number of children");
            return {sats[k], sats[0]};
        }
    }
    throw std::logic_error("ComputeStackSize: unhandled node type");
}

} // namespace msc
