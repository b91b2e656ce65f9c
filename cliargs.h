// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_cliargs_h_
#define included_msc_cliargs_h_

#include <map>
#include <string>
#include <vector>

#include <getopt.h>

#include <tinyformat.h>

enum cliarg_type {
    no_arg = no_argument,
    req_arg = required_argument,
    opt_arg = optional_argument,
};

struct cliopt {
    std::string longname;
    char shortname;
    cliarg_type type;
    cliopt(const std::string& longname_in, const char shortname_in, cliarg_type type_in)
    : longname(longname_in)
    , shortname(shortname_in)
    , type(type_in)
    {}
    struct option get_option(std::string& opt) const {
        opt += strprintf("%c%s", shortname, type == no_arg ? "" : type == req_arg ? ":" : "::");
        return {longname.c_str(), type, nullptr, shortname};
    }
};

/**
 * getopt_long wrapper. After parse(), m maps the short name of every given
 * option to its argument ("1" for flags), and l holds the positional
 * arguments.
 */
struct cliargs {
    std::map<char, std::string> m;
    std::vector<const char*> l;
    std::vector<cliopt> long_options;

    void add_option(const std::string& longname, const char shortname, cliarg_type t) {
        long_options.emplace_back(longname, shortname, t);
    }
    /** Returns false if getopt reported an unknown option or a missing argument. */
    bool parse(int argc, char* const* argv) {
        std::vector<struct option> long_opts;
        std::string opt = "";
        for (const auto& o : long_options) {
            long_opts.push_back(o.get_option(opt));
        }
        long_opts.push_back({0,0,0,0});
        int c;
        int option_index = 0;
        for (;;) {
            c = getopt_long(argc, argv, opt.c_str(), long_opts.data(), &option_index);
            if (c == -1) {
                break;
            }
            if (c == '?' || c == ':') return false;
            if (optarg) {
                m[c] = optarg;
            } else {
                m[c] = "1";
            }
        }
        while (optind < argc) {
            l.push_back(argv[optind++]);
        }
        return true;
    }
};

#endif // included_msc_cliargs_h_
