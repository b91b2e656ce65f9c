// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <logging.h>

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

void msc_logf_dummy(const char* fmt...) {}
void msc_logf_stderr(const char* fmt...) {
    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
}
msc_logf_t msc_logf = msc_logf_stderr;
msc_logf_t msc_compile_logf = msc_logf_dummy;
msc_logf_t msc_decode_logf = msc_logf_dummy;
msc_logf_t msc_satisfy_logf = msc_logf_dummy;
msc_logf_t msc_verify_logf = msc_logf_dummy;

static const struct {
    const char* name;
    const char* env;
    msc_logf_t* logger;
} CATEGORIES[] = {
    {"compile", "DEBUG_COMPILE", &msc_compile_logf},
    {"decode", "DEBUG_DECODE", &msc_decode_logf},
    {"satisfy", "DEBUG_SATISFY", &msc_satisfy_logf},
    {"verify", "DEBUG_VERIFY", &msc_verify_logf},
};

bool msc_enable_category(const std::string& name) {
    for (const auto& cat : CATEGORIES) {
        if (name == cat.name) {
            *cat.logger = msc_logf_stderr;
            return true;
        }
    }
    return false;
}

void msc_enable_categories_from_env() {
    for (const auto& cat : CATEGORIES) {
        if (std::getenv(cat.env)) *cat.logger = msc_logf_stderr;
    }
}
