// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_logging_h_
#define included_msc_logging_h_

#include <string>

typedef void (*msc_logf_t) (const char *fmt...);

/** General output; defaults to stderr. The category loggers default to msc_logf_dummy. */
extern msc_logf_t msc_logf, msc_compile_logf, msc_decode_logf, msc_satisfy_logf, msc_verify_logf;

void msc_logf_dummy(const char* fmt...);
void msc_logf_stderr(const char* fmt...);
inline bool msc_enabled(msc_logf_t logger) { return logger != msc_logf_dummy; }

/**
 * Enable the category logger with the given name ("compile", "decode",
 * "satisfy", "verify"). Returns false if there is no such category.
 */
bool msc_enable_category(const std::string& name);

/** Enable every category whose DEBUG_<NAME> environment variable is set. */
void msc_enable_categories_from_env();

#endif // included_msc_logging_h_
