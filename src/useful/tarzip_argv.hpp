/*********************************************************************************\
 * tarzip_argv.hpp: Interface for handling argv.
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

#include <string>
#include <stdexcept>
#include <utility>

#include <getopt.h>
#include <ctype.h>
#include <string.h>

namespace tarzip {

struct Argv {
    using GNUOption = struct option;
    static constexpr GNUOption long_options_done { nullptr, 0, nullptr, 0 };

    struct Option : public GNUOption {
        explicit constexpr Option(const char* longFlag, int shortFlag) :
            GNUOption { longFlag, no_argument, nullptr, shortFlag } {}
    };

    struct Parameter : public GNUOption {
        explicit constexpr Parameter(const char* longFlag, int shortFlag) :
            GNUOption { longFlag, required_argument, nullptr, shortFlag } {}
    };
};

template <class ArgvDef>
class IncomingArgv : public ArgvDef {
private:
    const int m_argc;
    char* const* m_argv;
    std::string m_flagSpec;
    int m_optind;

public:
    IncomingArgv(int argc, char* const* argv)
        : m_argc(argc)
        , m_argv(argv)
        , m_flagSpec{"+:"} // Follow POSIX behavior, do not reorder. Report missing values as ':'
        , m_optind{0}
    {
        for (const Argv::GNUOption* opt_ptr = ArgvDef::long_options;
            opt_ptr->val != 0; opt_ptr++) {
            if (::isalpha(opt_ptr->val)) {
                m_flagSpec.push_back((char)(opt_ptr->val));
                if (opt_ptr->has_arg != no_argument) {
                    m_flagSpec.push_back(':');
                }
            }
        }
    }

    // returns the next flag value and its argument, or -1 when finished.
    // unknown flags are returned as '?', flags missing their argument as ':'
    std::pair<int, std::string> get_next() {
        auto const old_optind = optind;
        auto const old_opterr = opterr;
        optind = m_optind;
        opterr = 0;
        int c = getopt_long(m_argc, m_argv, m_flagSpec.c_str(), ArgvDef::long_options, nullptr);
        m_optind = optind;
        optind = old_optind;
        opterr = old_opterr;
        if ((c < 0) || (optarg == nullptr)) {
            return std::make_pair(c, "");
        }
        return std::make_pair(c, optarg);
    }

    char* const* get_rest() {
        return m_argv + m_optind;
    }

    int get_rest_argc() {
        return m_argc - m_optind;
    }
};

} /* namespace tarzip */
