#pragma once

#include <exception>

#include "internal/util/errors.hpp"

namespace upgrader::cli {

/*
  Converts exceptions escaping a command into process exit codes.

    0        success
    1        unexpected failure
    2        usage / configuration
    10..14   step source (layout, naming, file sequence, header, step sequence)
    20..21   ledger integrity (tamper, continuity)
    30..31   connection, schema
    40..41   step SQL, ledger write
*/

inline constexpr int kExitOk         = 0;
inline constexpr int kExitUnexpected = 1;
inline constexpr int kExitUsage      = 2;

int ExitCodeFor(util::ErrorKind kind);
int ExitCodeFor(const std::exception& e);

} // namespace upgrader::cli
