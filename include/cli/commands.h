#pragma once

#include "utils/cli.h"

namespace cqr::cli::commands {

/// Sends the question to a running router and prints the JSON answer.
/// Returns 0 on an answer, 1 when the router rejected or failed the
/// question, 2 when the router could not be reached.
int ask(const AskOptions& options);

/// Prints the built-in route table. Needs no running router.
int routes();

}  // namespace cqr::cli::commands
