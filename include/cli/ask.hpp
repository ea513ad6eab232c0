// FILE: include/cli/ask.hpp
#pragma once
#include <iosfwd>
#include <string>
#include <vector>

// Prompt on `out`, read one line from `in`; empty input returns `def`.
std::string ask(const std::string& q, const std::string& def,
                std::istream& in, std::ostream& out);
std::string ask(const std::string& q, const std::string& def);

// Numbered choice among `options`. Accepts an index (1-based) or an exact
// option; empty input picks `default_index`. Re-prompts on invalid input and
// returns `default_index` when the input stream ends.
std::size_t ask_choice(const std::string& title, const std::vector<std::string>& options,
                       std::size_t default_index, std::istream& in, std::ostream& out);
