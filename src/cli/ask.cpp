// FILE: src/cli/ask.cpp
#include "cli/ask.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

std::string ask(const std::string& q, const std::string& def,
                std::istream& in, std::ostream& out) {
  out << q;
  if (!def.empty())
    out << " [" << def << "]";
  out << ": " << std::flush;
  std::string s;
  if (!std::getline(in, s))
    return def;
  if (s.empty())
    return def;
  return s;
}

std::string ask(const std::string& q, const std::string& def) {
  return ask(q, def, std::cin, std::cout);
}

std::size_t ask_choice(const std::string& title, const std::vector<std::string>& options,
                       std::size_t default_index, std::istream& in, std::ostream& out) {
  if (options.empty())
    return 0;
  if (default_index >= options.size())
    default_index = 0;
  out << title << "\n";
  for (std::size_t i = 0; i < options.size(); ++i)
    out << "  " << (i + 1) << ") " << options[i] << "\n";

  while (true) {
    std::string s = ask("Choose", std::to_string(default_index + 1), in, out);
    if (!in)
      return default_index;
    for (std::size_t i = 0; i < options.size(); ++i) {
      if (s == options[i])
        return i;
    }
    try {
      std::size_t pos = 0;
      long n = std::stol(s, &pos);
      if (pos == s.size() && n >= 1 && static_cast<std::size_t>(n) <= options.size())
        return static_cast<std::size_t>(n - 1);
    } catch (const std::exception&) {
      // fall through to the retry message
    }
    out << "Please enter a number between 1 and " << options.size() << ".\n";
  }
}
