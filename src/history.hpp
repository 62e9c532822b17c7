#pragma once

#include <istream>
#include <set>
#include <string>

namespace brewrecents {

// Package names looked up with `brew info <name>` or the `bi <name>` alias.
// The command must start the line or follow whitespace, ';', '&', '|'
// or '('. Flags before the name (e.g. --cask) are skipped.
std::set<std::string> parse_inspected_packages(std::istream& history);

// Missing or unreadable file gives an empty set
std::set<std::string> load_inspected_packages(const std::string& history_path);

// $HOME/.zsh_history, or empty when HOME is unset
std::string default_history_path();

} // namespace brewrecents
