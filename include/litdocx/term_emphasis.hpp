/// @file term_emphasis.hpp
/// @brief Heuristic emphasis of parameter and variable names in prose.
///
/// Algorithm prose names its variables ("Let m be ...", "Loader ( options )").
/// Before parsing, each section of the markdown source is scanned for such
/// names and every standalone mention of them in that section is wrapped in
/// emphasis markers so that variables render in italics.

#pragma once

#include <set>
#include <string>
#include <string_view>

namespace litdocx {

/// Collect the candidate terms of one section.
///
/// Terms are:
/// - every word inside the first parenthesized group of the heading line;
/// - the word after "called on an object " in the body;
/// - the word between "let " (any case) and " be" in the body.
auto collect_terms(std::string_view heading, std::string_view body) -> std::set<std::string>;

/// Emphasize every standalone mention of `terms` in `body`.
///
/// Mentions inside code spans or existing emphasis are left alone, as are
/// mentions glued to other word characters ("barred" for "bar"). The phrase
/// "the this value" gets a strong "this" regardless of the terms.
auto emphasize_section(std::string_view body, const std::set<std::string>& terms) -> std::string;

/// Run the term pass over a whole markdown source.
///
/// The source is split into sections at lines that start with '#'. Each
/// section's terms apply only to that section's body. Text before the first
/// heading is passed through unchanged.
auto emphasize_terms(std::string_view source) -> std::string;

}  // namespace litdocx
