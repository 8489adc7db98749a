#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace idsync::similarity {

/*
  Text cleanup shared by every similarity primitive.

  Input is UTF-8. Latin-1 and Latin Extended-A letters fold to ASCII;
  other non-ASCII code points are kept verbatim and count as word
  characters.
*/

// Replaces U+00A0 (no-break space) with a plain space and trims.
std::string CleanSpaces(std::string_view input);

// Folds Latin diacritics to ASCII ("Átlanta" -> "Atlanta") and trims.
std::string RemoveAccents(std::string_view input);

/*
  Full normalization: CleanSpaces, RemoveAccents, lower-case, every run of
  non-word characters (punctuation, underscore, whitespace) collapsed to a
  single space, trimmed.
*/
std::string NormalizeText(std::string_view input);

// Tokens of NormalizeText(input), split on spaces.
std::vector<std::string> Tokenize(std::string_view input);

// "Atlanta Beat WFC" -> "Atlanta Beat", "Sevilla Femenino" -> "Sevilla"
std::string RemoveWomensSuffixes(std::string_view input);

// "Atlanta Beat U-21" -> "Atlanta Beat", "Atlanta Beat Sub-21 WFC" -> "Atlanta Beat U21 WFC"
std::string RemoveYouthSuffixes(std::string_view input);

/*
  Team-name normalization: women's and youth suffixes, then common club
  suffixes ("FC", "SC", "CF", ...) and prefixes ("FC ", "Olympique de ",
  "1. ", ...), then NormalizeText. Falls back to NormalizeText(input) when
  the cleanup would leave nothing.
*/
std::string NormalizeTeamName(std::string_view input);

} // namespace idsync::similarity
